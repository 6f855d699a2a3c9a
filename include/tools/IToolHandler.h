#ifndef ITOOLHANDLER_H
#define ITOOLHANDLER_H

#include <QPointF>
#include <Qt>

#include "ToolId.h"

class QPainter;
class ToolContext;

/**
 * @brief Abstract interface for tool behavior handlers.
 *
 * Each tool implements this interface to define its specific
 * gesture behavior. The ToolManager dispatches events to the
 * appropriate handler based on the current tool, and only after
 * checking the one-gesture rule.
 */
class IToolHandler {
public:
    virtual ~IToolHandler() = default;

    /**
     * @brief Get the tool ID this handler is responsible for.
     */
    virtual ToolId toolId() const = 0;

    /**
     * @brief Called when this tool becomes active.
     */
    virtual void onActivate(ToolContext* ctx) { Q_UNUSED(ctx); }

    /**
     * @brief Called when the primary button is pressed.
     */
    virtual void onMousePress(ToolContext* ctx, const QPointF& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Called when the pointer moves with the button held.
     */
    virtual void onMouseMove(ToolContext* ctx, const QPointF& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Called when the primary button is released.
     */
    virtual void onMouseRelease(ToolContext* ctx, const QPointF& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Roll back the gesture this handler owns, if any.
     * @return true if a gesture was cancelled
     */
    virtual bool cancelGesture(ToolContext* ctx) {
        Q_UNUSED(ctx);
        return false;
    }

    /**
     * @brief Draw transient feedback for the gesture in flight.
     */
    virtual void drawPreview(QPainter& painter) const { Q_UNUSED(painter); }

    /**
     * @brief Cursor hint for a pointer hovering with no button held.
     */
    virtual Qt::CursorShape hoverCursor(ToolContext* ctx, const QPointF& pos) const {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
        return cursor();
    }

    /**
     * @brief Get the cursor for this tool.
     */
    virtual Qt::CursorShape cursor() const { return Qt::CrossCursor; }
};

#endif // ITOOLHANDLER_H

#ifndef SELECTIONTOOLHANDLER_H
#define SELECTIONTOOLHANDLER_H

#include "../IToolHandler.h"
#include "selection/AnnotationResizeEditor.h"

#include <QPointF>
#include <QRectF>

/**
 * @brief Tool handler for selection mode.
 *
 * This is the default tool. A press first looks for a resize handle of a
 * selected item, then for an annotation body (select and move), and
 * finally falls back to a rubber-band selection on empty space.
 */
class SelectionToolHandler : public IToolHandler {
public:
    SelectionToolHandler() = default;
    ~SelectionToolHandler() override = default;

    ToolId toolId() const override { return ToolId::Selection; }

    void onActivate(ToolContext* ctx) override;
    void onMousePress(ToolContext* ctx, const QPointF& pos) override;
    void onMouseMove(ToolContext* ctx, const QPointF& pos) override;
    void onMouseRelease(ToolContext* ctx, const QPointF& pos) override;
    bool cancelGesture(ToolContext* ctx) override;

    void drawPreview(QPainter& painter) const override;
    Qt::CursorShape hoverCursor(ToolContext* ctx, const QPointF& pos) const override;
    Qt::CursorShape cursor() const override { return Qt::ArrowCursor; }

    QRectF rubberBandRect() const { return m_rubberBand; }

private:
    void beginResize(ToolContext* ctx, const HandleHit& hit, const QPointF& pos);
    void beginMoveOrToggle(ToolContext* ctx, AnnotationItem* item, const QPointF& pos);
    void beginRubberBand(ToolContext* ctx, const QPointF& pos);
    void moveSelection(ToolContext* ctx, const QPointF& pos);

    AnnotationResizeEditor m_resizeEditor;

    // Moving
    QPointF m_lastPos;
    QPointF m_totalDelta;

    // RubberBand
    QRectF m_rubberBand;
    bool m_additiveBand = false;
};

#endif // SELECTIONTOOLHANDLER_H

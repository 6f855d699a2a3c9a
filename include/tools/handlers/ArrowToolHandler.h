#ifndef ARROWTOOLHANDLER_H
#define ARROWTOOLHANDLER_H

#include "../IToolHandler.h"
#include "annotations/ArrowAnnotation.h"

#include <QPointF>

/**
 * @brief Tool handler for straight line and arrow drawing.
 *
 * One class serves both tools; the tool id picks the line end style.
 */
class ArrowToolHandler : public IToolHandler {
public:
    explicit ArrowToolHandler(ToolId id = ToolId::Arrow) : m_toolId(id) {}
    ~ArrowToolHandler() override = default;

    ToolId toolId() const override { return m_toolId; }

    void onMousePress(ToolContext* ctx, const QPointF& pos) override;
    void onMouseMove(ToolContext* ctx, const QPointF& pos) override;
    void onMouseRelease(ToolContext* ctx, const QPointF& pos) override;
    bool cancelGesture(ToolContext* ctx) override;


private:
    LineEndStyle lineEndStyle() const;
    ArrowAnnotation* currentArrow(ToolContext* ctx) const;

    ToolId m_toolId;
};

#endif // ARROWTOOLHANDLER_H

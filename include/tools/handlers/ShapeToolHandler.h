#ifndef SHAPETOOLHANDLER_H
#define SHAPETOOLHANDLER_H

#include "../IToolHandler.h"
#include "../../annotations/ShapeAnnotation.h"

#include <QPointF>

/**
 * @brief Tool handler for shape drawing (rectangle/ellipse/triangle).
 *
 * Unified handler; the tool id given at construction selects the shape.
 */
class ShapeToolHandler : public IToolHandler {
public:
    explicit ShapeToolHandler(ToolId id = ToolId::Rectangle) : m_toolId(id) {}
    ~ShapeToolHandler() override = default;

    ToolId toolId() const override { return m_toolId; }

    void onMousePress(ToolContext* ctx, const QPointF& pos) override;
    void onMouseMove(ToolContext* ctx, const QPointF& pos) override;
    void onMouseRelease(ToolContext* ctx, const QPointF& pos) override;
    bool cancelGesture(ToolContext* ctx) override;


    ShapeType shapeType() const;

private:
    ShapeAnnotation* currentShape(ToolContext* ctx) const;
    void updateCurrentShape(ToolContext* ctx, const QPointF& endPos);

    ToolId m_toolId;
};

#endif // SHAPETOOLHANDLER_H

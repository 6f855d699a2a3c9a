#include "tools/handlers/ShapeToolHandler.h"
#include "tools/ToolContext.h"

#include <memory>

ShapeType ShapeToolHandler::shapeType() const {
    switch (m_toolId) {
    case ToolId::Ellipse:
        return ShapeType::Ellipse;
    case ToolId::Triangle:
        return ShapeType::Triangle;
    default:
        return ShapeType::Rectangle;
    }
}

ShapeAnnotation* ShapeToolHandler::currentShape(ToolContext* ctx) const {
    if (ctx->state.gesture != GestureState::Drawing || !ctx->layer()) {
        return nullptr;
    }
    return dynamic_cast<ShapeAnnotation*>(ctx->layer()->findItem(ctx->state.targetId));
}

void ShapeToolHandler::onMousePress(ToolContext* ctx, const QPointF& pos) {
    if (!ctx->layer() || !ctx->beginGesture(GestureState::Drawing, pos)) {
        return;
    }

    QRectF rect(pos, pos);
    AnnotationItem* item = ctx->layer()->addItem(std::make_unique<ShapeAnnotation>(
        rect, shapeType(), ctx->scene->defaultStyle()
    ));
    ctx->state.targetId = item->id();

    ctx->repaint();
}

void ShapeToolHandler::onMouseMove(ToolContext* ctx, const QPointF& pos) {
    if (!currentShape(ctx)) {
        return;
    }

    updateCurrentShape(ctx, pos);
    ctx->repaint();
}

void ShapeToolHandler::onMouseRelease(ToolContext* ctx, const QPointF& pos) {
    if (!currentShape(ctx)) {
        return;
    }

    // Any size is kept, including a click without drag
    updateCurrentShape(ctx, pos);
    ctx->markDirty();
    ctx->endGesture();
    ctx->repaint();
}

bool ShapeToolHandler::cancelGesture(ToolContext* ctx) {
    if (ctx->state.gesture != GestureState::Drawing) {
        return false;
    }

    if (ctx->layer()) {
        ctx->layer()->takeItem(ctx->state.targetId);
    }
    ctx->endGesture();
    ctx->repaint();
    return true;
}

void ShapeToolHandler::updateCurrentShape(ToolContext* ctx, const QPointF& endPos) {
    ShapeAnnotation* shape = currentShape(ctx);
    if (!shape) {
        return;
    }

    shape->setRect(ShapeAnnotation::normalizedRect(ctx->state.startPoint, endPos));
    ctx->layer()->notifyChanged();
}

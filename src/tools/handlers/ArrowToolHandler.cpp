#include "tools/handlers/ArrowToolHandler.h"
#include "tools/ToolContext.h"

#include <memory>

LineEndStyle ArrowToolHandler::lineEndStyle() const {
    return m_toolId == ToolId::Line ? LineEndStyle::None : LineEndStyle::OpenArrow;
}

ArrowAnnotation* ArrowToolHandler::currentArrow(ToolContext* ctx) const {
    if (ctx->state.gesture != GestureState::Drawing || !ctx->layer()) {
        return nullptr;
    }
    return dynamic_cast<ArrowAnnotation*>(ctx->layer()->findItem(ctx->state.targetId));
}

void ArrowToolHandler::onMousePress(ToolContext* ctx, const QPointF& pos) {
    if (!ctx->layer() || !ctx->beginGesture(GestureState::Drawing, pos)) {
        return;
    }

    // Degenerate at first; the layer paints it as the live preview
    AnnotationItem* item = ctx->layer()->addItem(std::make_unique<ArrowAnnotation>(
        pos, pos, ctx->scene->defaultStyle(), lineEndStyle()
    ));
    ctx->state.targetId = item->id();

    ctx->repaint();
}

void ArrowToolHandler::onMouseMove(ToolContext* ctx, const QPointF& pos) {
    ArrowAnnotation* arrow = currentArrow(ctx);
    if (!arrow) {
        return;
    }

    arrow->setEndpoints(ctx->state.startPoint, pos);
    ctx->layer()->notifyChanged();
    ctx->repaint();
}

void ArrowToolHandler::onMouseRelease(ToolContext* ctx, const QPointF& pos) {
    ArrowAnnotation* arrow = currentArrow(ctx);
    if (!arrow) {
        return;
    }

    arrow->setEndpoints(ctx->state.startPoint, pos);
    ctx->markDirty();
    ctx->endGesture();
    ctx->layer()->notifyChanged();
    ctx->repaint();
}

bool ArrowToolHandler::cancelGesture(ToolContext* ctx) {
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

#include "tools/handlers/PencilToolHandler.h"
#include "tools/ToolContext.h"

#include <memory>

PencilStroke* PencilToolHandler::currentStroke(ToolContext* ctx) const {
    if (ctx->state.gesture != GestureState::Drawing || !ctx->layer()) {
        return nullptr;
    }
    return dynamic_cast<PencilStroke*>(ctx->layer()->findItem(ctx->state.targetId));
}

void PencilToolHandler::onMousePress(ToolContext* ctx, const QPointF& pos) {
    if (!ctx->layer() || !ctx->beginGesture(GestureState::Drawing, pos)) {
        return;
    }

    QVector<QPointF> points;
    points.append(pos);

    AnnotationItem* item = ctx->layer()->addItem(std::make_unique<PencilStroke>(
        points, ctx->scene->defaultStyle()
    ));
    ctx->state.targetId = item->id();

    ctx->repaint();
}

void PencilToolHandler::onMouseMove(ToolContext* ctx, const QPointF& pos) {
    PencilStroke* stroke = currentStroke(ctx);
    if (!stroke) {
        return;
    }

    stroke->addPoint(pos);
    ctx->layer()->notifyChanged();
    ctx->repaint();
}

void PencilToolHandler::onMouseRelease(ToolContext* ctx, const QPointF& pos) {
    PencilStroke* stroke = currentStroke(ctx);
    if (!stroke) {
        return;
    }

    // Add final point if different from last
    const QVector<QPointF>& points = stroke->points();
    if (points.isEmpty() || points.last() != pos) {
        stroke->addPoint(pos);
    }

    ctx->markDirty();
    ctx->endGesture();
    ctx->layer()->notifyChanged();
    ctx->repaint();
}

bool PencilToolHandler::cancelGesture(ToolContext* ctx) {
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

#include "tools/handlers/SelectionToolHandler.h"
#include "tools/ToolContext.h"
#include "annotations/HitRegion.h"
#include "selection/SelectionHandles.h"

#include <QPainter>

void SelectionToolHandler::onActivate(ToolContext* ctx) {
    m_resizeEditor.setAnnotationLayer(ctx->layer());
}

void SelectionToolHandler::onMousePress(ToolContext* ctx, const QPointF& pos) {
    AnnotationLayer* layer = ctx->layer();
    if (!layer || !ctx->state.isIdle()) {
        return;
    }

    // Handles take priority over bodies
    const HandleHit handleHit = SelectionHandles::hitTest(*layer, pos);
    if (handleHit.isValid()) {
        beginResize(ctx, handleHit, pos);
        return;
    }

    const int index = layer->hitTest(pos);
    if (index >= 0) {
        beginMoveOrToggle(ctx, layer->itemAt(index), pos);
        return;
    }

    beginRubberBand(ctx, pos);
}

void SelectionToolHandler::beginResize(ToolContext* ctx, const HandleHit& hit, const QPointF& pos) {
    m_resizeEditor.setAnnotationLayer(ctx->layer());
    if (!ctx->beginGesture(GestureState::Resizing, pos)) {
        return;
    }
    ctx->state.targetId = hit.item->id();

    if (!m_resizeEditor.startResize(hit.item->id(), hit.handle, pos)) {
        ctx->endGesture();
        return;
    }
    ctx->repaint();
}

void SelectionToolHandler::beginMoveOrToggle(ToolContext* ctx, AnnotationItem* item,
                                             const QPointF& pos) {
    AnnotationLayer* layer = ctx->layer();

    if (ctx->shiftPressed) {
        layer->setItemSelected(item, !item->isSelected());
    } else if (!item->isSelected()) {
        layer->selectOnly(item);
    }

    // Toggling an item off leaves nothing to drag
    if (item->isSelected() && ctx->beginGesture(GestureState::Moving, pos)) {
        ctx->state.targetId = item->id();
        m_lastPos = pos;
        m_totalDelta = QPointF();
    }
    ctx->repaint();
}

void SelectionToolHandler::beginRubberBand(ToolContext* ctx, const QPointF& pos) {
    m_additiveBand = ctx->shiftPressed;
    if (!m_additiveBand) {
        ctx->layer()->clearSelection();
    }

    if (ctx->beginGesture(GestureState::RubberBand, pos)) {
        m_rubberBand = QRectF(pos, pos);
    }
    ctx->repaint();
}

void SelectionToolHandler::onMouseMove(ToolContext* ctx, const QPointF& pos) {
    switch (ctx->state.gesture) {
    case GestureState::Resizing:
        if (m_resizeEditor.isResizing()) {
            m_resizeEditor.updateResize(pos);
            ctx->markDirty();
            ctx->layer()->notifyChanged();
            ctx->repaint();
        }
        break;
    case GestureState::Moving:
        moveSelection(ctx, pos);
        break;
    case GestureState::RubberBand:
        m_rubberBand = QRectF(ctx->state.startPoint, pos).normalized();
        ctx->repaint();
        break;
    default:
        break;
    }
}

void SelectionToolHandler::moveSelection(ToolContext* ctx, const QPointF& pos) {
    const QPointF delta = pos - m_lastPos;
    m_lastPos = pos;
    if (delta.isNull()) {
        return;
    }

    for (AnnotationItem* item : ctx->layer()->selectedItems()) {
        item->translate(delta);
    }
    m_totalDelta += delta;

    ctx->markDirty();
    ctx->layer()->notifyChanged();
    ctx->repaint();
}

void SelectionToolHandler::onMouseRelease(ToolContext* ctx, const QPointF& pos) {
    switch (ctx->state.gesture) {
    case GestureState::Resizing:
        // The state reached by the last move is committed as is
        m_resizeEditor.finishResize();
        break;
    case GestureState::Moving:
        moveSelection(ctx, pos);
        break;
    case GestureState::RubberBand:
        m_rubberBand = QRectF(ctx->state.startPoint, pos).normalized();
        ctx->layer()->selectIntersecting(m_rubberBand, m_additiveBand);
        m_rubberBand = QRectF();
        break;
    default:
        return;
    }

    ctx->endGesture();
    ctx->repaint();
}

bool SelectionToolHandler::cancelGesture(ToolContext* ctx) {
    switch (ctx->state.gesture) {
    case GestureState::Resizing:
        m_resizeEditor.cancelResize();
        ctx->layer()->notifyChanged();
        break;
    case GestureState::Moving:
        if (!m_totalDelta.isNull()) {
            for (AnnotationItem* item : ctx->layer()->selectedItems()) {
                item->translate(-m_totalDelta);
            }
            m_totalDelta = QPointF();
            ctx->layer()->notifyChanged();
        }
        break;
    case GestureState::RubberBand:
        m_rubberBand = QRectF();
        break;
    default:
        return false;
    }

    ctx->endGesture();
    ctx->repaint();
    return true;
}

void SelectionToolHandler::drawPreview(QPainter& painter) const {
    if (m_rubberBand.isNull()) {
        return;
    }

    painter.save();
    QPen pen(QColor(0, 120, 215), 1, Qt::DashLine);
    pen.setCosmetic(true);
    painter.setPen(pen);
    painter.setBrush(QColor(0, 120, 215, 40));
    painter.drawRect(m_rubberBand);
    painter.restore();
}

Qt::CursorShape SelectionToolHandler::hoverCursor(ToolContext* ctx, const QPointF& pos) const {
    AnnotationLayer* layer = ctx->layer();
    if (!layer) {
        return cursor();
    }

    const HandleHit handleHit = SelectionHandles::hitTest(*layer, pos);
    if (handleHit.isValid()) {
        return SelectionHandles::cursorForHandle(handleHit.handle.id);
    }

    const int index = layer->hitTest(pos);
    if (index >= 0) {
        return layer->itemAt(index)->isSelected() ? Qt::SizeAllCursor : Qt::PointingHandCursor;
    }
    return cursor();
}

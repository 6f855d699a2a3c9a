#include "selection/AnnotationResizeEditor.h"

#include "annotations/AnnotationLayer.h"
#include "annotations/ArrowAnnotation.h"
#include "annotations/PencilStroke.h"
#include "annotations/ShapeAnnotation.h"
#include "annotations/TextAnnotation.h"

#include <QDebug>
#include <QtMath>

namespace {
// Restore the geometry of live from a same-kind snapshot, keeping identity
// and style untouched.
void restoreGeometry(AnnotationItem* live, const AnnotationItem& snapshot)
{
    if (auto* segment = dynamic_cast<ArrowAnnotation*>(live)) {
        const auto& original = static_cast<const ArrowAnnotation&>(snapshot);
        segment->setEndpoints(original.p1(), original.p2());
    } else if (auto* shape = dynamic_cast<ShapeAnnotation*>(live)) {
        shape->setRect(static_cast<const ShapeAnnotation&>(snapshot).rect());
    } else if (auto* stroke = dynamic_cast<PencilStroke*>(live)) {
        stroke->setPoints(static_cast<const PencilStroke&>(snapshot).points());
    } else if (auto* text = dynamic_cast<TextAnnotation*>(live)) {
        const auto& original = static_cast<const TextAnnotation&>(snapshot);
        text->setPosition(original.position());
        text->setScale(original.scale());
    }
}
} // namespace

void AnnotationResizeEditor::setAnnotationLayer(AnnotationLayer* layer)
{
    m_annotationLayer = layer;
}

AnnotationItem* AnnotationResizeEditor::targetItem() const
{
    if (!m_annotationLayer) {
        return nullptr;
    }
    return m_annotationLayer->findItem(m_itemId);
}

bool AnnotationResizeEditor::startResize(quint64 itemId, const SelectionHandle& handle,
                                         const QPointF& pos)
{
    m_itemId = itemId;
    AnnotationItem* item = targetItem();
    if (!item || handle.mode == ResizeMode::None) {
        qWarning() << "AnnotationResizeEditor: No resizable item for id" << itemId;
        reset();
        return false;
    }

    m_isResizing = true;
    m_handle = handle;
    m_original = item->clone();
    m_initialRect = item->boundingBox();
    m_anchor = m_initialRect.topLeft();
    m_grabOffset = pos - handle.position;

    switch (handle.mode) {
    case ResizeMode::AffineScale:
        if (auto* stroke = dynamic_cast<PencilStroke*>(item)) {
            m_initialPoints = stroke->points();
        }
        break;
    case ResizeMode::UniformScale:
        if (auto* text = dynamic_cast<TextAnnotation*>(item)) {
            m_anchor = text->position();
            m_initialScale = text->scale();
            m_initialGrabDelta = pos - m_anchor;
        }
        break;
    default:
        break;
    }

    return true;
}

void AnnotationResizeEditor::updateResize(const QPointF& pos)
{
    AnnotationItem* item = targetItem();
    if (!item || !m_isResizing) {
        return;
    }

    // Follow the grabbed handle, not the raw pointer
    const QPointF target = pos - m_grabOffset;

    switch (m_handle.mode) {
    case ResizeMode::CornerResize: {
        if (auto* shape = dynamic_cast<ShapeAnnotation*>(item)) {
            shape->setRect(ShapeAnnotation::normalizedRect(m_anchor, target));
        }
        break;
    }
    case ResizeMode::AffineScale: {
        auto* stroke = dynamic_cast<PencilStroke*>(item);
        if (!stroke) {
            break;
        }
        // Floor each extent at one unit so a flat stroke never divides by zero
        const qreal initialWidth = qMax(kMinAffineExtent, m_initialRect.width());
        const qreal initialHeight = qMax(kMinAffineExtent, m_initialRect.height());
        const qreal newWidth = qMax(kMinAffineExtent, target.x() - m_anchor.x());
        const qreal newHeight = qMax(kMinAffineExtent, target.y() - m_anchor.y());

        stroke->setPoints(m_initialPoints);
        stroke->scaleAbout(m_anchor, newWidth / initialWidth, newHeight / initialHeight);
        break;
    }
    case ResizeMode::EndpointMove: {
        if (auto* segment = dynamic_cast<ArrowAnnotation*>(item)) {
            if (m_handle.id == HandleId::P1) {
                segment->setP1(target);
            } else {
                segment->setP2(target);
            }
        }
        break;
    }
    case ResizeMode::UniformScale: {
        auto* text = dynamic_cast<TextAnnotation*>(item);
        if (!text) {
            break;
        }
        const QPointF delta = pos - m_anchor;
        const qreal initialDx = qMax(kMinTextGrabDistance, m_initialGrabDelta.x());
        const qreal initialDy = qMax(kMinTextGrabDistance, m_initialGrabDelta.y());
        const qreal factor = qMax(delta.x() / initialDx, delta.y() / initialDy);
        text->setScale(qMax(TextAnnotation::kMinScale, m_initialScale * factor));
        break;
    }
    case ResizeMode::None:
        break;
    }
}

void AnnotationResizeEditor::finishResize()
{
    reset();
}

bool AnnotationResizeEditor::cancelResize()
{
    if (!m_isResizing) {
        return false;
    }

    AnnotationItem* item = targetItem();
    if (item && m_original) {
        restoreGeometry(item, *m_original);
    }
    reset();
    return true;
}

void AnnotationResizeEditor::reset()
{
    m_isResizing = false;
    m_itemId = 0;
    m_handle = SelectionHandle();
    m_initialPoints.clear();
    m_initialScale = 1.0;
    m_initialGrabDelta = QPointF();
    m_grabOffset = QPointF();
    m_original.reset();
}

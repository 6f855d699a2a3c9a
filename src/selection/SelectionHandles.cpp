#include "selection/SelectionHandles.h"

#include "annotations/AnnotationItem.h"
#include "annotations/AnnotationLayer.h"
#include "annotations/ArrowAnnotation.h"

#include <QPen>

QVector<SelectionHandle> SelectionHandles::handlesFor(const AnnotationItem &item)
{
    QVector<SelectionHandle> handles;
    const QRectF box = item.boundingBox();

    switch (item.kind()) {
    case AnnotationKind::Line:
    case AnnotationKind::Arrow: {
        const auto &segment = static_cast<const ArrowAnnotation &>(item);
        handles.append({segment.p1(), HandleId::P1, ResizeMode::EndpointMove});
        handles.append({segment.p2(), HandleId::P2, ResizeMode::EndpointMove});
        break;
    }
    case AnnotationKind::Rectangle:
    case AnnotationKind::Ellipse:
    case AnnotationKind::Triangle:
        handles.append({box.bottomRight(), HandleId::BottomRight, ResizeMode::CornerResize});
        break;
    case AnnotationKind::FreehandPath:
        handles.append({box.bottomRight(), HandleId::BottomRight, ResizeMode::AffineScale});
        break;
    case AnnotationKind::Text:
        handles.append({box.bottomRight(), HandleId::BottomRight, ResizeMode::UniformScale});
        break;
    }

    return handles;
}

HandleHit SelectionHandles::hitTest(AnnotationLayer &layer, const QPointF &point)
{
    HandleHit best;
    qreal bestDistance = kHandleGrabRadius;

    // Topmost selected item wins ties
    const std::vector<AnnotationItem *> selected = layer.selectedItems();
    for (auto it = selected.rbegin(); it != selected.rend(); ++it) {
        for (const SelectionHandle &handle : handlesFor(**it)) {
            const qreal distance = (point - handle.position).manhattanLength();
            if (distance <= bestDistance && (!best.isValid() || distance < bestDistance)) {
                best.item = *it;
                best.handle = handle;
                bestDistance = distance;
            }
        }
    }

    return best;
}

Qt::CursorShape SelectionHandles::cursorForHandle(HandleId handle)
{
    switch (handle) {
    case HandleId::P1:
    case HandleId::P2:
        return Qt::CrossCursor;
    case HandleId::BottomRight:
        return Qt::SizeFDiagCursor;
    case HandleId::None:
        break;
    }
    return Qt::ArrowCursor;
}

void SelectionHandles::draw(QPainter &painter, const AnnotationLayer &layer)
{
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, false);

    for (const AnnotationItem *item : layer.selectedItems()) {
        drawDashedBorder(painter, item->boundingBox());
        for (const SelectionHandle &handle : handlesFor(*item)) {
            drawHandle(painter, handle.position);
        }
    }

    painter.restore();
}

void SelectionHandles::drawDashedBorder(QPainter &painter, const QRectF &rect)
{
    QPen pen(QColor(0, 120, 215), 1, Qt::DashLine);
    pen.setCosmetic(true);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(rect);
}

void SelectionHandles::drawHandle(QPainter &painter, const QPointF &center)
{
    const qreal half = kHandleDrawSize / 2.0;
    QRectF handleRect(center.x() - half, center.y() - half, kHandleDrawSize, kHandleDrawSize);

    QPen pen(QColor(0, 120, 215), 1);
    pen.setCosmetic(true);
    painter.setPen(pen);
    painter.setBrush(Qt::white);
    painter.drawRect(handleRect);
}

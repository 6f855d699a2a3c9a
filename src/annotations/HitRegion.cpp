#include "annotations/HitRegion.h"
#include "annotations/AnnotationItem.h"
#include <QPainterPathStroker>
#include <QtMath>

QPainterPath HitRegion::widen(const QPainterPath& outline, qreal strokeWidth)
{
    const qreal width = qMax(strokeWidth, kHitRegionFloor);

    // isEmpty() is also true for a lone moveTo, which still marks a point
    if (outline.elementCount() == 0) {
        return QPainterPath();
    }

    // A zero-extent outline (press without drag) strokes to nothing;
    // fall back to a disc around the point.
    const QRectF bounds = outline.boundingRect();
    if (qFuzzyIsNull(bounds.width()) && qFuzzyIsNull(bounds.height())) {
        QPainterPath disc;
        disc.addEllipse(bounds.topLeft(), width / 2.0, width / 2.0);
        return disc;
    }

    QPainterPathStroker stroker;
    stroker.setWidth(width);
    stroker.setCapStyle(Qt::RoundCap);
    stroker.setJoinStyle(Qt::RoundJoin);

    return stroker.createStroke(outline);
}

QPainterPath HitRegion::regionFor(const AnnotationItem& item)
{
    if (item.kind() == AnnotationKind::Text) {
        // Text is grabbed anywhere inside its box, plus the usual margin
        const QPainterPath box = item.outlinePath();
        return box.united(widen(box, item.style().width()));
    }
    return widen(item.outlinePath(), item.style().width());
}

bool HitRegion::containsPoint(const AnnotationItem& item, const QPointF& point)
{
    return regionFor(item).contains(point);
}

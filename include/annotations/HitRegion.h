#ifndef HITREGION_H
#define HITREGION_H

#include <QPainterPath>
#include <QPointF>

class AnnotationItem;

/**
 * HitRegion - Generous pointer hit-testing for annotations
 *
 * Every annotation kind hands its centerline/outline to widen(), which
 * strokes it into a filled region at least kHitRegionFloor units wide, so
 * thin strokes stay easy to grab.
 */
class HitRegion {
public:
    HitRegion() = delete;

    static constexpr qreal kHitRegionFloor = 30.0;

    // Stroke the outline into a filled region of width max(strokeWidth, floor).
    static QPainterPath widen(const QPainterPath& outline, qreal strokeWidth);

    static QPainterPath regionFor(const AnnotationItem& item);
    static bool containsPoint(const AnnotationItem& item, const QPointF& point);
};

#endif // HITREGION_H

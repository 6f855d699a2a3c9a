#ifndef PENCILSTROKE_H
#define PENCILSTROKE_H

#include "AnnotationItem.h"
#include <QVector>
#include <QPointF>

/**
 * @brief Freehand pencil stroke annotation
 */
class PencilStroke : public AnnotationItem
{
public:
    PencilStroke(const QVector<QPointF> &points, const StrokeStyle &style);

    AnnotationKind kind() const override { return AnnotationKind::FreehandPath; }
    void draw(QPainter &painter) const override;
    QRectF boundingBox() const override;
    QPainterPath outlinePath() const override;
    std::unique_ptr<AnnotationItem> clone() const override;
    void translate(const QPointF &delta) override;
    std::unique_ptr<AnnotationItem> cloneWithAnchor(const QPointF &anchor) const override;

    void addPoint(const QPointF &point);
    void setPoints(const QVector<QPointF> &points);
    const QVector<QPointF> &points() const { return m_points; }
    int pointCount() const { return m_points.size(); }

    // Scale the stroke about origin; each axis independently.
    void scaleAbout(const QPointF &origin, qreal sx, qreal sy);

private:
    QVector<QPointF> m_points;

    // Performance optimization: cached bounding box
    mutable QRectF m_boundingBoxCache;
    mutable bool m_boundingBoxDirty = true;
};

#endif // PENCILSTROKE_H

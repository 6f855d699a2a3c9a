#ifndef SHAPEANNOTATION_H
#define SHAPEANNOTATION_H

#include "AnnotationItem.h"
#include <QPolygonF>
#include <QRectF>

// Shape types for ShapeAnnotation
enum class ShapeType {
    Rectangle = 0,
    Ellipse = 1,
    Triangle = 2
};

/**
 * @brief Shape annotation (rectangle, ellipse or triangle)
 *
 * All three shapes are driven by one axis-aligned rect. The rect is always
 * stored normalized, so width and height are never negative. Triangle
 * vertices are derived from the rect on demand and never stored.
 */
class ShapeAnnotation : public AnnotationItem
{
public:
    ShapeAnnotation(const QRectF &rect, ShapeType type, const StrokeStyle &style);

    AnnotationKind kind() const override;
    void draw(QPainter &painter) const override;
    QRectF boundingBox() const override;
    QPainterPath outlinePath() const override;
    std::unique_ptr<AnnotationItem> clone() const override;
    void translate(const QPointF &delta) override;
    std::unique_ptr<AnnotationItem> cloneWithAnchor(const QPointF &anchor) const override;

    void setRect(const QRectF &rect);
    QRectF rect() const { return m_rect; }
    ShapeType shapeType() const { return m_type; }

    // Apex at top-center, base along the bottom edge.
    QPolygonF triangleVertices() const { return triangleVertices(m_rect); }
    static QPolygonF triangleVertices(const QRectF &rect);

    // Rect spanned by two drag points, independent of drag direction.
    static QRectF normalizedRect(const QPointF &a, const QPointF &b);

private:
    QRectF m_rect;
    ShapeType m_type;
};

#endif // SHAPEANNOTATION_H

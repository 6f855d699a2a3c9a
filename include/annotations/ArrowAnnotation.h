#ifndef ARROWANNOTATION_H
#define ARROWANNOTATION_H

#include "AnnotationItem.h"
#include <QPointF>

// Line end style for arrow annotations
enum class LineEndStyle {
    None = 0,   // Plain line (no arrowhead)
    OpenArrow   // Open V at p2 (wing1 -> p2 -> wing2)
};

/**
 * @brief Straight segment annotation, with or without an arrowhead.
 *
 * LineEndStyle::None reports AnnotationKind::Line, OpenArrow reports
 * AnnotationKind::Arrow. Both share the same two-endpoint geometry.
 */
class ArrowAnnotation : public AnnotationItem
{
public:
    static constexpr qreal kMinArrowSize = 10.0;
    static constexpr qreal kArrowSizePerWidth = 3.5;

    ArrowAnnotation(const QPointF &p1, const QPointF &p2, const StrokeStyle &style,
                    LineEndStyle endStyle = LineEndStyle::OpenArrow);

    AnnotationKind kind() const override;
    void draw(QPainter &painter) const override;
    QRectF boundingBox() const override;
    QPainterPath outlinePath() const override;
    std::unique_ptr<AnnotationItem> clone() const override;
    void translate(const QPointF &delta) override;
    std::unique_ptr<AnnotationItem> cloneWithAnchor(const QPointF &anchor) const override;

    QPointF p1() const { return m_p1; }
    QPointF p2() const { return m_p2; }
    void setP1(const QPointF &p1) { m_p1 = p1; }
    void setP2(const QPointF &p2) { m_p2 = p2; }
    void setEndpoints(const QPointF &p1, const QPointF &p2);

    LineEndStyle lineEndStyle() const { return m_lineEndStyle; }

    qreal arrowSize() const;

    /**
     * @brief Compute the two wing points of the arrowhead.
     * @return false when the shaft has zero length (no arrowhead is drawn)
     */
    bool arrowheadPoints(QPointF &wing1, QPointF &wing2) const;

private:
    QPointF m_p1;
    QPointF m_p2;
    LineEndStyle m_lineEndStyle;
};

#endif // ARROWANNOTATION_H

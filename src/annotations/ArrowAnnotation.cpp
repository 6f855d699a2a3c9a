#include "annotations/ArrowAnnotation.h"
#include <QPainter>
#include <QPainterPath>
#include <QPolygonF>
#include <QtMath>

ArrowAnnotation::ArrowAnnotation(const QPointF &p1, const QPointF &p2, const StrokeStyle &style,
                                 LineEndStyle endStyle)
    : AnnotationItem(style)
    , m_p1(p1)
    , m_p2(p2)
    , m_lineEndStyle(endStyle)
{
}

AnnotationKind ArrowAnnotation::kind() const
{
    return m_lineEndStyle == LineEndStyle::None ? AnnotationKind::Line : AnnotationKind::Arrow;
}

void ArrowAnnotation::setEndpoints(const QPointF &p1, const QPointF &p2)
{
    m_p1 = p1;
    m_p2 = p2;
}

qreal ArrowAnnotation::arrowSize() const
{
    return qMax(kMinArrowSize, m_style.width() * kArrowSizePerWidth);
}

bool ArrowAnnotation::arrowheadPoints(QPointF &wing1, QPointF &wing2) const
{
    const qreal dx = m_p2.x() - m_p1.x();
    const qreal dy = m_p2.y() - m_p1.y();
    if (qFuzzyIsNull(dx) && qFuzzyIsNull(dy)) {
        return false;
    }

    // Screen y grows downwards, hence -dy
    const qreal angle = qAtan2(-dy, dx);
    const qreal size = arrowSize();
    const qreal wingAngle = M_PI / 3.0;  // 60 degrees

    wing1 = m_p2 - QPointF(qSin(angle + wingAngle) * size,
                           qCos(angle + wingAngle) * size);
    wing2 = m_p2 - QPointF(qSin(angle + M_PI - wingAngle) * size,
                           qCos(angle + M_PI - wingAngle) * size);
    return true;
}

void ArrowAnnotation::draw(QPainter &painter) const
{
    painter.save();

    QPen pen(m_style.color(), m_style.width(), Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.setRenderHint(QPainter::Antialiasing, true);

    painter.drawLine(m_p1, m_p2);

    if (m_lineEndStyle == LineEndStyle::OpenArrow) {
        QPointF wing1;
        QPointF wing2;
        if (arrowheadPoints(wing1, wing2)) {
            QPolygonF head;
            head << wing1 << m_p2 << wing2;
            painter.drawPolyline(head);
        }
    }

    painter.restore();
}

QRectF ArrowAnnotation::boundingBox() const
{
    return QRectF(m_p1, m_p2).normalized();
}

QPainterPath ArrowAnnotation::outlinePath() const
{
    QPainterPath path;
    path.moveTo(m_p1);
    path.lineTo(m_p2);
    return path;
}

std::unique_ptr<AnnotationItem> ArrowAnnotation::clone() const
{
    return std::make_unique<ArrowAnnotation>(m_p1, m_p2, m_style, m_lineEndStyle);
}

void ArrowAnnotation::translate(const QPointF &delta)
{
    m_p1 += delta;
    m_p2 += delta;
}

std::unique_ptr<AnnotationItem> ArrowAnnotation::cloneWithAnchor(const QPointF &anchor) const
{
    const QPointF span = m_p2 - m_p1;
    return std::make_unique<ArrowAnnotation>(anchor, anchor + span, m_style, m_lineEndStyle);
}

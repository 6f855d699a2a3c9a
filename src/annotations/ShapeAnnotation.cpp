#include "annotations/ShapeAnnotation.h"
#include <QPainter>
#include <QtMath>

ShapeAnnotation::ShapeAnnotation(const QRectF &rect, ShapeType type, const StrokeStyle &style)
    : AnnotationItem(style)
    , m_rect(rect.normalized())
    , m_type(type)
{
}

AnnotationKind ShapeAnnotation::kind() const
{
    switch (m_type) {
    case ShapeType::Rectangle:
        return AnnotationKind::Rectangle;
    case ShapeType::Ellipse:
        return AnnotationKind::Ellipse;
    case ShapeType::Triangle:
        return AnnotationKind::Triangle;
    }
    return AnnotationKind::Rectangle;
}

QRectF ShapeAnnotation::normalizedRect(const QPointF &a, const QPointF &b)
{
    return QRectF(
        qMin(a.x(), b.x()),
        qMin(a.y(), b.y()),
        qAbs(b.x() - a.x()),
        qAbs(b.y() - a.y())
    );
}

QPolygonF ShapeAnnotation::triangleVertices(const QRectF &rect)
{
    const qreal left = rect.left();
    const qreal right = rect.left() + rect.width();
    const qreal top = rect.top();
    const qreal bottom = rect.top() + rect.height();

    QPolygonF vertices;
    vertices << QPointF((left + right) / 2.0, top)
             << QPointF(left, bottom)
             << QPointF(right, bottom);
    return vertices;
}

void ShapeAnnotation::draw(QPainter &painter) const
{
    painter.save();

    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setBrush(Qt::NoBrush);

    switch (m_type) {
    case ShapeType::Rectangle: {
        QPen pen(m_style.color(), m_style.width(), Qt::SolidLine, Qt::SquareCap, Qt::MiterJoin);
        painter.setPen(pen);
        painter.drawRect(m_rect);
        break;
    }
    case ShapeType::Ellipse: {
        QPen pen(m_style.color(), m_style.width(), Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
        painter.setPen(pen);
        painter.drawEllipse(m_rect);
        break;
    }
    case ShapeType::Triangle: {
        QPen pen(m_style.color(), m_style.width(), Qt::SolidLine, Qt::RoundCap, Qt::MiterJoin);
        painter.setPen(pen);
        painter.drawPolygon(triangleVertices());
        break;
    }
    }

    painter.restore();
}

QRectF ShapeAnnotation::boundingBox() const
{
    return m_rect;
}

QPainterPath ShapeAnnotation::outlinePath() const
{
    QPainterPath path;
    // addRect/addEllipse add nothing for a null rect
    if (m_rect.isNull()) {
        path.moveTo(m_rect.topLeft());
        path.lineTo(m_rect.topLeft());
        return path;
    }

    switch (m_type) {
    case ShapeType::Rectangle:
        path.addRect(m_rect);
        break;
    case ShapeType::Ellipse:
        path.addEllipse(m_rect);
        break;
    case ShapeType::Triangle:
        path.addPolygon(triangleVertices());
        path.closeSubpath();
        break;
    }
    return path;
}

std::unique_ptr<AnnotationItem> ShapeAnnotation::clone() const
{
    return std::make_unique<ShapeAnnotation>(m_rect, m_type, m_style);
}

void ShapeAnnotation::translate(const QPointF &delta)
{
    m_rect.translate(delta);
}

std::unique_ptr<AnnotationItem> ShapeAnnotation::cloneWithAnchor(const QPointF &anchor) const
{
    // Origin lands on the anchor for all three shapes; for the triangle this
    // is also the top-left of its bounding box.
    return std::make_unique<ShapeAnnotation>(QRectF(anchor, m_rect.size()), m_type, m_style);
}

void ShapeAnnotation::setRect(const QRectF &rect)
{
    m_rect = rect.normalized();
}

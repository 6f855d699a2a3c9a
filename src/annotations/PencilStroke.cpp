#include "annotations/PencilStroke.h"
#include <QPainter>
#include <QPainterPath>
#include <QtMath>

// ============================================================================
// Helper: Build smooth path using quadratic Bezier with midpoints
// Midpoints are used as curve endpoints and the sampled points as control
// points, which gives smooth curves without overshoot.
// ============================================================================

static QPainterPath buildSmoothPath(const QVector<QPointF> &points)
{
    QPainterPath path;

    if (points.size() < 2) {
        return path;
    }

    if (points.size() == 2) {
        path.moveTo(points[0]);
        path.lineTo(points[1]);
        return path;
    }

    path.moveTo(points[0]);

    QPointF mid0 = (points[0] + points[1]) / 2.0;
    path.lineTo(mid0);

    for (int i = 1; i < points.size() - 1; ++i) {
        QPointF mid = (points[i] + points[i + 1]) / 2.0;
        path.quadTo(points[i], mid);
    }

    path.lineTo(points.last());

    return path;
}

// ============================================================================
// PencilStroke Implementation
// ============================================================================

PencilStroke::PencilStroke(const QVector<QPointF> &points, const StrokeStyle &style)
    : AnnotationItem(style)
    , m_points(points)
{
}

void PencilStroke::draw(QPainter &painter) const
{
    if (m_points.isEmpty()) return;

    painter.save();

    QPen pen(m_style.color(), m_style.width(), Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.setRenderHint(QPainter::Antialiasing, true);

    if (m_points.size() == 1) {
        // A press without movement still leaves a visible dot
        painter.drawPoint(m_points.first());
    } else {
        painter.drawPath(buildSmoothPath(m_points));
    }

    painter.restore();
}

QRectF PencilStroke::boundingBox() const
{
    if (m_points.isEmpty()) return QRectF();

    if (m_boundingBoxDirty) {
        qreal minX = m_points[0].x();
        qreal maxX = m_points[0].x();
        qreal minY = m_points[0].y();
        qreal maxY = m_points[0].y();

        for (const QPointF &p : m_points) {
            minX = qMin(minX, p.x());
            maxX = qMax(maxX, p.x());
            minY = qMin(minY, p.y());
            maxY = qMax(maxY, p.y());
        }

        m_boundingBoxCache = QRectF(minX, minY, maxX - minX, maxY - minY);
        m_boundingBoxDirty = false;
    }
    return m_boundingBoxCache;
}

QPainterPath PencilStroke::outlinePath() const
{
    QPainterPath path;
    if (m_points.isEmpty()) {
        return path;
    }

    path.moveTo(m_points[0]);
    if (m_points.size() == 1) {
        path.lineTo(m_points[0]);
        return path;
    }
    for (int i = 1; i < m_points.size(); ++i) {
        path.lineTo(m_points[i]);
    }
    return path;
}

std::unique_ptr<AnnotationItem> PencilStroke::clone() const
{
    return std::make_unique<PencilStroke>(m_points, m_style);
}

void PencilStroke::translate(const QPointF &delta)
{
    for (QPointF &p : m_points) {
        p += delta;
    }
    m_boundingBoxDirty = true;
}

std::unique_ptr<AnnotationItem> PencilStroke::cloneWithAnchor(const QPointF &anchor) const
{
    return cloneTranslated(anchor - boundingBox().topLeft());
}

void PencilStroke::addPoint(const QPointF &point)
{
    m_points.append(point);

    // Incrementally update bounding box cache
    // (QRectF::united() skips null rects, so grow the edges directly)
    if (m_boundingBoxDirty || m_points.size() == 1) {
        m_boundingBoxDirty = true;
    } else {
        const qreal left = qMin(m_boundingBoxCache.left(), point.x());
        const qreal top = qMin(m_boundingBoxCache.top(), point.y());
        const qreal right = qMax(m_boundingBoxCache.right(), point.x());
        const qreal bottom = qMax(m_boundingBoxCache.bottom(), point.y());
        m_boundingBoxCache = QRectF(left, top, right - left, bottom - top);
    }
}

void PencilStroke::setPoints(const QVector<QPointF> &points)
{
    m_points = points;
    m_boundingBoxDirty = true;
}

void PencilStroke::scaleAbout(const QPointF &origin, qreal sx, qreal sy)
{
    for (QPointF &p : m_points) {
        p = QPointF(origin.x() + (p.x() - origin.x()) * sx,
                    origin.y() + (p.y() - origin.y()) * sy);
    }
    m_boundingBoxDirty = true;
}

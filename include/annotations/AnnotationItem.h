#ifndef ANNOTATIONITEM_H
#define ANNOTATIONITEM_H

#include <QPainter>
#include <QPainterPath>
#include <QPointF>
#include <QRectF>
#include <memory>

#include "annotations/StrokeStyle.h"

// Closed set of annotation kinds. Each concrete item reports one of these.
enum class AnnotationKind {
    Line = 0,
    Arrow,
    FreehandPath,
    Rectangle,
    Ellipse,
    Triangle,
    Text
};

/**
 * @brief Abstract base class for all annotation items.
 *
 * Items are plain geometry plus style. Identity is assigned by the
 * AnnotationLayer on insertion; clones always start without one.
 */
class AnnotationItem
{
public:
    virtual ~AnnotationItem() = default;

    virtual AnnotationKind kind() const = 0;
    virtual void draw(QPainter &painter) const = 0;

    // Geometric bounds, without any stroke margin.
    virtual QRectF boundingBox() const = 0;

    // Centerline or outline used to build the hit region.
    virtual QPainterPath outlinePath() const = 0;

    virtual std::unique_ptr<AnnotationItem> clone() const = 0;
    virtual void translate(const QPointF &delta) = 0;

    // Copy re-anchored so its reference point lands on anchor (paste).
    virtual std::unique_ptr<AnnotationItem> cloneWithAnchor(const QPointF &anchor) const = 0;

    std::unique_ptr<AnnotationItem> cloneTranslated(const QPointF &delta) const
    {
        auto copy = clone();
        copy->translate(delta);
        return copy;
    }

    virtual StrokeStyle style() const { return m_style; }
    virtual void setStyle(const StrokeStyle &style) { m_style = style; }

    quint64 id() const { return m_id; }
    void setId(quint64 id) { m_id = id; }

    bool isSelected() const { return m_selected; }
    void setSelected(bool selected) { m_selected = selected; }

protected:
    explicit AnnotationItem(const StrokeStyle &style)
        : m_style(style)
    {
    }

    StrokeStyle m_style;

private:
    quint64 m_id = 0;
    bool m_selected = false;
};

#endif // ANNOTATIONITEM_H

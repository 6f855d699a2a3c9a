#ifndef TEXTANNOTATION_H
#define TEXTANNOTATION_H

#include "annotations/AnnotationItem.h"
#include <QFont>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

// Text annotation with uniform scaling about its anchor
class TextAnnotation : public AnnotationItem
{
public:
    static constexpr qreal kMinPointSize = 6.0;
    static constexpr qreal kPointSizePerWidth = 3.0;
    static constexpr qreal kMinScale = 0.1;

    TextAnnotation(const QPointF &position, const QString &text, const QString &fontFamily,
                   const StrokeStyle &style);

    AnnotationKind kind() const override { return AnnotationKind::Text; }
    void draw(QPainter &painter) const override;
    QRectF boundingBox() const override;
    QPainterPath outlinePath() const override;
    std::unique_ptr<AnnotationItem> clone() const override;
    void translate(const QPointF &delta) override { m_position += delta; }
    std::unique_ptr<AnnotationItem> cloneWithAnchor(const QPointF &anchor) const override;

    QString text() const { return m_text; }
    void setText(const QString &text) { m_text = text; }

    // Top-left of the unscaled text box; scaling keeps it fixed.
    QPointF position() const { return m_position; }
    void setPosition(const QPointF &position) { m_position = position; }

    QString fontFamily() const { return m_fontFamily; }
    void setFontFamily(const QString &family) { m_fontFamily = family; }

    QColor color() const { return m_style.color(); }
    qreal pointSize() const { return pointSizeForWidth(m_style.width()); }
    QFont font() const;

    qreal scale() const { return m_scale; }
    void setScale(qreal scale) { m_scale = qMax(kMinScale, scale); }

    static qreal pointSizeForWidth(qreal strokeWidth);

private:
    QSizeF unscaledTextSize() const;

    QPointF m_position;
    QString m_text;
    QString m_fontFamily;
    qreal m_scale = 1.0;
};

#endif // TEXTANNOTATION_H

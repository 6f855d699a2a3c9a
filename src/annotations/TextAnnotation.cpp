#include "annotations/TextAnnotation.h"
#include <QFontMetricsF>
#include <QPainter>
#include <QPainterPath>
#include <QStringList>

TextAnnotation::TextAnnotation(const QPointF &position, const QString &text,
                               const QString &fontFamily, const StrokeStyle &style)
    : AnnotationItem(style)
    , m_position(position)
    , m_text(text)
    , m_fontFamily(fontFamily)
{
}

qreal TextAnnotation::pointSizeForWidth(qreal strokeWidth)
{
    return qMax(kMinPointSize, strokeWidth * kPointSizePerWidth);
}

QFont TextAnnotation::font() const
{
    QFont font(m_fontFamily);
    font.setPointSizeF(pointSize());
    return font;
}

QSizeF TextAnnotation::unscaledTextSize() const
{
    QFontMetricsF fm(font());
    const QStringList lines = m_text.split('\n');

    qreal maxWidth = 0.0;
    for (const QString &line : lines) {
        maxWidth = qMax(maxWidth, fm.horizontalAdvance(line));
    }
    return QSizeF(maxWidth, lines.count() * fm.lineSpacing());
}

QRectF TextAnnotation::boundingBox() const
{
    return QRectF(m_position, unscaledTextSize() * m_scale);
}

QPainterPath TextAnnotation::outlinePath() const
{
    QPainterPath path;
    path.addRect(boundingBox());
    return path;
}

void TextAnnotation::draw(QPainter &painter) const
{
    if (m_text.isEmpty()) return;

    const QFont textFont = font();
    QFontMetricsF fm(textFont);

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);

    painter.translate(m_position);
    painter.scale(m_scale, m_scale);

    painter.setPen(Qt::NoPen);
    painter.setBrush(m_style.color());

    QPointF baseline(0.0, fm.ascent());
    const QStringList lines = m_text.split('\n');
    for (const QString &line : lines) {
        if (!line.isEmpty()) {
            QPainterPath path;
            path.addText(baseline, textFont, line);
            painter.drawPath(path);
        }
        baseline.setY(baseline.y() + fm.lineSpacing());
    }

    painter.restore();
}

std::unique_ptr<AnnotationItem> TextAnnotation::clone() const
{
    auto cloned = std::make_unique<TextAnnotation>(m_position, m_text, m_fontFamily, m_style);
    cloned->m_scale = m_scale;
    return cloned;
}

std::unique_ptr<AnnotationItem> TextAnnotation::cloneWithAnchor(const QPointF &anchor) const
{
    auto cloned = std::make_unique<TextAnnotation>(anchor, m_text, m_fontFamily, m_style);
    cloned->m_scale = m_scale;
    return cloned;
}

#ifndef STROKESTYLE_H
#define STROKESTYLE_H

#include <QColor>
#include <QtGlobal>

/**
 * @brief Color and stroke width shared by every annotation kind.
 *
 * Width is clamped to kMinWidth on construction and on every set.
 */
class StrokeStyle
{
public:
    static constexpr qreal kMinWidth = 0.1;

    StrokeStyle() = default;
    StrokeStyle(const QColor &color, qreal width)
        : m_color(color)
        , m_width(qMax(kMinWidth, width))
    {
    }

    QColor color() const { return m_color; }
    void setColor(const QColor &color) { m_color = color; }

    qreal width() const { return m_width; }
    void setWidth(qreal width) { m_width = qMax(kMinWidth, width); }

    bool operator==(const StrokeStyle &other) const
    {
        return m_color == other.m_color && qFuzzyCompare(m_width, other.m_width);
    }
    bool operator!=(const StrokeStyle &other) const { return !(*this == other); }

private:
    QColor m_color = Qt::red;
    qreal m_width = 3.0;
};

#endif // STROKESTYLE_H

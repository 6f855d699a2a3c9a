#include "utils/StyleInputParser.h"
#include "annotations/StrokeStyle.h"
#include <QLocale>
#include <QtMath>

std::optional<qreal> StyleInputParser::parseWidth(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }

    bool ok = false;
    qreal value = trimmed.toDouble(&ok);
    if (!ok) {
        // Accept the user's decimal separator as well ("2,5")
        value = QLocale().toDouble(trimmed, &ok);
    }
    if (!ok || !qIsFinite(value) || value <= 0.0) {
        return std::nullopt;
    }

    return qMax(StrokeStyle::kMinWidth, value);
}

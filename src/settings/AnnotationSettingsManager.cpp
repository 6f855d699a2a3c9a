#include "settings/AnnotationSettingsManager.h"
#include "settings/Settings.h"
#include <QDebug>
#include <QSettings>
#include <QtMath>

AnnotationSettingsManager& AnnotationSettingsManager::instance()
{
    static AnnotationSettingsManager instance;
    return instance;
}

QColor AnnotationSettingsManager::loadColor() const
{
    auto settings = MarkupStudio::getSettings();
    const QColor color = settings.value(kSettingsKeyColor, defaultColor()).value<QColor>();
    if (!color.isValid()) {
        qWarning() << "AnnotationSettingsManager: Stored color is invalid, using default";
        return defaultColor();
    }
    return color;
}

void AnnotationSettingsManager::saveColor(const QColor& color)
{
    if (!color.isValid()) {
        qWarning() << "AnnotationSettingsManager: Refusing to save an invalid color";
        return;
    }
    auto settings = MarkupStudio::getSettings();
    settings.setValue(kSettingsKeyColor, color);
}

qreal AnnotationSettingsManager::loadWidth() const
{
    auto settings = MarkupStudio::getSettings();
    bool ok = false;
    const qreal width = settings.value(kSettingsKeyWidth, kDefaultWidth).toDouble(&ok);
    if (!ok || !qIsFinite(width)) {
        return kDefaultWidth;
    }
    return qMax(StrokeStyle::kMinWidth, width);
}

void AnnotationSettingsManager::saveWidth(qreal width)
{
    if (!qIsFinite(width)) {
        return;
    }
    auto settings = MarkupStudio::getSettings();
    settings.setValue(kSettingsKeyWidth, qMax(StrokeStyle::kMinWidth, width));
}

QString AnnotationSettingsManager::loadFontFamily() const
{
    auto settings = MarkupStudio::getSettings();
    const QString family = settings.value(kSettingsKeyFontFamily, defaultFontFamily()).toString();
    return family.trimmed().isEmpty() ? defaultFontFamily() : family;
}

void AnnotationSettingsManager::saveFontFamily(const QString& family)
{
    auto settings = MarkupStudio::getSettings();
    settings.setValue(kSettingsKeyFontFamily, family.trimmed());
}

StrokeStyle AnnotationSettingsManager::loadStyle() const
{
    return StrokeStyle(loadColor(), loadWidth());
}

void AnnotationSettingsManager::saveStyle(const StrokeStyle& style)
{
    saveColor(style.color());
    saveWidth(style.width());
}

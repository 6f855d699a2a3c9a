#ifndef ANNOTATIONSETTINGSMANAGER_H
#define ANNOTATIONSETTINGSMANAGER_H

#include <QColor>
#include <QString>
#include "annotations/StrokeStyle.h"

/**
 * @brief Singleton class for managing annotation settings.
 *
 * Persists the default stroke color and width and the text font family
 * so a new session starts with the style the last one ended with.
 */
class AnnotationSettingsManager
{
public:
    static AnnotationSettingsManager& instance();

    // Color settings
    QColor loadColor() const;
    void saveColor(const QColor& color);

    // Width settings
    qreal loadWidth() const;
    void saveWidth(qreal width);

    // Font family settings
    QString loadFontFamily() const;
    void saveFontFamily(const QString& family);

    // Combined color and width
    StrokeStyle loadStyle() const;
    void saveStyle(const StrokeStyle& style);

    // Default values
    static constexpr qreal kDefaultWidth = 3.0;
    static QColor defaultColor() { return Qt::red; }
    static QString defaultFontFamily() { return QStringLiteral("Sans Serif"); }

private:
    AnnotationSettingsManager() = default;
    AnnotationSettingsManager(const AnnotationSettingsManager&) = delete;
    AnnotationSettingsManager& operator=(const AnnotationSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyColor = "annotationColor";
    static constexpr const char* kSettingsKeyWidth = "annotationWidth";
    static constexpr const char* kSettingsKeyFontFamily = "textFontFamily";
};

#endif // ANNOTATIONSETTINGSMANAGER_H

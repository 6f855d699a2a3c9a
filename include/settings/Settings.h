#pragma once

#include <QSettings>
#include "version.h"

namespace MarkupStudio {

inline constexpr const char* kOrganizationName = "MarkupStudio";
inline constexpr const char* kApplicationName = MARKUPSTUDIO_APP_NAME;

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace MarkupStudio

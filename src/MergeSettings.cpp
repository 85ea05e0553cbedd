/************************************************************************\

    MediaMerge - Photo and video collection merger
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "MergeSettings.h"

#include <QSettings>

namespace {
constexpr char mergeGroup[] = "merge";
constexpr char preferredSuffixKey[] = "preferredSuffix";
constexpr char workersKey[] = "workers";
constexpr char collisionCeilingKey[] = "collisionCeiling";
constexpr char filenamePassKey[] = "filenamePass";
constexpr char removalModeKey[] = "removalMode";
constexpr char trashValue[] = "trash";
constexpr char deleteValue[] = "delete";
}

MergeSettings::MergeSettings() = default;

/**
 * @brief Creates settings backed by an explicit INI file instead of the user scope.
 * @param iniPath INI file path.
 */
MergeSettings::MergeSettings(const QString &iniPath)
    : m_iniPath(iniPath)
{
}

std::unique_ptr<QSettings> MergeSettings::openSettings() const
{
    if (m_iniPath.isEmpty()) {
        return std::make_unique<QSettings>(QSettings::IniFormat, QSettings::UserScope,
                                           QStringLiteral("MediaMerge"), QStringLiteral("MediaMerge"));
    }
    return std::make_unique<QSettings>(m_iniPath, QSettings::IniFormat);
}

/**
 * @brief Reads the stored defaults, falling back to built-in values.
 * @return Options seeded from the settings file.
 */
MergeOptions MergeSettings::load() const
{
    MergeOptions options;
    std::unique_ptr<QSettings> settings = openSettings();
    settings->beginGroup(QLatin1String(mergeGroup));
    options.preferredSuffix = settings->value(QLatin1String(preferredSuffixKey), options.preferredSuffix).toString();
    options.workers = qMax(0, settings->value(QLatin1String(workersKey), options.workers).toInt());
    const int ceiling = settings->value(QLatin1String(collisionCeilingKey), options.collisionCeiling).toInt();
    if (ceiling > 0) {
        options.collisionCeiling = ceiling;
    }
    options.filenamePass = settings->value(QLatin1String(filenamePassKey), options.filenamePass).toBool();
    const QString removal = settings->value(QLatin1String(removalModeKey), QLatin1String(trashValue)).toString();
    options.removalMode = removal == QLatin1String(deleteValue)
        ? PlatformUtils::RemovalMode::DeletePermanently
        : PlatformUtils::RemovalMode::MoveToTrash;
    settings->endGroup();
    return options;
}

void MergeSettings::save(const MergeOptions &options) const
{
    std::unique_ptr<QSettings> settings = openSettings();
    settings->beginGroup(QLatin1String(mergeGroup));
    settings->setValue(QLatin1String(preferredSuffixKey), options.preferredSuffix);
    settings->setValue(QLatin1String(workersKey), options.workers);
    settings->setValue(QLatin1String(collisionCeilingKey), options.collisionCeiling);
    settings->setValue(QLatin1String(filenamePassKey), options.filenamePass);
    settings->setValue(QLatin1String(removalModeKey),
                       options.removalMode == PlatformUtils::RemovalMode::DeletePermanently
                           ? QLatin1String(deleteValue)
                           : QLatin1String(trashValue));
    settings->endGroup();
    settings->sync();
}

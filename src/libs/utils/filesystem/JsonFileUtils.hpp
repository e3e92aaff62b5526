// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QJsonDocument>
#include <QtCore/QString>
#include <QtCore/QVariantMap>

namespace Utils::JsonFileUtils {

// Reads a JSON document whose root is an object. Returns an empty map and
// fills error on any failure.
STAGEHAND_UTILS_EXPORT QVariantMap readMap(const QString& path, QString* error = nullptr);

// Writes through QSaveFile so readers never observe a half-written file.
STAGEHAND_UTILS_EXPORT bool writeMapAtomic(const QString& path,
										   const QVariantMap& map,
										   QString* error = nullptr,
										   QJsonDocument::JsonFormat format = QJsonDocument::Indented);

} // namespace Utils::JsonFileUtils

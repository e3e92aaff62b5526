// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/Qt>
#include <QtCore/QString>
#include <QtCore/QStringView>

namespace Utils::PathUtils {

STAGEHAND_UTILS_EXPORT QString normalizePath(QStringView path);
STAGEHAND_UTILS_EXPORT QString basename(QStringView path);
STAGEHAND_UTILS_EXPORT QString extension(QStringView path);

// Replaces a leading "~" or "~/" with the user's home directory.
STAGEHAND_UTILS_EXPORT QString expandUser(QStringView path);

STAGEHAND_UTILS_EXPORT bool hasExtension(QStringView path,
										 QStringView ext,
										 Qt::CaseSensitivity cs = Qt::CaseInsensitive);
STAGEHAND_UTILS_EXPORT QString ensureExtension(QStringView path, QStringView ext);

} // namespace Utils::PathUtils

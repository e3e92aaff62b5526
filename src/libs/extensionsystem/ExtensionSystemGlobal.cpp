// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ExtensionSystemGlobal.hpp"

// doc: https://doc.qt.io/qt-6/qloggingcategory.html#creating-category-objects
Q_LOGGING_CATEGORY(stagehandExtensionSystemLog, "stagehand.extension_system")
Q_LOGGING_CATEGORY(stagehandConfigLog, "stagehand.config")

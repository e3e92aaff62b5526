// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(STAGEHAND_EXTENSION_SYSTEM_SHARED_LIBRARY)
#	define STAGEHAND_EXTENSION_SYSTEM_EXPORT Q_DECL_EXPORT
#elif defined(STAGEHAND_EXTENSION_SYSTEM_STATIC_LIBRARY)
#	define STAGEHAND_EXTENSION_SYSTEM_EXPORT
#else
#	define STAGEHAND_EXTENSION_SYSTEM_EXPORT Q_DECL_IMPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(stagehandExtensionSystemLog)
Q_DECLARE_LOGGING_CATEGORY(stagehandConfigLog)

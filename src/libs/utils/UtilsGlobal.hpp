// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>

#if defined(STAGEHAND_UTILS_BUILD_SHARED) && (STAGEHAND_UTILS_BUILD_SHARED == 1)
#	if defined(STAGEHAND_UTILS_LIBRARY)
#		define STAGEHAND_UTILS_EXPORT Q_DECL_EXPORT
#	else
#		define STAGEHAND_UTILS_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define STAGEHAND_UTILS_EXPORT
#endif

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ExtensionError.hpp"

namespace Stagehand {

QString errorCodeName(ExtensionErrorCode code)
{
	switch (code) {
	case ExtensionErrorCode::None:
		return QStringLiteral("None");
	case ExtensionErrorCode::Validation:
		return QStringLiteral("ValidationError");
	case ExtensionErrorCode::NotInstalled:
		return QStringLiteral("NotInstalledError");
	case ExtensionErrorCode::NotFound:
		return QStringLiteral("NotFoundError");
	case ExtensionErrorCode::Discovery:
		return QStringLiteral("DiscoveryError");
	case ExtensionErrorCode::Pipeline:
		return QStringLiteral("PipelineError");
	}
	return QStringLiteral("UnknownError");
}

} // namespace Stagehand

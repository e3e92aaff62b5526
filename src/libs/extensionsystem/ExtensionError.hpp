// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ExtensionSystemGlobal.hpp"

#include <QtCore/QString>

namespace Stagehand {

enum class ExtensionErrorCode : quint8 {
	None = 0,
	Validation,   // malformed plugin-declared field
	NotInstalled, // enable requested for an unknown plugin name
	NotFound,     // enabled plugin lookup failed
	Discovery,    // a plugin source entry could not be resolved
	Pipeline      // generic failure reported by a collaborator callback
};

class STAGEHAND_EXTENSION_SYSTEM_EXPORT ExtensionError final {
public:
	ExtensionError() = default;
	ExtensionError(ExtensionErrorCode code, QString message)
		: m_code(code), m_message(std::move(message)) {}

	bool ok() const noexcept { return m_code == ExtensionErrorCode::None; }
	ExtensionErrorCode code() const noexcept { return m_code; }
	const QString& message() const noexcept { return m_message; }

	static ExtensionError none() { return {}; }

	static ExtensionError validation(QString message)
	{
		return {ExtensionErrorCode::Validation, std::move(message)};
	}
	static ExtensionError notInstalled(QString message)
	{
		return {ExtensionErrorCode::NotInstalled, std::move(message)};
	}
	static ExtensionError notFound(QString message)
	{
		return {ExtensionErrorCode::NotFound, std::move(message)};
	}
	static ExtensionError discovery(QString message)
	{
		return {ExtensionErrorCode::Discovery, std::move(message)};
	}
	static ExtensionError pipeline(QString message)
	{
		return {ExtensionErrorCode::Pipeline, std::move(message)};
	}

private:
	ExtensionErrorCode m_code{ExtensionErrorCode::None};
	QString m_message;
};

QString STAGEHAND_EXTENSION_SYSTEM_EXPORT errorCodeName(ExtensionErrorCode code);

} // namespace Stagehand

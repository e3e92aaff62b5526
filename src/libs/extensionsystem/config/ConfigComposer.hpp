// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionError.hpp"
#include "extensionsystem/ExtensionSystemGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariantMap>

#include <optional>

namespace Stagehand {

class ExtensionKernel;

// Folds plugin contributions into the base, defaults and overrides layers and
// merges them into the user configuration.
class STAGEHAND_EXTENSION_SYSTEM_EXPORT ConfigComposer final {
public:
	explicit ConfigComposer(const ExtensionKernel& kernel);

	QVariantMap baseLayer(const QVariantMap& initial = {}, ExtensionError* errorOut = nullptr) const;
	QVariantMap defaultsLayer(const QVariantMap& initial = {}, ExtensionError* errorOut = nullptr) const;

	// Without a context every "set" contribution is folded; with one, only
	// those registered under it. Unscoped contributions never belong to a
	// plugin and are left out of a scoped layer.
	QVariantMap overridesLayer(const std::optional<QString>& context = std::nullopt,
							   ExtensionError* errorOut = nullptr) const;

	// Fill in keys the user config does not define yet. Existing keys are
	// never touched.
	ExtensionError updateWithBase(QVariantMap& config) const;
	ExtensionError updateWithDefaults(QVariantMap& config) const;

	// PLUGINS as a list of names. Missing or null yields an empty list; any
	// other non-list value, or a non-string entry, is a validation error.
	static QStringList enabledPluginNames(const QVariantMap& config, ExtensionError* errorOut = nullptr);

private:
	QVariantMap foldLayer(const char* filter,
						  const QVariantMap& initial,
						  const std::optional<QString>& context,
						  ExtensionError* errorOut) const;

	const ExtensionKernel& m_kernel;
};

} // namespace Stagehand

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/config/ConfigComposer.hpp"

#include "extensionsystem/ExtensionKernel.hpp"
#include "extensionsystem/ExtensionSystemConstants.hpp"
#include "extensionsystem/PluginManifest.hpp"

#include <QtCore/QDebug>

namespace Stagehand {

namespace {

void mergeMissing(QVariantMap& config, const QVariantMap& layer)
{
	for (auto it = layer.cbegin(); it != layer.cend(); ++it) {
		if (!config.contains(it.key())) {
			qCDebug(stagehandConfigLog).noquote() << "Adding config key" << it.key();
			config.insert(it.key(), it.value());
		}
	}
}

} // namespace

ConfigComposer::ConfigComposer(const ExtensionKernel& kernel)
	: m_kernel(kernel)
{
}

QVariantMap ConfigComposer::foldLayer(const char* filter,
									  const QVariantMap& initial,
									  const std::optional<QString>& context,
									  ExtensionError* errorOut) const
{
	const QString name = QString::fromLatin1(filter);
	ExtensionError err;
	const QVariant folded = context
		? m_kernel.filters().applyScoped(name, *context, initial, {}, ContextMatch::Exact, &err)
		: m_kernel.filters().apply(name, initial, {}, &err);

	if (errorOut)
		*errorOut = err;
	if (!err.ok())
		return {};
	return folded.toMap();
}

QVariantMap ConfigComposer::baseLayer(const QVariantMap& initial, ExtensionError* errorOut) const
{
	return foldLayer(Constants::FILTER_CONFIG_BASE, initial, std::nullopt, errorOut);
}

QVariantMap ConfigComposer::defaultsLayer(const QVariantMap& initial, ExtensionError* errorOut) const
{
	return foldLayer(Constants::FILTER_CONFIG_DEFAULTS, initial, std::nullopt, errorOut);
}

QVariantMap ConfigComposer::overridesLayer(const std::optional<QString>& context, ExtensionError* errorOut) const
{
	return foldLayer(Constants::FILTER_CONFIG_OVERRIDES, {}, context, errorOut);
}

ExtensionError ConfigComposer::updateWithBase(QVariantMap& config) const
{
	ExtensionError err;
	const QVariantMap base = baseLayer({}, &err);
	if (!err.ok())
		return err;
	mergeMissing(config, base);
	return ExtensionError::none();
}

ExtensionError ConfigComposer::updateWithDefaults(QVariantMap& config) const
{
	ExtensionError err;
	const QVariantMap defaults = defaultsLayer({}, &err);
	if (!err.ok())
		return err;
	mergeMissing(config, defaults);
	return ExtensionError::none();
}

QStringList ConfigComposer::enabledPluginNames(const QVariantMap& config, ExtensionError* errorOut)
{
	if (errorOut)
		*errorOut = ExtensionError::none();

	const QVariant value = config.value(QString::fromLatin1(Constants::PLUGINS_CONFIG_KEY));
	if (!value.isValid() || value.isNull())
		return {};

	if (!isListValue(value)) {
		if (errorOut) {
			*errorOut = ExtensionError::validation(QStringLiteral("Invalid config value %1. Expected list, got %2.")
													   .arg(QLatin1String(Constants::PLUGINS_CONFIG_KEY),
															variantShapeName(value)));
		}
		return {};
	}

	QStringList names;
	for (const QVariant& item : value.toList()) {
		if (!isStringValue(item)) {
			if (errorOut) {
				*errorOut = ExtensionError::validation(
					QStringLiteral("Invalid entry in config value %1. Expected string, got %2.")
						.arg(QLatin1String(Constants::PLUGINS_CONFIG_KEY), variantShapeName(item)));
			}
			return {};
		}
		names.push_back(item.toString());
	}
	return names;
}

} // namespace Stagehand

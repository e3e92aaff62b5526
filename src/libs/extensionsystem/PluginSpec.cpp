// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "PluginSpec.hpp"

#include "IPluginResolver.hpp"

#include <type_traits>

namespace Stagehand {

namespace {

template <class>
inline constexpr bool alwaysFalse = false;

} // namespace

PluginSpec::PluginSpec(QString name, PluginSource source)
	: m_name(std::move(name))
	, m_source(std::move(source))
{
}

QString PluginSpec::version() const
{
	return std::visit(
		[](const auto& source) -> QString {
			using T = std::decay_t<decltype(source)>;
			if constexpr (std::is_same_v<T, StaticSource>)
				return source.version;
			else if constexpr (std::is_same_v<T, FileSource>)
				return source.document.value(QLatin1String(ManifestKeys::VERSION)).toString();
			else if constexpr (std::is_same_v<T, PackageSource>)
				return source.distributionVersion;
			else
				static_assert(alwaysFalse<T>, "unhandled plugin source");
		},
		m_source);
}

QString PluginSpec::sourceKind() const
{
	switch (m_source.index()) {
	case 0:
		return QStringLiteral("static");
	case 1:
		return QStringLiteral("file");
	default:
		return QStringLiteral("package");
	}
}

const PluginManifest* PluginSpec::manifest(IPluginResolver& resolver, ExtensionError* errorOut)
{
	if (errorOut)
		*errorOut = ExtensionError::none();
	if (m_manifest)
		return &*m_manifest;

	PluginManifest loaded;
	const ExtensionError err = std::visit(
		[&](const auto& source) -> ExtensionError {
			using T = std::decay_t<decltype(source)>;
			if constexpr (std::is_same_v<T, StaticSource>) {
				return resolver.loadModule(source.module, loaded);
			} else if constexpr (std::is_same_v<T, FileSource>) {
				loaded = PluginManifest::fromVariantMap(source.document);
				return ExtensionError::none();
			} else if constexpr (std::is_same_v<T, PackageSource>) {
				return resolver.loadEntryPoint(
					PluginEntryPoint{source.entryPoint, source.libraryPath, source.distributionVersion},
					loaded);
			} else {
				static_assert(alwaysFalse<T>, "unhandled plugin source");
			}
		},
		m_source);

	if (!err.ok()) {
		if (errorOut)
			*errorOut = err;
		return nullptr;
	}

	m_manifest = std::move(loaded);
	return &*m_manifest;
}

QList<PluginPtr> pluginsFromVariant(const QVariant& value)
{
	QList<PluginPtr> out;
	const QVariantList items = value.toList();
	out.reserve(items.size());
	for (const QVariant& item : items) {
		if (PluginPtr plugin = item.value<PluginPtr>())
			out.push_back(std::move(plugin));
	}
	return out;
}

} // namespace Stagehand

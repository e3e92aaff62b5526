// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ExtensionError.hpp"
#include "ExtensionSystemGlobal.hpp"
#include "PluginManifest.hpp"

#include <QtCore/QList>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QVariantMap>

#include <memory>
#include <optional>
#include <variant>

namespace Stagehand {

class IPluginResolver;

// Plugin registered by the host against the resolver's module table.
struct StaticSource {
	QString module;
	QString version;
};

// One JSON document in the declarative plugin root.
struct FileSource {
	QString path;
	QVariantMap document;
};

// Qt plugin library found in a package directory.
struct PackageSource {
	QString entryPoint;
	QString libraryPath;
	QString distributionVersion;
};

using PluginSource = std::variant<StaticSource, FileSource, PackageSource>;

enum class PluginState : quint8 {
	Discovered,
	Installed,
	Enabled
};

// Descriptor of one discovered plugin. Names are not unique: two descriptors
// with the same name are independent contributors.
class STAGEHAND_EXTENSION_SYSTEM_EXPORT PluginSpec final {
public:
	PluginSpec(QString name, PluginSource source);

	const QString& name() const noexcept { return m_name; }
	QString version() const;

	const PluginSource& source() const noexcept { return m_source; }
	QString sourceKind() const;

	PluginState state() const noexcept { return m_state; }
	void setState(PluginState state) noexcept { m_state = state; }

	// Resolves the manifest on first use and caches it.
	const PluginManifest* manifest(IPluginResolver& resolver, ExtensionError* errorOut = nullptr);
	bool hasLoadedManifest() const noexcept { return m_manifest.has_value(); }

private:
	QString m_name;
	PluginSource m_source;
	PluginState m_state = PluginState::Discovered;
	std::optional<PluginManifest> m_manifest;
};

using PluginPtr = std::shared_ptr<PluginSpec>;

// Extracts descriptors from a "plugins:installed" / "plugins:enabled" value.
STAGEHAND_EXTENSION_SYSTEM_EXPORT QList<PluginPtr> pluginsFromVariant(const QVariant& value);

} // namespace Stagehand

Q_DECLARE_METATYPE(Stagehand::PluginPtr)

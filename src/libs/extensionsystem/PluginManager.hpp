// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ExtensionError.hpp"
#include "ExtensionSystemGlobal.hpp"
#include "PluginManifest.hpp"
#include "PluginSpec.hpp"

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariantMap>

#include <optional>

namespace Stagehand {

class ExtensionKernel;
class IPluginResolver;

// Host-facing plugin API. Everything is read back from the kernel's
// registries; the manager itself only holds references.
//
// Construction registers three actions:
//   plugins:install    discover declarative and packaged plugins, install each
//   plugins:enable     fire plugins:<name>:enable once for every name given
//   config:user:load   install once, then enable the config's PLUGINS
class STAGEHAND_EXTENSION_SYSTEM_EXPORT PluginManager final {
public:
	PluginManager(ExtensionKernel& kernel, IPluginResolver& resolver);

	PluginManager(const PluginManager&) = delete;
	PluginManager& operator=(const PluginManager&) = delete;

	// Sorted by name. Plugins sharing a name are all listed. Queries fold the
	// kernel's pipelines: a failing contribution is reported through errorOut
	// and the query comes back empty.
	QList<PluginPtr> installed(ExtensionError* errorOut = nullptr) const;
	QList<PluginPtr> enabled(ExtensionError* errorOut = nullptr) const;

	bool isInstalled(const QString& name, ExtensionError* errorOut = nullptr) const;
	bool isEnabled(const QString& name, ExtensionError* errorOut = nullptr) const;
	PluginPtr enabledPlugin(const QString& name, ExtensionError* errorOut = nullptr) const;

	// Edits PLUGINS only; contributions are registered at the next config load.
	ExtensionError enable(QVariantMap& config, const QString& name) const;
	ExtensionError disable(QVariantMap& config, const PluginPtr& plugin);

	// Runs config:user:load with config.
	ExtensionError loadUserConfig(const QVariantMap& config);

	QList<PluginPatch> patchesFor(const QString& patchName, ExtensionError* errorOut = nullptr) const;
	QList<PluginHook> hooksFor(const QString& hookName, ExtensionError* errorOut = nullptr) const;
	QStringList templateRoots(ExtensionError* errorOut = nullptr) const;
	QList<TemplateTarget> templateTargets(ExtensionError* errorOut = nullptr) const;
	QList<CliCommand> commands(ExtensionError* errorOut = nullptr) const;
	// Last registered command with that name.
	std::optional<CliCommand> command(const QString& name, ExtensionError* errorOut = nullptr) const;

	// Installs a plugin compiled into the host, looked up in the resolver's
	// module table.
	ExtensionError installStatic(const QString& module);

	// STAGEHAND_PLUGINS_ROOT, or the per-user data directory.
	static QString pluginsRoot();

private:
	void registerActions();
	void installDeclarativePlugins();
	void installPackagePlugins();
	ExtensionError enableNames(const QStringList& names);

	QList<PluginPtr> pluginsOf(const char* filter, ExtensionError* errorOut) const;
	QVariantList collect(const char* filter, const QVariantList& args, ExtensionError* errorOut) const;

	ExtensionKernel& m_kernel;
	IPluginResolver& m_resolver;
};

} // namespace Stagehand

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ExtensionSystemGlobal.hpp"
#include "IPluginResolver.hpp"

#include <QtCore/QHash>
#include <QtCore/QStringList>

#include <functional>
#include <map>
#include <memory>

QT_BEGIN_NAMESPACE
class QPluginLoader;
QT_END_NAMESPACE

namespace Stagehand {

// Resolver used by the host: a module table for plugins compiled into the
// executable, Qt plugin libraries for packaged plugins and Qt JSON for
// declarative plugin documents.
class STAGEHAND_EXTENSION_SYSTEM_EXPORT DefaultPluginResolver final : public IPluginResolver {
public:
	using ModuleFactory = std::function<void(PluginManifest& manifest)>;

	explicit DefaultPluginResolver(QStringList packageDirs = {});
	~DefaultPluginResolver() override;

	DefaultPluginResolver(const DefaultPluginResolver&) = delete;
	DefaultPluginResolver& operator=(const DefaultPluginResolver&) = delete;

	void registerModule(const QString& module, const QString& version, ModuleFactory factory);
	bool hasModule(const QString& module) const { return m_modules.contains(module); }

	const QStringList& packageDirs() const noexcept { return m_packageDirs; }
	void setPackageDirs(QStringList dirs) { m_packageDirs = std::move(dirs); }

	ExtensionError loadModule(const QString& module, PluginManifest& manifest) override;
	ExtensionError moduleVersion(const QString& module, QString& version) override;

	QList<PluginEntryPoint> entryPoints(QList<ExtensionError>* errors = nullptr) override;
	ExtensionError loadEntryPoint(const PluginEntryPoint& entryPoint, PluginManifest& manifest) override;

	ExtensionError loadDocument(const QString& path, QVariantMap& document) override;

private:
	struct Module {
		QString version;
		ModuleFactory factory;
	};

	QPluginLoader* loaderFor(const QString& libraryPath);

	QHash<QString, Module> m_modules;
	QStringList m_packageDirs;
	// Loaders are kept alive but never unloaded: registered callbacks may
	// point into the plugin library for the lifetime of the kernel.
	std::map<QString, std::unique_ptr<QPluginLoader>> m_loaders;
};

} // namespace Stagehand

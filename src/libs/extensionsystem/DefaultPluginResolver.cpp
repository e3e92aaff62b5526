// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "DefaultPluginResolver.hpp"

#include "ExtensionSystemConstants.hpp"
#include "IPluginModule.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QDebug>
#include <QtCore/QDir>
#include <QtCore/QDirIterator>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonObject>
#include <QtCore/QLibrary>
#include <QtCore/QPluginLoader>

namespace Stagehand {

DefaultPluginResolver::DefaultPluginResolver(QStringList packageDirs)
	: m_packageDirs(std::move(packageDirs))
{
}

DefaultPluginResolver::~DefaultPluginResolver() = default;

void DefaultPluginResolver::registerModule(const QString& module, const QString& version, ModuleFactory factory)
{
	m_modules.insert(module, Module{version, std::move(factory)});
}

ExtensionError DefaultPluginResolver::loadModule(const QString& module, PluginManifest& manifest)
{
	const auto it = m_modules.constFind(module);
	if (it == m_modules.cend() || !it->factory)
		return ExtensionError::discovery(QStringLiteral("Unknown plugin module '%1'.").arg(module));

	it->factory(manifest);
	return ExtensionError::none();
}

ExtensionError DefaultPluginResolver::moduleVersion(const QString& module, QString& version)
{
	const auto it = m_modules.constFind(module);
	if (it == m_modules.cend())
		return ExtensionError::discovery(QStringLiteral("Unknown plugin module '%1'.").arg(module));
	if (it->version.trimmed().isEmpty())
		return ExtensionError::validation(QStringLiteral("Plugin module '%1' must declare a version.").arg(module));

	version = it->version;
	return ExtensionError::none();
}

QPluginLoader* DefaultPluginResolver::loaderFor(const QString& libraryPath)
{
	auto& loader = m_loaders[libraryPath];
	if (!loader)
		loader = std::make_unique<QPluginLoader>(libraryPath);
	return loader.get();
}

QList<PluginEntryPoint> DefaultPluginResolver::entryPoints(QList<ExtensionError>* errors)
{
	auto report = [errors](ExtensionError err) {
		if (errors)
			errors->push_back(std::move(err));
	};

	QList<PluginEntryPoint> out;
	for (const QString& dirPath : m_packageDirs) {
		if (!QFileInfo(dirPath).isDir())
			continue;

		QDirIterator it(dirPath, QDir::Files);
		while (it.hasNext()) {
			const QString path = it.next();
			if (!QLibrary::isLibrary(path))
				continue;

			QPluginLoader* loader = loaderFor(path);
			const QJsonObject root = loader->metaData();
			if (root.isEmpty()) {
				report(ExtensionError::discovery(QStringLiteral("Failed to read plugin metadata from %1: %2")
													 .arg(path, loader->errorString())));
				continue;
			}

			const QString iid = root.value(QStringLiteral("IID")).toString();
			if (iid != QLatin1String(Constants::PLUGIN_ENTRY_POINT_IID)) {
				qCDebug(stagehandExtensionSystemLog).noquote() << "Skipping" << path << "with IID" << iid;
				continue;
			}

			const QJsonObject meta = root.value(QStringLiteral("MetaData")).toObject();
			const QString name = meta.value(QStringLiteral("Name")).toString().trimmed();
			if (name.isEmpty()) {
				report(ExtensionError::discovery(
					QStringLiteral("Failed to load entry point from %1: missing MetaData Name.").arg(path)));
				continue;
			}

			QString version = meta.value(QStringLiteral("Version")).toString().trimmed();
			if (version.isEmpty())
				version = QString::fromLatin1(Constants::DEFAULT_PACKAGE_VERSION);

			out.push_back(PluginEntryPoint{name, QFileInfo(path).absoluteFilePath(), version});
		}
	}
	return out;
}

ExtensionError DefaultPluginResolver::loadEntryPoint(const PluginEntryPoint& entryPoint, PluginManifest& manifest)
{
	QPluginLoader* loader = loaderFor(entryPoint.libraryPath);
	QObject* instance = loader->instance();
	if (!instance) {
		return ExtensionError::discovery(QStringLiteral("Failed to load entry point '%1' from %2: %3")
											 .arg(entryPoint.name, entryPoint.libraryPath, loader->errorString()));
	}

	auto* module = qobject_cast<IPluginModule*>(instance);
	if (!module) {
		return ExtensionError::discovery(
			QStringLiteral("Entry point '%1' from %2 does not implement %3.")
				.arg(entryPoint.name, entryPoint.libraryPath, QLatin1String(STAGEHAND_PLUGIN_MODULE_IID)));
	}

	module->contribute(manifest);
	return ExtensionError::none();
}

ExtensionError DefaultPluginResolver::loadDocument(const QString& path, QVariantMap& document)
{
	QString error;
	document = Utils::JsonFileUtils::readMap(path, &error);
	if (!error.isEmpty())
		return ExtensionError::discovery(QStringLiteral("Invalid plugin: %1. %2").arg(path, error));
	return ExtensionError::none();
}

} // namespace Stagehand

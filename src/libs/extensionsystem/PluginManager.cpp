// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "PluginManager.hpp"

#include "ExtensionKernel.hpp"
#include "ExtensionSystemConstants.hpp"
#include "IPluginResolver.hpp"
#include "PluginLifecycle.hpp"
#include "config/ConfigComposer.hpp"

#include <utils/PathUtils.hpp>

#include <QtCore/QDebug>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStandardPaths>

#include <algorithm>

namespace Stagehand {

namespace {

void sortByName(QList<PluginPtr>& plugins)
{
	std::stable_sort(plugins.begin(), plugins.end(), [](const PluginPtr& a, const PluginPtr& b) {
		return a->name() < b->name();
	});
}

void warnDiscovery(const ExtensionError& err)
{
	qCWarning(stagehandExtensionSystemLog).noquote() << errorCodeName(err.code()) << err.message();
}

} // namespace

PluginManager::PluginManager(ExtensionKernel& kernel, IPluginResolver& resolver)
	: m_kernel(kernel)
	, m_resolver(resolver)
{
	registerActions();
}

void PluginManager::registerActions()
{
	ActionRegistry& actions = m_kernel.actions();

	actions.add(QString::fromLatin1(Constants::ACTION_PLUGINS_INSTALL), [this](const QVariantList&) {
		installPackagePlugins();
		installDeclarativePlugins();
	});

	actions.add(QString::fromLatin1(Constants::ACTION_PLUGINS_ENABLE), [this](const QVariantList& args) {
		return enableNames(args.value(0).toStringList());
	});

	actions.add(QString::fromLatin1(Constants::ACTION_CONFIG_USER_LOAD), [this](const QVariantList& args) {
		ExtensionError err;
		const QStringList names = ConfigComposer::enabledPluginNames(args.value(0).toMap(), &err);
		if (!err.ok())
			return err;

		err = m_kernel.actions().doActionOnce(QString::fromLatin1(Constants::ACTION_PLUGINS_INSTALL));
		if (!err.ok())
			return err;
		return m_kernel.actions().doAction(QString::fromLatin1(Constants::ACTION_PLUGINS_ENABLE), {names});
	});
}

ExtensionError PluginManager::enableNames(const QStringList& names)
{
	for (const QString& name : names) {
		ExtensionError err;
		const bool installed = isInstalled(name, &err);
		if (!err.ok())
			return err;
		if (!installed) {
			qCWarning(stagehandExtensionSystemLog).noquote()
				<< "Plugin" << name << "is enabled in the configuration but not installed";
		}
		err = m_kernel.actions().doActionOnce(enableActionName(name));
		if (!err.ok())
			return err;
	}
	return ExtensionError::none();
}

void PluginManager::installDeclarativePlugins()
{
	const QDir root(pluginsRoot());
	if (!root.exists())
		return;

	const QFileInfoList files = root.entryInfoList({QStringLiteral("*.json")}, QDir::Files, QDir::Name);
	for (const QFileInfo& file : files) {
		const QString path = file.absoluteFilePath();

		QVariantMap document;
		if (const ExtensionError err = m_resolver.loadDocument(path, document); !err.ok()) {
			warnDiscovery(err);
			continue;
		}

		bool valid = true;
		for (const char* key : {ManifestKeys::NAME, ManifestKeys::VERSION}) {
			const QVariant value = document.value(QLatin1String(key));
			if (!value.isValid()) {
				warnDiscovery(ExtensionError::discovery(
					QStringLiteral("Invalid plugin: %1. Missing key: %2").arg(path, QLatin1String(key))));
				valid = false;
				break;
			}
			if (!isStringValue(value)) {
				warnDiscovery(ExtensionError::discovery(QStringLiteral("Invalid plugin: %1. Expected string %2, got %3.")
															.arg(path, QLatin1String(key), variantShapeName(value))));
				valid = false;
				break;
			}
		}
		if (!valid)
			continue;

		const QString name = document.value(QLatin1String(ManifestKeys::NAME)).toString();
		installPlugin(m_kernel, m_resolver, std::make_shared<PluginSpec>(name, FileSource{path, document}));
	}
}

void PluginManager::installPackagePlugins()
{
	QList<ExtensionError> errors;
	const QList<PluginEntryPoint> entryPoints = m_resolver.entryPoints(&errors);
	for (const ExtensionError& err : errors)
		warnDiscovery(err);

	for (const PluginEntryPoint& entryPoint : entryPoints) {
		installPlugin(m_kernel,
					  m_resolver,
					  std::make_shared<PluginSpec>(
						  entryPoint.name,
						  PackageSource{entryPoint.name, entryPoint.libraryPath, entryPoint.distributionVersion}));
	}
}

ExtensionError PluginManager::installStatic(const QString& module)
{
	QString version;
	if (const ExtensionError err = m_resolver.moduleVersion(module, version); !err.ok())
		return err;

	installPlugin(m_kernel, m_resolver, std::make_shared<PluginSpec>(module, StaticSource{module, version}));
	return ExtensionError::none();
}

QVariantList PluginManager::collect(const char* filter, const QVariantList& args, ExtensionError* errorOut) const
{
	ExtensionError err;
	const QVariant value = m_kernel.filters().apply(QString::fromLatin1(filter), QVariantList{}, args, &err);
	if (errorOut)
		*errorOut = err;
	// apply() already logged the failing entry.
	if (!err.ok())
		return {};
	return value.toList();
}

QList<PluginPtr> PluginManager::pluginsOf(const char* filter, ExtensionError* errorOut) const
{
	QList<PluginPtr> plugins = pluginsFromVariant(collect(filter, {}, errorOut));
	sortByName(plugins);
	return plugins;
}

QList<PluginPtr> PluginManager::installed(ExtensionError* errorOut) const
{
	return pluginsOf(Constants::FILTER_PLUGINS_INSTALLED, errorOut);
}

QList<PluginPtr> PluginManager::enabled(ExtensionError* errorOut) const
{
	return pluginsOf(Constants::FILTER_PLUGINS_ENABLED, errorOut);
}

bool PluginManager::isInstalled(const QString& name, ExtensionError* errorOut) const
{
	const QList<PluginPtr> plugins = installed(errorOut);
	return std::any_of(plugins.cbegin(), plugins.cend(), [&](const PluginPtr& p) { return p->name() == name; });
}

bool PluginManager::isEnabled(const QString& name, ExtensionError* errorOut) const
{
	const QList<PluginPtr> plugins = enabled(errorOut);
	return std::any_of(plugins.cbegin(), plugins.cend(), [&](const PluginPtr& p) { return p->name() == name; });
}

PluginPtr PluginManager::enabledPlugin(const QString& name, ExtensionError* errorOut) const
{
	ExtensionError err;
	const QList<PluginPtr> plugins = enabled(&err);
	if (errorOut)
		*errorOut = err;
	if (!err.ok())
		return {};

	for (const PluginPtr& plugin : plugins) {
		if (plugin->name() == name)
			return plugin;
	}

	if (errorOut)
		*errorOut = ExtensionError::notFound(QStringLiteral("Enabled plugin %1 could not be found.").arg(name));
	return {};
}

ExtensionError PluginManager::enable(QVariantMap& config, const QString& name) const
{
	ExtensionError err;
	const bool installed = isInstalled(name, &err);
	if (!err.ok())
		return err;
	if (!installed)
		return ExtensionError::notInstalled(QStringLiteral("plugin '%1' is not installed.").arg(name));

	QStringList names = ConfigComposer::enabledPluginNames(config, &err);
	if (!err.ok())
		return err;

	if (!names.contains(name)) {
		names.push_back(name);
		names.sort(Qt::CaseSensitive);
	}
	config.insert(QString::fromLatin1(Constants::PLUGINS_CONFIG_KEY), names);
	return ExtensionError::none();
}

ExtensionError PluginManager::disable(QVariantMap& config, const PluginPtr& plugin)
{
	return disablePlugin(m_kernel, config, plugin);
}

ExtensionError PluginManager::loadUserConfig(const QVariantMap& config)
{
	return m_kernel.actions().doAction(QString::fromLatin1(Constants::ACTION_CONFIG_USER_LOAD), {config});
}

QList<PluginPatch> PluginManager::patchesFor(const QString& patchName, ExtensionError* errorOut) const
{
	QList<PluginPatch> out;
	for (const QVariant& item : collect(Constants::FILTER_ENV_PATCHES, {patchName}, errorOut))
		out.push_back(item.value<PluginPatch>());
	return out;
}

QList<PluginHook> PluginManager::hooksFor(const QString& hookName, ExtensionError* errorOut) const
{
	QList<PluginHook> out;
	for (const QVariant& item : collect(Constants::FILTER_HOOKS_TASKS, {hookName}, errorOut))
		out.push_back(item.value<PluginHook>());
	return out;
}

QStringList PluginManager::templateRoots(ExtensionError* errorOut) const
{
	QStringList out;
	for (const QVariant& item : collect(Constants::FILTER_TEMPLATE_ROOTS, {}, errorOut))
		out.push_back(item.toString());
	return out;
}

QList<TemplateTarget> PluginManager::templateTargets(ExtensionError* errorOut) const
{
	QList<TemplateTarget> out;
	for (const QVariant& item : collect(Constants::FILTER_TEMPLATE_TARGETS, {}, errorOut))
		out.push_back(item.value<TemplateTarget>());
	return out;
}

QList<CliCommand> PluginManager::commands(ExtensionError* errorOut) const
{
	QList<CliCommand> out;
	for (const QVariant& item : collect(Constants::FILTER_CLI_COMMANDS, {}, errorOut))
		out.push_back(item.value<CliCommand>());
	return out;
}

std::optional<CliCommand> PluginManager::command(const QString& name, ExtensionError* errorOut) const
{
	std::optional<CliCommand> found;
	for (const CliCommand& cmd : commands(errorOut)) {
		if (cmd.name == name)
			found = cmd;
	}
	return found;
}

QString PluginManager::pluginsRoot()
{
	const QString fromEnv = qEnvironmentVariable(Constants::PLUGINS_ROOT_ENV_VAR);
	if (!fromEnv.isEmpty())
		return Utils::PathUtils::expandUser(fromEnv);

	return QDir(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation))
		.filePath(QString::fromLatin1(Constants::PLUGINS_ROOT_DIR_NAME));
}

} // namespace Stagehand

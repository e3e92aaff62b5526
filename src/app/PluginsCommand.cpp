// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "PluginsCommand.hpp"

#include <extensionsystem/ExtensionKernel.hpp>
#include <extensionsystem/PluginManager.hpp>
#include <extensionsystem/config/ConfigComposer.hpp>
#include <utils/PathUtils.hpp>
#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>
#include <QtCore/QTextStream>

#include <cstdlib>

namespace Stagehand::App {

namespace {

QTextStream& out()
{
	static QTextStream stream(stdout);
	return stream;
}

QString displayValue(const QVariant& value)
{
	const QJsonValue json = QJsonValue::fromVariant(value);
	if (json.isArray())
		return QString::fromUtf8(QJsonDocument(json.toArray()).toJson(QJsonDocument::Compact));
	if (json.isObject())
		return QString::fromUtf8(QJsonDocument(json.toObject()).toJson(QJsonDocument::Compact));
	return value.toString();
}

} // namespace

PluginsCommand::PluginsCommand(Stagehand::ExtensionKernel& kernel,
							   Stagehand::PluginManager& plugins,
							   QString root,
							   QVariantMap& config)
	: m_kernel(kernel)
	, m_plugins(plugins)
	, m_root(std::move(root))
	, m_config(config)
{
}

QString PluginsCommand::configPath(const QString& root)
{
	return QDir(root).filePath(QStringLiteral("config.json"));
}

int PluginsCommand::run(const QStringList& arguments)
{
	const QString sub = arguments.value(0);
	const QStringList rest = arguments.mid(1);

	if (sub == QStringLiteral("list"))
		return list();
	if (sub == QStringLiteral("enable"))
		return enable(rest);
	if (sub == QStringLiteral("disable"))
		return disable(rest);
	if (sub == QStringLiteral("printroot"))
		return printRoot();
	if (sub == QStringLiteral("install"))
		return install(rest);
	return usage();
}

int PluginsCommand::usage()
{
	out() << "Usage: stagehand plugins <list|enable|disable|printroot|install> [args...]" << Qt::endl;
	return EXIT_FAILURE;
}

int PluginsCommand::list()
{
	Stagehand::ExtensionError err;
	const QList<Stagehand::PluginPtr> installed = m_plugins.installed(&err);
	QStringList enabledNames;
	if (err.ok()) {
		for (const Stagehand::PluginPtr& plugin : m_plugins.enabled(&err))
			enabledNames << plugin->name();
	}
	if (!err.ok()) {
		qCCritical(stagehandAppLog).noquote() << err.message();
		return EXIT_FAILURE;
	}

	for (const Stagehand::PluginPtr& plugin : installed) {
		const QString status = enabledNames.contains(plugin->name()) ? QString() : QStringLiteral(" (disabled)");
		out() << plugin->name() << "==" << plugin->version() << status << Qt::endl;
	}
	return EXIT_SUCCESS;
}

int PluginsCommand::enable(const QStringList& names)
{
	for (const QString& name : names) {
		if (const Stagehand::ExtensionError err = m_plugins.enable(m_config, name); !err.ok()) {
			qCCritical(stagehandAppLog).noquote() << err.message();
			return EXIT_FAILURE;
		}
		qCInfo(stagehandAppLog).noquote() << "Plugin" << name << "enabled";
	}
	return saveConfig() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int PluginsCommand::disable(const QStringList& names)
{
	const bool disableAll = names.contains(QStringLiteral("all"));
	const Stagehand::ConfigComposer composer(m_kernel);

	Stagehand::ExtensionError err;
	const QList<Stagehand::PluginPtr> enabled = m_plugins.enabled(&err);
	if (!err.ok()) {
		qCCritical(stagehandAppLog).noquote() << err.message();
		return EXIT_FAILURE;
	}

	for (const Stagehand::PluginPtr& plugin : enabled) {
		if (!disableAll && !names.contains(plugin->name()))
			continue;

		qCInfo(stagehandAppLog).noquote() << "Disabling plugin" << plugin->name() << "...";

		const QVariantMap removed =
			composer.overridesLayer(Stagehand::Context::pluginContextName(plugin->name()), &err);
		if (!err.ok()) {
			qCCritical(stagehandAppLog).noquote() << err.message();
			return EXIT_FAILURE;
		}
		for (auto it = removed.cbegin(); it != removed.cend(); ++it)
			qCInfo(stagehandAppLog).noquote() << "    Removing config entry" << it.key() + QLatin1Char('=')
												  + displayValue(it.value());

		err = m_plugins.disable(m_config, plugin);
		if (!err.ok()) {
			qCCritical(stagehandAppLog).noquote() << err.message();
			return EXIT_FAILURE;
		}
		if (!deletePluginDir(plugin->name()))
			return EXIT_FAILURE;
		qCInfo(stagehandAppLog).noquote() << "    Plugin disabled";
	}
	return saveConfig() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int PluginsCommand::printRoot()
{
	out() << Stagehand::PluginManager::pluginsRoot() << Qt::endl;
	return EXIT_SUCCESS;
}

int PluginsCommand::install(const QStringList& arguments)
{
	const QString location = arguments.value(0);
	if (location.isEmpty())
		return usage();

	if (location.startsWith(QStringLiteral("http"))) {
		qCCritical(stagehandAppLog).noquote() << "Installing plugins from remote locations is not supported:"
											  << location;
		return EXIT_FAILURE;
	}
	if (!QFileInfo(location).isFile()) {
		qCCritical(stagehandAppLog).noquote() << "No plugin found at" << location;
		return EXIT_FAILURE;
	}

	const QString root = Stagehand::PluginManager::pluginsRoot();
	if (!QDir().mkpath(root)) {
		qCCritical(stagehandAppLog).noquote() << "Could not create plugin root" << root;
		return EXIT_FAILURE;
	}

	const QString fileName = Utils::PathUtils::ensureExtension(Utils::PathUtils::basename(location), u"json");
	const QString target = QDir(root).filePath(fileName);

	QString error;
	const QVariantMap document = Utils::JsonFileUtils::readMap(location, &error);
	if (!error.isEmpty() || !Utils::JsonFileUtils::writeMapAtomic(target, document, &error)) {
		qCCritical(stagehandAppLog).noquote() << error;
		return EXIT_FAILURE;
	}

	qCInfo(stagehandAppLog).noquote() << "Plugin installed at" << target;
	return EXIT_SUCCESS;
}

bool PluginsCommand::saveConfig()
{
	QString error;
	if (!QDir().mkpath(m_root) || !Utils::JsonFileUtils::writeMapAtomic(configPath(m_root), m_config, &error)) {
		qCCritical(stagehandAppLog).noquote() << "Failed to save configuration:" << error;
		return false;
	}
	qCInfo(stagehandAppLog) << "You should now re-generate your environment.";
	return true;
}

bool PluginsCommand::deletePluginDir(const QString& name)
{
	QDir pluginDir(QDir(m_root).filePath(QStringLiteral("plugins/%1").arg(name)));
	if (!pluginDir.exists())
		return true;
	if (!pluginDir.removeRecursively()) {
		qCCritical(stagehandAppLog).noquote()
			<< "Could not delete plugin" << name << "in folder" << pluginDir.absolutePath();
		return false;
	}
	return true;
}

} // namespace Stagehand::App

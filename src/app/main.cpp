// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineOption>
#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStringList>

#include <cstdlib>
#include <optional>

#include "PluginsCommand.hpp"

#include "extensionsystem/DefaultPluginResolver.hpp"
#include "extensionsystem/ExtensionKernel.hpp"
#include "extensionsystem/PluginManager.hpp"
#include "utils/filesystem/JsonFileUtils.hpp"

Q_LOGGING_CATEGORY(stagehandAppLog, "stagehand.app")

using namespace Stagehand;

static QString defaultPackageDir()
{
	QDir d(QCoreApplication::applicationDirPath());
	if (!d.cdUp())
		return {};
	if (!d.cd("lib"))
		return {};
	if (!d.cd("stagehand"))
		return {};
	if (!d.cd("plugins"))
		return {};
	return d.absolutePath();
}

static bool loadConfig(const QString& root, QVariantMap& config)
{
	const QString path = Stagehand::App::PluginsCommand::configPath(root);
	if (!QFileInfo::exists(path))
		return true;

	QString error;
	config = Utils::JsonFileUtils::readMap(path, &error);
	if (!error.isEmpty()) {
		qCCritical(stagehandAppLog).noquote() << error;
		return false;
	}
	return true;
}

int main(int argc, char** argv)
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("stagehand"));
	QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("Deployment configuration with plugins."));
	parser.addHelpOption();
	parser.addVersionOption();
	const QCommandLineOption rootOption({QStringLiteral("r"), QStringLiteral("root")},
										QStringLiteral("Project root holding config.json."),
										QStringLiteral("dir"),
										QDir::currentPath());
	parser.addOption(rootOption);
	parser.addPositionalArgument(QStringLiteral("command"),
								 QStringLiteral("\"plugins\" or the name of a plugin command."));
	parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
	parser.process(app);

	const QStringList arguments = parser.positionalArguments();
	if (arguments.isEmpty())
		parser.showHelp(EXIT_FAILURE);

	const QString root = QDir(parser.value(rootOption)).absolutePath();
	QVariantMap config;
	if (!loadConfig(root, config))
		return EXIT_FAILURE;

	ExtensionKernel kernel;
	DefaultPluginResolver resolver;
	if (const QString packageDir = defaultPackageDir(); !packageDir.isEmpty())
		resolver.setPackageDirs({packageDir});
	PluginManager plugins(kernel, resolver);

	if (const ExtensionError err = plugins.loadUserConfig(config); !err.ok()) {
		qCCritical(stagehandAppLog).noquote() << errorCodeName(err.code()) << err.message();
		return EXIT_FAILURE;
	}

	const QString command = arguments.first();
	if (command == QStringLiteral("plugins")) {
		Stagehand::App::PluginsCommand pluginsCommand(kernel, plugins, root, config);
		return pluginsCommand.run(arguments.mid(1));
	}

	ExtensionError err;
	const std::optional<CliCommand> pluginCommand = plugins.command(command, &err);
	if (!err.ok()) {
		qCCritical(stagehandAppLog).noquote() << errorCodeName(err.code()) << err.message();
		return EXIT_FAILURE;
	}
	if (pluginCommand && pluginCommand->invoke)
		return pluginCommand->invoke(arguments.mid(1));

	qCCritical(stagehandAppLog).noquote() << "Unknown command" << command;
	return EXIT_FAILURE;
}

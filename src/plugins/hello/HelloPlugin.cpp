// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <extensionsystem/IPluginModule.hpp>

#include <QtCore/QLoggingCategory>
#include <QtCore/QObject>
#include <QtCore/QTextStream>

Q_LOGGING_CATEGORY(hellolog, "stagehand.hello")

namespace Hello::Internal {

class HelloPlugin final : public QObject, public Stagehand::IPluginModule {
	Q_OBJECT
	Q_PLUGIN_METADATA(IID STAGEHAND_PLUGIN_MODULE_IID FILE "Hello.json")
	Q_INTERFACES(Stagehand::IPluginModule)

public:
	HelloPlugin() = default;

	void contribute(Stagehand::PluginManifest& manifest) override;
};

void HelloPlugin::contribute(Stagehand::PluginManifest& manifest)
{
	qCDebug(hellolog) << "HelloPlugin: contribute";

	manifest.config = QVariantMap{
		{QStringLiteral("add"), QVariantMap{{QStringLiteral("GREETING"), QStringLiteral("Hello")}}},
		{QStringLiteral("defaults"), QVariantMap{{QStringLiteral("TARGET"), QStringLiteral("{{ LMS_HOST }}")}}},
	};
	manifest.patches = QVariantMap{
		{QStringLiteral("local-docker-compose-services"), QStringLiteral("hello:\n  image: hello-world\n")},
	};
	manifest.hooks = QVariantMap{
		{QStringLiteral("init"), QStringList{QStringLiteral("hello")}},
	};

	Stagehand::CliCommand command;
	command.help = QStringLiteral("Print a greeting");
	command.invoke = [](const QStringList& arguments) {
		QTextStream out(stdout);
		out << "Hello " << (arguments.isEmpty() ? QStringLiteral("world") : arguments.join(QLatin1Char(' ')))
			<< Qt::endl;
		return 0;
	};
	manifest.command = std::move(command);
}

} // namespace Hello::Internal

#include "HelloPlugin.moc"

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariantMap>

Q_DECLARE_LOGGING_CATEGORY(stagehandAppLog)

namespace Stagehand {
class ExtensionKernel;
class PluginManager;
} // namespace Stagehand

namespace Stagehand::App {

// "stagehand plugins ..." subcommands. Commands that change the enabled set
// persist the configuration back to <root>/config.json.
class PluginsCommand final {
public:
	PluginsCommand(Stagehand::ExtensionKernel& kernel,
				   Stagehand::PluginManager& plugins,
				   QString root,
				   QVariantMap& config);

	int run(const QStringList& arguments);

	static QString configPath(const QString& root);

private:
	int list();
	int enable(const QStringList& names);
	int disable(const QStringList& names);
	int printRoot();
	int install(const QStringList& arguments);
	int usage();

	bool saveConfig();
	bool deletePluginDir(const QString& name);

	Stagehand::ExtensionKernel& m_kernel;
	Stagehand::PluginManager& m_plugins;
	QString m_root;
	QVariantMap& m_config;
};

} // namespace Stagehand::App

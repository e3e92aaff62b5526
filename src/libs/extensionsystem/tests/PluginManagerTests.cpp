// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "FakePluginResolver.hpp"

#include "extensionsystem/ExtensionKernel.hpp"
#include "extensionsystem/PluginLifecycle.hpp"
#include "extensionsystem/PluginManager.hpp"
#include "extensionsystem/config/ConfigComposer.hpp"

#include <QtCore/QDir>

using namespace Stagehand;
using Stagehand::Tests::FakePluginResolver;
using Stagehand::Tests::ScopedEnvironmentVariable;
using Stagehand::Tests::configManifestField;

namespace {

QStringList namesOf(const QList<PluginPtr>& plugins)
{
	QStringList out;
	for (const PluginPtr& plugin : plugins)
		out << plugin->name();
	return out;
}

class PluginManagerTests : public ::testing::Test {
protected:
	void addStatic(const QString& name, PluginManifest manifest = {})
	{
		resolver.addModule(name, std::move(manifest));
		const ExtensionError err = manager.installStatic(name);
		ASSERT_TRUE(err.ok()) << err.message().toStdString();
	}

	ExtensionKernel kernel;
	FakePluginResolver resolver;
	PluginManager manager{kernel, resolver};
};

} // namespace

TEST_F(PluginManagerTests, InstallStaticUsesModuleVersion)
{
	resolver.addModule(QStringLiteral("minio"), {}, QStringLiteral("12.0.1"));
	ASSERT_TRUE(manager.installStatic(QStringLiteral("minio")).ok());

	const QList<PluginPtr> installed = manager.installed();
	ASSERT_EQ(installed.size(), 1);
	EXPECT_EQ(installed.first()->version(), QStringLiteral("12.0.1"));
	EXPECT_EQ(installed.first()->sourceKind(), QStringLiteral("static"));
}

TEST_F(PluginManagerTests, InstallStaticRequiresVersion)
{
	resolver.addModule(QStringLiteral("minio"), {}, QString());
	EXPECT_EQ(manager.installStatic(QStringLiteral("minio")).code(), ExtensionErrorCode::Validation);
	EXPECT_EQ(manager.installStatic(QStringLiteral("unknown")).code(), ExtensionErrorCode::Discovery);
	EXPECT_TRUE(manager.installed().isEmpty());
}

TEST_F(PluginManagerTests, InstalledIsSortedAndKeepsDuplicateNames)
{
	addStatic(QStringLiteral("zeta"));
	addStatic(QStringLiteral("alpha"));
	installPlugin(kernel, resolver,
				  std::make_shared<PluginSpec>(QStringLiteral("zeta"),
											   FileSource{QStringLiteral("/tmp/zeta.json"), QVariantMap{}}));

	const QList<PluginPtr> installed = manager.installed();
	EXPECT_EQ(namesOf(installed),
			  (QStringList{QStringLiteral("alpha"), QStringLiteral("zeta"), QStringLiteral("zeta")}));
	// Stable: the static zeta was installed first.
	EXPECT_EQ(installed.at(1)->sourceKind(), QStringLiteral("static"));
	EXPECT_EQ(installed.at(2)->sourceKind(), QStringLiteral("file"));
}

TEST_F(PluginManagerTests, EnableIsIdempotentOnPluginsList)
{
	addStatic(QStringLiteral("p"));

	QVariantMap config;
	ASSERT_TRUE(manager.enable(config, QStringLiteral("p")).ok());
	ASSERT_TRUE(manager.enable(config, QStringLiteral("p")).ok());
	EXPECT_EQ(config.value(QStringLiteral("PLUGINS")).toStringList(), QStringList{QStringLiteral("p")});
}

TEST_F(PluginManagerTests, EnableKeepsNamesSorted)
{
	addStatic(QStringLiteral("plugin1"));
	addStatic(QStringLiteral("plugin2"));

	QVariantMap config;
	ASSERT_TRUE(manager.enable(config, QStringLiteral("plugin2")).ok());
	ASSERT_TRUE(manager.enable(config, QStringLiteral("plugin1")).ok());
	EXPECT_EQ(config.value(QStringLiteral("PLUGINS")).toStringList(),
			  (QStringList{QStringLiteral("plugin1"), QStringLiteral("plugin2")}));
}

TEST_F(PluginManagerTests, EnableReplacesNullPluginsAndRejectsOtherShapes)
{
	addStatic(QStringLiteral("p"));

	QVariantMap config{{QStringLiteral("PLUGINS"), QVariant::fromValue(nullptr)}};
	ASSERT_TRUE(manager.enable(config, QStringLiteral("p")).ok());
	EXPECT_EQ(config.value(QStringLiteral("PLUGINS")).toStringList(), QStringList{QStringLiteral("p")});

	QVariantMap broken{{QStringLiteral("PLUGINS"), 3}};
	EXPECT_EQ(manager.enable(broken, QStringLiteral("p")).code(), ExtensionErrorCode::Validation);
}

TEST_F(PluginManagerTests, EnableUnknownPluginIsNotInstalled)
{
	QVariantMap config;
	const ExtensionError err = manager.enable(config, QStringLiteral("ghost"));
	EXPECT_EQ(err.code(), ExtensionErrorCode::NotInstalled);
	EXPECT_TRUE(err.message().contains(QStringLiteral("ghost")));
	EXPECT_FALSE(config.contains(QStringLiteral("PLUGINS")));
}

TEST_F(PluginManagerTests, EnabledPluginLookup)
{
	addStatic(QStringLiteral("p"));
	ExtensionError err;
	EXPECT_EQ(manager.enabledPlugin(QStringLiteral("p"), &err), nullptr);
	EXPECT_EQ(err.code(), ExtensionErrorCode::NotFound);

	ASSERT_TRUE(manager.loadUserConfig({{QStringLiteral("PLUGINS"), QStringList{QStringLiteral("p")}}}).ok());
	const PluginPtr plugin = manager.enabledPlugin(QStringLiteral("p"), &err);
	ASSERT_NE(plugin, nullptr);
	EXPECT_TRUE(err.ok());
	EXPECT_EQ(plugin->state(), PluginState::Enabled);
}

TEST_F(PluginManagerTests, ConfigLoadEnablesListedPluginsOnce)
{
	addStatic(QStringLiteral("p1"));
	addStatic(QStringLiteral("p2"));

	const QVariantMap config{{QStringLiteral("PLUGINS"), QStringList{QStringLiteral("p1")}}};
	ASSERT_TRUE(manager.loadUserConfig(config).ok());
	ASSERT_TRUE(manager.loadUserConfig(config).ok());

	EXPECT_EQ(namesOf(manager.enabled()), QStringList{QStringLiteral("p1")});
	EXPECT_FALSE(manager.isEnabled(QStringLiteral("p2")));
}

TEST_F(PluginManagerTests, ConfigLoadToleratesUninstalledNames)
{
	addStatic(QStringLiteral("p1"));
	const QVariantMap config{{QStringLiteral("PLUGINS"), QStringList{QStringLiteral("gone"), QStringLiteral("p1")}}};
	ASSERT_TRUE(manager.loadUserConfig(config).ok());
	EXPECT_EQ(namesOf(manager.enabled()), QStringList{QStringLiteral("p1")});
}

TEST_F(PluginManagerTests, ConfigLoadPropagatesValidationFailures)
{
	PluginManifest manifest;
	manifest.config = QVariantList{};
	addStatic(QStringLiteral("broken"), manifest);

	const ExtensionError err =
		manager.loadUserConfig({{QStringLiteral("PLUGINS"), QStringList{QStringLiteral("broken")}}});
	EXPECT_EQ(err.code(), ExtensionErrorCode::Validation);
	EXPECT_TRUE(err.message().contains(QStringLiteral("plugins:broken:enable")));
	EXPECT_TRUE(err.message().contains(QStringLiteral("Invalid config in plugin broken")));
}

TEST_F(PluginManagerTests, LastEnabledPluginWinsSetCollisions)
{
	PluginManifest alpha;
	alpha.config = configManifestField({}, {{QStringLiteral("SHARED"), QStringLiteral("alpha")}});
	PluginManifest beta;
	beta.config = configManifestField({}, {{QStringLiteral("SHARED"), QStringLiteral("beta")}});
	addStatic(QStringLiteral("beta"), beta);
	addStatic(QStringLiteral("alpha"), alpha);

	QVariantMap config;
	ASSERT_TRUE(manager.enable(config, QStringLiteral("beta")).ok());
	ASSERT_TRUE(manager.enable(config, QStringLiteral("alpha")).ok());
	ASSERT_TRUE(manager.loadUserConfig(config).ok());

	const ConfigComposer composer(kernel);
	EXPECT_EQ(composer.baseLayer().value(QStringLiteral("SHARED")).toString(), QStringLiteral("beta"));
	EXPECT_EQ(composer.overridesLayer().value(QStringLiteral("SHARED")).toString(), QStringLiteral("beta"));
}

TEST_F(PluginManagerTests, PatchesForReturnsOnlyQueriedPatch)
{
	PluginManifest manifest;
	manifest.patches = QVariantMap{{QStringLiteral("patch1"), QStringLiteral("Hello {{ ID }}")}};
	addStatic(QStringLiteral("plugin1"), manifest);
	ASSERT_TRUE(manager.loadUserConfig({{QStringLiteral("PLUGINS"), QStringList{QStringLiteral("plugin1")}}}).ok());

	const QList<PluginPatch> patches = manager.patchesFor(QStringLiteral("patch1"));
	ASSERT_EQ(patches.size(), 1);
	EXPECT_EQ(patches.first(), (PluginPatch{QStringLiteral("plugin1"), QStringLiteral("Hello {{ ID }}")}));
	EXPECT_TRUE(manager.patchesFor(QStringLiteral("patch2")).isEmpty());
}

TEST_F(PluginManagerTests, FailingPatchContributionReachesCaller)
{
	PluginManifest manifest;
	manifest.patches = QVariantMap{{QStringLiteral("patch1"), QStringLiteral("Hello")}};
	addStatic(QStringLiteral("plugin1"), manifest);
	ASSERT_TRUE(manager.loadUserConfig({{QStringLiteral("PLUGINS"), QStringList{QStringLiteral("plugin1")}}}).ok());

	kernel.filters().add(QStringLiteral("env:patches"), [](QVariant&, const QVariantList&) {
		return ExtensionError::validation(QStringLiteral("patch renderer unavailable"));
	});

	ExtensionError err;
	EXPECT_TRUE(manager.patchesFor(QStringLiteral("patch1"), &err).isEmpty());
	EXPECT_EQ(err.code(), ExtensionErrorCode::Validation);
	EXPECT_TRUE(err.message().contains(QStringLiteral("'env:patches'")));
	EXPECT_TRUE(err.message().contains(QStringLiteral("patch renderer unavailable")));
}

TEST_F(PluginManagerTests, EnableReportsFailingInstalledQuery)
{
	addStatic(QStringLiteral("plugin1"));
	kernel.filters().add(QStringLiteral("plugins:installed"), [](QVariant&, const QVariantList&) {
		return ExtensionError::discovery(QStringLiteral("registry offline"));
	});

	QVariantMap config;
	const ExtensionError err = manager.enable(config, QStringLiteral("plugin1"));
	EXPECT_EQ(err.code(), ExtensionErrorCode::Discovery);
	EXPECT_TRUE(err.message().contains(QStringLiteral("registry offline")));
	EXPECT_FALSE(config.contains(QStringLiteral("PLUGINS")));

	ExtensionError queryErr;
	EXPECT_FALSE(manager.isInstalled(QStringLiteral("plugin1"), &queryErr));
	EXPECT_EQ(queryErr.code(), ExtensionErrorCode::Discovery);
}

TEST_F(PluginManagerTests, EnabledPluginReportsFailingQueryInsteadOfNotFound)
{
	kernel.filters().add(QStringLiteral("plugins:enabled"), [](QVariant&, const QVariantList&) {
		return ExtensionError::validation(QStringLiteral("bad entry"));
	});

	ExtensionError err;
	EXPECT_EQ(manager.enabledPlugin(QStringLiteral("plugin1"), &err), nullptr);
	EXPECT_EQ(err.code(), ExtensionErrorCode::Validation);
}

TEST_F(PluginManagerTests, CommandLookupTakesLastRegistered)
{
	auto commandWithHelp = [](const QString& help) {
		PluginManifest manifest;
		manifest.command = CliCommand{QStringLiteral("cmd"), help, [](const QStringList&) { return 0; }};
		return manifest;
	};

	const auto first = std::make_shared<PluginSpec>(QStringLiteral("dup"),
													StaticSource{QStringLiteral("dup-a"), QStringLiteral("1")});
	const auto second = std::make_shared<PluginSpec>(QStringLiteral("dup"),
													 StaticSource{QStringLiteral("dup-b"), QStringLiteral("1")});
	resolver.addModule(QStringLiteral("dup-a"), commandWithHelp(QStringLiteral("first")));
	resolver.addModule(QStringLiteral("dup-b"), commandWithHelp(QStringLiteral("second")));
	installPlugin(kernel, resolver, first);
	installPlugin(kernel, resolver, second);

	// Both plugins named "dup" share one trigger action.
	ASSERT_TRUE(manager.loadUserConfig({{QStringLiteral("PLUGINS"), QStringList{QStringLiteral("dup")}}}).ok());

	EXPECT_EQ(manager.commands().size(), 2);
	EXPECT_EQ(manager.enabled().size(), 2);
	const std::optional<CliCommand> command = manager.command(QStringLiteral("dup"));
	ASSERT_TRUE(command.has_value());
	EXPECT_EQ(command->help, QStringLiteral("second"));
}

TEST(PluginManagerRootTests, PluginsRootHonoursEnvironment)
{
	{
		const ScopedEnvironmentVariable env("STAGEHAND_PLUGINS_ROOT", "~/my-plugins");
		EXPECT_EQ(PluginManager::pluginsRoot(), QDir::homePath() + QStringLiteral("/my-plugins"));
	}
	{
		const ScopedEnvironmentVariable env("STAGEHAND_PLUGINS_ROOT", QByteArray());
		EXPECT_TRUE(PluginManager::pluginsRoot().endsWith(QStringLiteral("/stagehand-plugins")));
	}
}

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "FakePluginResolver.hpp"

#include "extensionsystem/ExtensionKernel.hpp"
#include "extensionsystem/ExtensionSystemConstants.hpp"
#include "extensionsystem/PluginLifecycle.hpp"
#include "extensionsystem/PluginManager.hpp"

using namespace Stagehand;
using Stagehand::Tests::FakePluginResolver;
using Stagehand::Tests::configManifestField;
using Stagehand::Tests::makeStaticPlugin;

namespace {

const QString kConfigBase = QString::fromLatin1(Constants::FILTER_CONFIG_BASE);
const QString kPatches = QString::fromLatin1(Constants::FILTER_ENV_PATCHES);
const QString kHooks = QString::fromLatin1(Constants::FILTER_HOOKS_TASKS);

class PluginLifecycleTests : public ::testing::Test {
protected:
	ExtensionError installAndEnable(const PluginPtr& plugin)
	{
		installPlugin(kernel, resolver, plugin);
		return kernel.actions().doAction(enableActionName(plugin->name()));
	}

	ExtensionKernel kernel;
	FakePluginResolver resolver;
	PluginManager manager{kernel, resolver};
};

} // namespace

TEST_F(PluginLifecycleTests, InstallRegistersTriggerWithoutEnabling)
{
	const PluginPtr plugin = makeStaticPlugin(resolver, QStringLiteral("minio"));
	installPlugin(kernel, resolver, plugin);

	EXPECT_EQ(plugin->state(), PluginState::Installed);
	EXPECT_TRUE(kernel.actions().contains(QStringLiteral("plugins:minio:enable")));
	EXPECT_TRUE(manager.isInstalled(QStringLiteral("minio")));
	EXPECT_FALSE(manager.isEnabled(QStringLiteral("minio")));
	EXPECT_FALSE(plugin->hasLoadedManifest());
}

TEST_F(PluginLifecycleTests, TriggerEnablesAndRegistersUnderPluginContext)
{
	PluginManifest manifest;
	manifest.config = configManifestField({{QStringLiteral("PARAM1"), QStringLiteral("value1")}}, {});
	const PluginPtr plugin = makeStaticPlugin(resolver, QStringLiteral("plugin1"), manifest);

	ASSERT_TRUE(installAndEnable(plugin).ok());
	EXPECT_EQ(plugin->state(), PluginState::Enabled);
	EXPECT_TRUE(manager.isEnabled(QStringLiteral("plugin1")));
	EXPECT_EQ(kernel.contexts().depth(), 0);

	const QVariantMap scoped = kernel.filters()
								   .applyIn(kConfigBase, QStringLiteral("plugins:plugin1"), QVariantMap{})
								   .toMap();
	EXPECT_EQ(scoped.value(QStringLiteral("PLUGIN1_PARAM1")).toString(), QStringLiteral("value1"));

	const QVariantMap other = kernel.filters()
								  .applyIn(kConfigBase, QStringLiteral("plugins:other"), QVariantMap{})
								  .toMap();
	EXPECT_TRUE(other.isEmpty());
}

TEST_F(PluginLifecycleTests, ManifestIsResolvedOnce)
{
	const PluginPtr plugin = makeStaticPlugin(resolver, QStringLiteral("minio"));
	ASSERT_TRUE(enablePlugin(kernel, resolver, plugin).ok());
	ASSERT_TRUE(enablePlugin(kernel, resolver, plugin).ok());
	EXPECT_EQ(resolver.loadCount(), 1);
}

TEST_F(PluginLifecycleTests, ManifestLoadFailureIsReported)
{
	const auto plugin = std::make_shared<PluginSpec>(QStringLiteral("ghost"),
													 StaticSource{QStringLiteral("ghost"), QStringLiteral("1.0")});
	const ExtensionError err = enablePlugin(kernel, resolver, plugin);
	EXPECT_EQ(err.code(), ExtensionErrorCode::Discovery);
	EXPECT_FALSE(plugin->hasLoadedManifest());
}

TEST_F(PluginLifecycleTests, ConfigAsListIsRejectedAndRegistersNothing)
{
	PluginManifest manifest;
	manifest.config = QVariantList{QStringLiteral("PARAM1")};
	const PluginPtr plugin = makeStaticPlugin(resolver, QStringLiteral("plugin1"), manifest);

	const ExtensionError err = enablePlugin(kernel, resolver, plugin);
	EXPECT_EQ(err.code(), ExtensionErrorCode::Validation);
	EXPECT_TRUE(err.message().contains(QStringLiteral("plugin1")));
	EXPECT_TRUE(err.message().contains(QStringLiteral("Expected map, got list")));
	EXPECT_FALSE(kernel.filters().contains(kConfigBase));
	EXPECT_FALSE(kernel.filters().contains(QString::fromLatin1(Constants::FILTER_CONFIG_OVERRIDES)));
}

TEST_F(PluginLifecycleTests, ConfigEntryMustBeMap)
{
	PluginManifest manifest;
	manifest.config = QVariantMap{{QStringLiteral("add"), QStringLiteral("PARAM1")}};
	const PluginPtr plugin = makeStaticPlugin(resolver, QStringLiteral("plugin1"), manifest);

	const ExtensionError err = enablePlugin(kernel, resolver, plugin);
	EXPECT_EQ(err.code(), ExtensionErrorCode::Validation);
	EXPECT_TRUE(err.message().contains(QStringLiteral("config entry 'add'")));
}

TEST_F(PluginLifecycleTests, UnknownConfigSubKeysAreIgnored)
{
	PluginManifest manifest;
	manifest.config = QVariantMap{{QStringLiteral("extra"), QVariantMap{{QStringLiteral("K"), 1}}}};
	const PluginPtr plugin = makeStaticPlugin(resolver, QStringLiteral("plugin1"), manifest);

	ASSERT_TRUE(enablePlugin(kernel, resolver, plugin).ok());
	EXPECT_TRUE(kernel.filters().apply(kConfigBase, QVariantMap{}).toMap().isEmpty());
}

TEST_F(PluginLifecycleTests, PartialEnableKeepsEarlierRegistrations)
{
	PluginManifest manifest;
	manifest.config = configManifestField({{QStringLiteral("PARAM1"), QStringLiteral("value1")}}, {});
	manifest.patches = QVariantMap{{QStringLiteral("patch1"), 12}};
	manifest.hooks = QVariantMap{{QStringLiteral("init"), QStringList{QStringLiteral("minio")}}};
	const PluginPtr plugin = makeStaticPlugin(resolver, QStringLiteral("plugin1"), manifest);

	const ExtensionError err = enablePlugin(kernel, resolver, plugin);
	EXPECT_EQ(err.code(), ExtensionErrorCode::Validation);
	EXPECT_TRUE(err.message().contains(QStringLiteral("patch 'patch1'")));

	EXPECT_TRUE(kernel.filters().contains(kConfigBase));
	EXPECT_FALSE(kernel.filters().contains(kPatches));
	EXPECT_FALSE(kernel.filters().contains(kHooks));
	EXPECT_TRUE(manager.isEnabled(QStringLiteral("plugin1")));
}

TEST_F(PluginLifecycleTests, HookShapesAreValidated)
{
	const QList<QVariant> invalidHooks{
		12,
		QVariantList{QStringLiteral("ok"), 3},
		QVariantMap{{QStringLiteral("image"), QVariantList{}}},
	};

	for (qsizetype i = 0; i < invalidHooks.size(); ++i) {
		PluginManifest manifest;
		manifest.hooks = QVariantMap{{QStringLiteral("init"), invalidHooks.at(i)}};
		const PluginPtr plugin = makeStaticPlugin(resolver, QStringLiteral("bad%1").arg(i), manifest);

		const ExtensionError err = enablePlugin(kernel, resolver, plugin);
		EXPECT_EQ(err.code(), ExtensionErrorCode::Validation) << i;
		EXPECT_TRUE(err.message().contains(QStringLiteral("bad%1").arg(i))) << i;
	}
	EXPECT_FALSE(kernel.filters().contains(kHooks));
}

TEST_F(PluginLifecycleTests, HooksContributeWhenPresentAndNonEmpty)
{
	PluginManifest manifest;
	manifest.hooks = QVariantMap{
		{QStringLiteral("init"), QStringList{QStringLiteral("minio")}},
		{QStringLiteral("build-image"), QVariantMap{{QStringLiteral("minio"), QStringLiteral("overhangio/minio")}}},
		{QStringLiteral("pre-init"), QVariantList{}},
	};
	ASSERT_TRUE(installAndEnable(makeStaticPlugin(resolver, QStringLiteral("minio"), manifest)).ok());

	const QList<PluginHook> init = manager.hooksFor(QStringLiteral("init"));
	ASSERT_EQ(init.size(), 1);
	EXPECT_EQ(init.first().plugin, QStringLiteral("minio"));
	EXPECT_EQ(init.first().hook.toStringList(), QStringList{QStringLiteral("minio")});

	const QList<PluginHook> images = manager.hooksFor(QStringLiteral("build-image"));
	ASSERT_EQ(images.size(), 1);
	EXPECT_EQ(images.first().hook.toMap().value(QStringLiteral("minio")).toString(),
			  QStringLiteral("overhangio/minio"));

	EXPECT_TRUE(manager.hooksFor(QStringLiteral("pre-init")).isEmpty());
	EXPECT_TRUE(manager.hooksFor(QStringLiteral("missing")).isEmpty());
}

TEST_F(PluginLifecycleTests, TemplatesRootMustBeString)
{
	PluginManifest manifest;
	manifest.templates = QVariantList{};
	const ExtensionError err = enablePlugin(kernel, resolver, makeStaticPlugin(resolver, QStringLiteral("p"), manifest));
	EXPECT_EQ(err.code(), ExtensionErrorCode::Validation);
	EXPECT_TRUE(err.message().contains(QStringLiteral("templates")));
}

TEST_F(PluginLifecycleTests, TemplatesRegisterRootAndTargets)
{
	PluginManifest manifest;
	manifest.templates = QStringLiteral("/opt/minio/templates");
	ASSERT_TRUE(installAndEnable(makeStaticPlugin(resolver, QStringLiteral("minio"), manifest)).ok());

	EXPECT_EQ(manager.templateRoots(), QStringList{QStringLiteral("/opt/minio/templates")});
	const QList<TemplateTarget> targets = manager.templateTargets();
	ASSERT_EQ(targets.size(), 2);
	EXPECT_EQ(targets.at(0), (TemplateTarget{QStringLiteral("minio/apps"), QStringLiteral("plugins")}));
	EXPECT_EQ(targets.at(1), (TemplateTarget{QStringLiteral("minio/build"), QStringLiteral("plugins")}));
}

TEST_F(PluginLifecycleTests, CommandIsRenamedToPluginName)
{
	PluginManifest manifest;
	manifest.command = CliCommand{QStringLiteral("whatever"), QStringLiteral("help"), [](const QStringList& args) {
									  return static_cast<int>(args.size());
								  }};
	ASSERT_TRUE(installAndEnable(makeStaticPlugin(resolver, QStringLiteral("minio"), manifest)).ok());

	const std::optional<CliCommand> command = manager.command(QStringLiteral("minio"));
	ASSERT_TRUE(command.has_value());
	EXPECT_EQ(command->name, QStringLiteral("minio"));
	EXPECT_EQ(command->invoke({QStringLiteral("a"), QStringLiteral("b")}), 2);
	EXPECT_FALSE(manager.command(QStringLiteral("whatever")).has_value());
}

TEST_F(PluginLifecycleTests, DisableRemovesSetKeysAndNameButKeepsUnrelatedKeys)
{
	PluginManifest manifest;
	manifest.config = configManifestField({{QStringLiteral("PARAM1"), QStringLiteral("value1")}},
										  {{QStringLiteral("PARAM3"), QStringLiteral("value3")}});
	const PluginPtr plugin = makeStaticPlugin(resolver, QStringLiteral("plugin1"), manifest);
	ASSERT_TRUE(installAndEnable(plugin).ok());

	QVariantMap config{
		{QStringLiteral("PLUGINS"), QStringList{QStringLiteral("other"), QStringLiteral("plugin1")}},
		{QStringLiteral("PARAM3"), QStringLiteral("value3")},
		{QStringLiteral("UNRELATED"), QStringLiteral("kept")},
	};

	ASSERT_TRUE(manager.disable(config, plugin).ok());

	EXPECT_FALSE(config.contains(QStringLiteral("PARAM3")));
	EXPECT_EQ(config.value(QStringLiteral("UNRELATED")).toString(), QStringLiteral("kept"));
	EXPECT_EQ(config.value(QStringLiteral("PLUGINS")).toStringList(), QStringList{QStringLiteral("other")});

	EXPECT_EQ(plugin->state(), PluginState::Installed);
	EXPECT_FALSE(manager.isEnabled(QStringLiteral("plugin1")));
	EXPECT_TRUE(manager.isInstalled(QStringLiteral("plugin1")));
	EXPECT_TRUE(kernel.actions().contains(QStringLiteral("plugins:plugin1:enable")));
	EXPECT_FALSE(kernel.filters().contains(kConfigBase));
}

TEST_F(PluginLifecycleTests, DisableKeepsKeysOfUnscopedOverrides)
{
	kernel.filters().add(QString::fromLatin1(Constants::FILTER_CONFIG_OVERRIDES),
						 [](const QVariant& value, const QVariantList&) -> QVariant {
							 QVariantMap out = value.toMap();
							 out.insert(QStringLiteral("LMS_HOST"), QStringLiteral("host.local"));
							 return out;
						 });

	PluginManifest manifest;
	manifest.config = configManifestField({}, {{QStringLiteral("PARAM3"), QStringLiteral("value3")}});
	const PluginPtr plugin = makeStaticPlugin(resolver, QStringLiteral("plugin1"), manifest);
	ASSERT_TRUE(installAndEnable(plugin).ok());

	QVariantMap config{
		{QStringLiteral("LMS_HOST"), QStringLiteral("user.local")},
		{QStringLiteral("PARAM3"), QStringLiteral("value3")},
	};
	ASSERT_TRUE(disablePlugin(kernel, config, plugin).ok());

	EXPECT_EQ(config.value(QStringLiteral("LMS_HOST")).toString(), QStringLiteral("user.local"));
	EXPECT_FALSE(config.contains(QStringLiteral("PARAM3")));
	EXPECT_EQ(kernel.filters().count(QString::fromLatin1(Constants::FILTER_CONFIG_OVERRIDES)), 1);
}

TEST_F(PluginLifecycleTests, DisableLeavesOtherPluginsAlone)
{
	PluginManifest first;
	first.patches = QVariantMap{{QStringLiteral("patch1"), QStringLiteral("one")}};
	PluginManifest second;
	second.patches = QVariantMap{{QStringLiteral("patch1"), QStringLiteral("two")}};

	const PluginPtr one = makeStaticPlugin(resolver, QStringLiteral("one"), first);
	ASSERT_TRUE(installAndEnable(one).ok());
	ASSERT_TRUE(installAndEnable(makeStaticPlugin(resolver, QStringLiteral("two"), second)).ok());

	QVariantMap config;
	ASSERT_TRUE(disablePlugin(kernel, config, one).ok());

	const QList<PluginPatch> patches = manager.patchesFor(QStringLiteral("patch1"));
	ASSERT_EQ(patches.size(), 1);
	EXPECT_EQ(patches.first(), (PluginPatch{QStringLiteral("two"), QStringLiteral("two")}));
	EXPECT_FALSE(config.contains(QStringLiteral("PLUGINS")));
}

TEST_F(PluginLifecycleTests, DisableResetsEveryPluginSharingTheName)
{
	const PluginPtr first = makeStaticPlugin(resolver, QStringLiteral("dup"));
	const PluginPtr second =
		std::make_shared<PluginSpec>(QStringLiteral("dup"), StaticSource{QStringLiteral("dup"), QStringLiteral("2.0.0")});
	installPlugin(kernel, resolver, first);
	installPlugin(kernel, resolver, second);
	ASSERT_TRUE(kernel.actions().doAction(enableActionName(QStringLiteral("dup"))).ok());
	ASSERT_EQ(second->state(), PluginState::Enabled);

	QVariantMap config;
	ASSERT_TRUE(disablePlugin(kernel, config, first).ok());

	EXPECT_EQ(first->state(), PluginState::Installed);
	EXPECT_EQ(second->state(), PluginState::Installed);
	EXPECT_FALSE(manager.isEnabled(QStringLiteral("dup")));
	EXPECT_EQ(manager.installed().size(), 2);
}

TEST_F(PluginLifecycleTests, DisableRejectsNonListPlugins)
{
	const PluginPtr plugin = makeStaticPlugin(resolver, QStringLiteral("plugin1"));
	ASSERT_TRUE(installAndEnable(plugin).ok());

	QVariantMap config{{QStringLiteral("PLUGINS"), QStringLiteral("plugin1")}};
	EXPECT_EQ(disablePlugin(kernel, config, plugin).code(), ExtensionErrorCode::Validation);
	EXPECT_TRUE(manager.isEnabled(QStringLiteral("plugin1")));
}

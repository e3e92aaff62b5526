// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "PluginLifecycle.hpp"

#include "ExtensionKernel.hpp"
#include "ExtensionSystemConstants.hpp"
#include "IPluginResolver.hpp"
#include "config/ConfigComposer.hpp"

#include <QtCore/QDebug>

namespace Stagehand {

namespace {

struct ConfigContribution {
	QVariantMap add;
	QVariantMap set;
	QVariantMap defaults;
};

QString upperPrefix(const QString& pluginName)
{
	return pluginName.toUpper() + QLatin1Char('_');
}

ExtensionError invalidField(const QString& plugin, const QString& field, const QString& expected,
							const QVariant& actual)
{
	return ExtensionError::validation(QStringLiteral("Invalid %1 in plugin %2. Expected %3, got %4.")
										  .arg(field, plugin, expected, variantShapeName(actual)));
}

ExtensionError parseConfig(const QString& plugin, const QVariant& raw, ConfigContribution& out)
{
	if (!isMapValue(raw))
		return invalidField(plugin, QStringLiteral("config"), QStringLiteral("map"), raw);

	const QVariantMap config = raw.toMap();
	for (auto it = config.cbegin(); it != config.cend(); ++it) {
		if (!isMapValue(it.value())) {
			return invalidField(plugin, QStringLiteral("config entry '%1'").arg(it.key()),
								QStringLiteral("map"), it.value());
		}
	}

	out.add = config.value(QLatin1String(ManifestKeys::CONFIG_ADD)).toMap();
	out.set = config.value(QLatin1String(ManifestKeys::CONFIG_SET)).toMap();
	out.defaults = config.value(QLatin1String(ManifestKeys::CONFIG_DEFAULTS)).toMap();
	return ExtensionError::none();
}

ExtensionError parsePatches(const QString& plugin, const QVariant& raw, QVariantMap& out)
{
	if (!isMapValue(raw))
		return invalidField(plugin, QStringLiteral("patches"), QStringLiteral("map"), raw);

	out = raw.toMap();
	for (auto it = out.cbegin(); it != out.cend(); ++it) {
		if (!isStringValue(it.value())) {
			return invalidField(plugin, QStringLiteral("patch '%1'").arg(it.key()),
								QStringLiteral("string"), it.value());
		}
	}
	return ExtensionError::none();
}

ExtensionError parseHook(const QString& plugin, const QString& hookName, const QVariant& hook, QVariant& out)
{
	if (isListValue(hook)) {
		QStringList services;
		for (const QVariant& service : hook.toList()) {
			if (!isStringValue(service)) {
				return invalidField(plugin, QStringLiteral("service in hook '%1'").arg(hookName),
									QStringLiteral("string"), service);
			}
			services.push_back(service.toString());
		}
		out = services;
		return ExtensionError::none();
	}

	if (isMapValue(hook)) {
		const QVariantMap entries = hook.toMap();
		for (auto it = entries.cbegin(); it != entries.cend(); ++it) {
			if (!isStringValue(it.value())) {
				return ExtensionError::validation(
					QStringLiteral("Invalid hook '%1' in plugin %2. Only string -> string entries are supported, "
								   "got %3 for '%4'.")
						.arg(hookName, plugin, variantShapeName(it.value()), it.key()));
			}
		}
		out = entries;
		return ExtensionError::none();
	}

	return invalidField(plugin, QStringLiteral("hook '%1'").arg(hookName), QStringLiteral("map or list"), hook);
}

ExtensionError parseHooks(const QString& plugin, const QVariant& raw, QVariantMap& out)
{
	if (!isMapValue(raw))
		return invalidField(plugin, QStringLiteral("hooks"), QStringLiteral("map"), raw);

	const QVariantMap hooks = raw.toMap();
	for (auto it = hooks.cbegin(); it != hooks.cend(); ++it) {
		QVariant normalized;
		const ExtensionError err = parseHook(plugin, it.key(), it.value(), normalized);
		if (!err.ok())
			return err;
		out.insert(it.key(), normalized);
	}
	return ExtensionError::none();
}

bool isEmptyHook(const QVariant& hook)
{
	return isListValue(hook) ? hook.toList().isEmpty() : hook.toMap().isEmpty();
}

ExtensionError loadConfig(FilterRegistry& filters, const QString& plugin, const QVariant& raw)
{
	if (!raw.isValid())
		return ExtensionError::none();

	ConfigContribution config;
	const ExtensionError err = parseConfig(plugin, raw, config);
	if (!err.ok())
		return err;

	const QString prefix = upperPrefix(plugin);

	filters.add(QString::fromLatin1(Constants::FILTER_CONFIG_BASE),
				[prefix, add = config.add, set = config.set](const QVariant& value, const QVariantList&) -> QVariant {
					QVariantMap base = value.toMap();
					for (auto it = add.cbegin(); it != add.cend(); ++it) {
						const QString key = prefix + it.key();
						if (!base.contains(key))
							base.insert(key, it.value());
					}
					for (auto it = set.cbegin(); it != set.cend(); ++it)
						base.insert(it.key(), it.value());
					return base;
				});

	filters.add(QString::fromLatin1(Constants::FILTER_CONFIG_DEFAULTS),
				[prefix, defaults = config.defaults](const QVariant& value, const QVariantList&) -> QVariant {
					QVariantMap out = value.toMap();
					for (auto it = defaults.cbegin(); it != defaults.cend(); ++it) {
						const QString key = prefix + it.key();
						if (!out.contains(key))
							out.insert(key, it.value());
					}
					return out;
				});

	filters.add(QString::fromLatin1(Constants::FILTER_CONFIG_OVERRIDES),
				[set = config.set](const QVariant& value, const QVariantList&) -> QVariant {
					QVariantMap out = value.toMap();
					for (auto it = set.cbegin(); it != set.cend(); ++it)
						out.insert(it.key(), it.value());
					return out;
				});
	return ExtensionError::none();
}

ExtensionError loadPatches(FilterRegistry& filters, const QString& plugin, const QVariant& raw)
{
	if (!raw.isValid())
		return ExtensionError::none();

	QVariantMap patches;
	const ExtensionError err = parsePatches(plugin, raw, patches);
	if (!err.ok())
		return err;

	filters.add(QString::fromLatin1(Constants::FILTER_ENV_PATCHES),
				[plugin, patches](const QVariant& value, const QVariantList& args) -> QVariant {
					QVariantList out = value.toList();
					const auto it = patches.constFind(args.value(0).toString());
					if (it != patches.cend())
						out.push_back(QVariant::fromValue(PluginPatch{plugin, it.value().toString()}));
					return out;
				});
	return ExtensionError::none();
}

ExtensionError loadHooks(FilterRegistry& filters, const QString& plugin, const QVariant& raw)
{
	if (!raw.isValid())
		return ExtensionError::none();

	QVariantMap hooks;
	const ExtensionError err = parseHooks(plugin, raw, hooks);
	if (!err.ok())
		return err;

	filters.add(QString::fromLatin1(Constants::FILTER_HOOKS_TASKS),
				[plugin, hooks](const QVariant& value, const QVariantList& args) -> QVariant {
					QVariantList out = value.toList();
					const auto it = hooks.constFind(args.value(0).toString());
					if (it != hooks.cend() && !isEmptyHook(it.value()))
						out.push_back(QVariant::fromValue(PluginHook{plugin, it.value()}));
					return out;
				});
	return ExtensionError::none();
}

ExtensionError loadTemplatesRoot(FilterRegistry& filters, const QString& plugin, const QVariant& raw)
{
	if (!raw.isValid())
		return ExtensionError::none();
	if (!isStringValue(raw))
		return invalidField(plugin, QStringLiteral("templates"), QStringLiteral("string"), raw);

	filters.addItem(QString::fromLatin1(Constants::FILTER_TEMPLATE_ROOTS), raw.toString());
	filters.add(QString::fromLatin1(Constants::FILTER_TEMPLATE_TARGETS),
				[plugin](const QVariant& value, const QVariantList&) -> QVariant {
					QVariantList targets = value.toList();
					const QString destination = QString::fromLatin1(Constants::TEMPLATE_TARGET_DESTINATION);
					for (const char* folder : {Constants::TEMPLATE_FOLDER_APPS, Constants::TEMPLATE_FOLDER_BUILD}) {
						const QString source = plugin + QLatin1Char('/') + QString::fromLatin1(folder);
						targets.push_back(QVariant::fromValue(TemplateTarget{source, destination}));
					}
					return targets;
				});
	return ExtensionError::none();
}

void loadCommand(FilterRegistry& filters, const QString& plugin, const std::optional<CliCommand>& command)
{
	if (!command)
		return;

	CliCommand renamed = *command;
	renamed.name = plugin;
	filters.addItem(QString::fromLatin1(Constants::FILTER_CLI_COMMANDS), QVariant::fromValue(renamed));
}

} // namespace

QString enableActionName(const QString& pluginName)
{
	return QStringLiteral("plugins:%1:enable").arg(pluginName);
}

void installPlugin(ExtensionKernel& kernel, IPluginResolver& resolver, const PluginPtr& plugin)
{
	const Context context = Context::pluginInstall(plugin->name());

	kernel.filters().addItem(QString::fromLatin1(Constants::FILTER_PLUGINS_INSTALLED),
							 QVariant::fromValue(plugin), context);
	kernel.actions().add(
		enableActionName(plugin->name()),
		[&kernel, &resolver, plugin](const QVariantList&) { return enablePlugin(kernel, resolver, plugin); },
		context);

	plugin->setState(PluginState::Installed);
	qCDebug(stagehandExtensionSystemLog).noquote()
		<< "Installed" << plugin->sourceKind() << "plugin" << plugin->name() << plugin->version();
}

ExtensionError enablePlugin(ExtensionKernel& kernel, IPluginResolver& resolver, const PluginPtr& plugin)
{
	const QString& name = plugin->name();
	const ContextScope outer = kernel.enterContext(QString::fromLatin1(Constants::PLUGINS_CONTEXT));
	const ContextScope inner = kernel.enterContext(Context::pluginContextName(name));

	FilterRegistry& filters = kernel.filters();
	filters.addItem(QString::fromLatin1(Constants::FILTER_PLUGINS_ENABLED), QVariant::fromValue(plugin));
	plugin->setState(PluginState::Enabled);

	ExtensionError err;
	const PluginManifest* manifest = plugin->manifest(resolver, &err);
	if (!manifest)
		return err;

	if (err = loadConfig(filters, name, manifest->config); !err.ok())
		return err;
	if (err = loadPatches(filters, name, manifest->patches); !err.ok())
		return err;
	if (err = loadHooks(filters, name, manifest->hooks); !err.ok())
		return err;
	if (err = loadTemplatesRoot(filters, name, manifest->templates); !err.ok())
		return err;
	loadCommand(filters, name, manifest->command);

	qCDebug(stagehandExtensionSystemLog).noquote() << "Enabled plugin" << name;
	return ExtensionError::none();
}

ExtensionError disablePlugin(ExtensionKernel& kernel, QVariantMap& config, const PluginPtr& plugin)
{
	const QString context = Context::pluginContextName(plugin->name());
	const ConfigComposer composer(kernel);

	ExtensionError err;
	const QVariantMap overrides = composer.overridesLayer(context, &err);
	if (!err.ok())
		return err;

	QStringList enabled = ConfigComposer::enabledPluginNames(config, &err);
	if (!err.ok())
		return err;

	const QList<PluginPtr> active = pluginsFromVariant(
		kernel.filters().apply(QString::fromLatin1(Constants::FILTER_PLUGINS_ENABLED), QVariantList{}, {}, &err));
	if (!err.ok())
		return err;

	for (auto it = overrides.cbegin(); it != overrides.cend(); ++it)
		config.remove(it.key());

	if (config.contains(QLatin1String(Constants::PLUGINS_CONFIG_KEY))) {
		enabled.removeAll(plugin->name());
		config.insert(QString::fromLatin1(Constants::PLUGINS_CONFIG_KEY), enabled);
	}

	kernel.filters().clearAll(context, ContextMatch::Subtree);
	kernel.actions().clearAll(context, ContextMatch::Subtree);

	// Same-name plugins share the cleared context.
	plugin->setState(PluginState::Installed);
	for (const PluginPtr& other : active) {
		if (other->name() == plugin->name())
			other->setState(PluginState::Installed);
	}
	return ExtensionError::none();
}

} // namespace Stagehand

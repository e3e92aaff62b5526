// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ExtensionSystemGlobal.hpp"

#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>
#include <QtCore/QVariantMap>

#include <functional>
#include <optional>

namespace Stagehand {

// A command contributed to the host command line. The registered name is
// always forced to the contributing plugin's name.
struct CliCommand {
	QString name;
	QString help;
	std::function<int(const QStringList& arguments)> invoke;
};

// (plugin name, patch content) pair collected from "env:patches".
struct PluginPatch {
	QString plugin;
	QString content;

	bool operator==(const PluginPatch&) const = default;
};

// (plugin name, hook) pair collected from "hooks:tasks". The hook is either a
// QStringList of services or a QVariantMap of string -> string.
struct PluginHook {
	QString plugin;
	QVariant hook;

	bool operator==(const PluginHook&) const = default;
};

// Template folder to render and the destination it renders into.
struct TemplateTarget {
	QString source;
	QString destination;

	bool operator==(const TemplateTarget&) const = default;
};

// Everything a plugin can contribute, as produced by its source. Fields hold
// the raw decoded values; an invalid QVariant means the field is absent.
// Shapes are checked when the plugin is enabled, not here.
struct PluginManifest {
	QVariant config;
	QVariant patches;
	QVariant hooks;
	QVariant templates;
	std::optional<CliCommand> command;

	// Reads the contribution fields of a declarative plugin document.
	static PluginManifest fromVariantMap(const QVariantMap& document);
};

namespace ManifestKeys {
inline constexpr char NAME[] = "name";
inline constexpr char VERSION[] = "version";
inline constexpr char CONFIG[] = "config";
inline constexpr char CONFIG_ADD[] = "add";
inline constexpr char CONFIG_SET[] = "set";
inline constexpr char CONFIG_DEFAULTS[] = "defaults";
inline constexpr char PATCHES[] = "patches";
inline constexpr char HOOKS[] = "hooks";
inline constexpr char TEMPLATES[] = "templates";
} // namespace ManifestKeys

// "map", "list", "string", ... for validation messages.
STAGEHAND_EXTENSION_SYSTEM_EXPORT QString variantShapeName(const QVariant& value);

STAGEHAND_EXTENSION_SYSTEM_EXPORT bool isMapValue(const QVariant& value);
STAGEHAND_EXTENSION_SYSTEM_EXPORT bool isListValue(const QVariant& value);
STAGEHAND_EXTENSION_SYSTEM_EXPORT bool isStringValue(const QVariant& value);

} // namespace Stagehand

Q_DECLARE_METATYPE(Stagehand::CliCommand)
Q_DECLARE_METATYPE(Stagehand::PluginPatch)
Q_DECLARE_METATYPE(Stagehand::PluginHook)
Q_DECLARE_METATYPE(Stagehand::TemplateTarget)

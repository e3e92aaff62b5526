// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtGlobal>

// Interface id of installed-package plugins. A macro so moc can expand it in
// Q_PLUGIN_METADATA and Q_DECLARE_INTERFACE.
#define STAGEHAND_PLUGIN_MODULE_IID "org.stagehand.plugin.v0"

namespace Stagehand {
namespace Constants {

// NOTE: Pipeline names are part of the extension contract. Plugins and host
// code refer to them by value, so they must stay stable.

// Config key holding the sorted list of enabled plugin names.
inline constexpr char PLUGINS_CONFIG_KEY[] = "PLUGINS";

// Environment variable overriding the declarative plugin root.
inline constexpr char PLUGINS_ROOT_ENV_VAR[] = "STAGEHAND_PLUGINS_ROOT";
inline constexpr char PLUGINS_ROOT_DIR_NAME[] = "stagehand-plugins";

// Extension point implemented by installed-package plugins.
inline constexpr char PLUGIN_ENTRY_POINT_IID[] = STAGEHAND_PLUGIN_MODULE_IID;
inline constexpr char DEFAULT_PACKAGE_VERSION[] = "0.0.0";

// Context names
inline constexpr char PLUGINS_CONTEXT[] = "plugins";

// Filters
inline constexpr char FILTER_PLUGINS_INSTALLED[] = "plugins:installed";
inline constexpr char FILTER_PLUGINS_ENABLED[] = "plugins:enabled";
inline constexpr char FILTER_CONFIG_BASE[] = "config:base";
inline constexpr char FILTER_CONFIG_DEFAULTS[] = "config:defaults";
inline constexpr char FILTER_CONFIG_OVERRIDES[] = "config:overrides";
inline constexpr char FILTER_ENV_PATCHES[] = "env:patches";
inline constexpr char FILTER_HOOKS_TASKS[] = "hooks:tasks";
inline constexpr char FILTER_TEMPLATE_ROOTS[] = "env:templates:roots";
inline constexpr char FILTER_TEMPLATE_TARGETS[] = "env:templates:targets";
inline constexpr char FILTER_CLI_COMMANDS[] = "cli:commands";

// Actions
inline constexpr char ACTION_CONFIG_USER_LOAD[] = "config:user:load";
inline constexpr char ACTION_PLUGINS_INSTALL[] = "plugins:install";
inline constexpr char ACTION_PLUGINS_ENABLE[] = "plugins:enable";

// Template sub-directories a plugin renders into the "plugins" output folder.
inline constexpr char TEMPLATE_TARGET_DESTINATION[] = "plugins";
inline constexpr char TEMPLATE_FOLDER_APPS[] = "apps";
inline constexpr char TEMPLATE_FOLDER_BUILD[] = "build";

} // namespace Constants
} // namespace Stagehand

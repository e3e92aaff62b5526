// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ExtensionError.hpp"
#include "ExtensionSystemGlobal.hpp"
#include "PluginSpec.hpp"

#include <QtCore/QString>
#include <QtCore/QVariantMap>

namespace Stagehand {

class ExtensionKernel;
class IPluginResolver;

// Lifecycle transitions shared by every plugin source.
//
// install: Discovered -> Installed. Registered under plugins / installed:<name>.
// enable:  Installed -> Enabled. Registered under plugins / plugins:<name>.
// disable: Enabled -> Installed. Clears everything enable registered.

// Adds the plugin to "plugins:installed" and registers its
// "plugins:<name>:enable" trigger action.
STAGEHAND_EXTENSION_SYSTEM_EXPORT void installPlugin(ExtensionKernel& kernel,
													 IPluginResolver& resolver,
													 const PluginPtr& plugin);

// Resolves the manifest and registers every contribution it declares. Each
// field is validated before anything is registered for it; a validation error
// stops the remaining fields but keeps what was already registered.
STAGEHAND_EXTENSION_SYSTEM_EXPORT ExtensionError enablePlugin(ExtensionKernel& kernel,
															  IPluginResolver& resolver,
															  const PluginPtr& plugin);

// Removes the plugin's "set" keys and its name from config, then clears the
// plugins:<name> subtree of both registries. Every enabled plugin sharing the
// name goes back to Installed.
STAGEHAND_EXTENSION_SYSTEM_EXPORT ExtensionError disablePlugin(ExtensionKernel& kernel,
															   QVariantMap& config,
															   const PluginPtr& plugin);

STAGEHAND_EXTENSION_SYSTEM_EXPORT QString enableActionName(const QString& pluginName);

} // namespace Stagehand

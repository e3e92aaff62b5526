// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ExtensionSystemConstants.hpp"
#include "PluginManifest.hpp"

#include <QtCore/QtPlugin>

namespace Stagehand {

// Interface implemented by packaged plugins built as Qt plugin libraries:
//
//   class MyPlugin : public QObject, public Stagehand::IPluginModule {
//       Q_OBJECT
//       Q_PLUGIN_METADATA(IID STAGEHAND_PLUGIN_MODULE_IID FILE "MyPlugin.json")
//       Q_INTERFACES(Stagehand::IPluginModule)
//       ...
//   };
//
// The JSON file carries {"Name": ..., "Version": ...}.
class IPluginModule {
public:
	virtual ~IPluginModule() = default;

	virtual void contribute(PluginManifest& manifest) = 0;
};

} // namespace Stagehand

Q_DECLARE_INTERFACE(Stagehand::IPluginModule, STAGEHAND_PLUGIN_MODULE_IID)

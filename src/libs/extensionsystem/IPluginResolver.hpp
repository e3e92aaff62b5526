// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ExtensionError.hpp"
#include "ExtensionSystemGlobal.hpp"
#include "PluginManifest.hpp"

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QVariantMap>

namespace Stagehand {

struct PluginEntryPoint {
	QString name;
	QString libraryPath;
	QString distributionVersion;
};

// Everything the plugin model needs from the outside world to turn a plugin
// source into a manifest. The host uses DefaultPluginResolver.
class STAGEHAND_EXTENSION_SYSTEM_EXPORT IPluginResolver {
public:
	virtual ~IPluginResolver() = default;

	virtual ExtensionError loadModule(const QString& module, PluginManifest& manifest) = 0;
	virtual ExtensionError moduleVersion(const QString& module, QString& version) = 0;

	// Entry points that cannot be read are reported through errors and left out.
	virtual QList<PluginEntryPoint> entryPoints(QList<ExtensionError>* errors = nullptr) = 0;
	virtual ExtensionError loadEntryPoint(const PluginEntryPoint& entryPoint, PluginManifest& manifest) = 0;

	virtual ExtensionError loadDocument(const QString& path, QVariantMap& document) = 0;
};

} // namespace Stagehand

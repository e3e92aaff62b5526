// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "PluginManifest.hpp"

namespace Stagehand {

PluginManifest PluginManifest::fromVariantMap(const QVariantMap& document)
{
	PluginManifest manifest;
	manifest.config = document.value(QLatin1String(ManifestKeys::CONFIG));
	manifest.patches = document.value(QLatin1String(ManifestKeys::PATCHES));
	manifest.hooks = document.value(QLatin1String(ManifestKeys::HOOKS));
	manifest.templates = document.value(QLatin1String(ManifestKeys::TEMPLATES));
	return manifest;
}

bool isMapValue(const QVariant& value)
{
	const int id = value.metaType().id();
	return id == QMetaType::QVariantMap || id == QMetaType::QVariantHash;
}

bool isListValue(const QVariant& value)
{
	const int id = value.metaType().id();
	return id == QMetaType::QVariantList || id == QMetaType::QStringList;
}

bool isStringValue(const QVariant& value)
{
	return value.metaType().id() == QMetaType::QString;
}

QString variantShapeName(const QVariant& value)
{
	if (!value.isValid())
		return QStringLiteral("nothing");
	if (value.isNull() && value.metaType().id() == QMetaType::Nullptr)
		return QStringLiteral("null");
	if (isMapValue(value))
		return QStringLiteral("map");
	if (isListValue(value))
		return QStringLiteral("list");
	if (isStringValue(value))
		return QStringLiteral("string");

	switch (value.metaType().id()) {
	case QMetaType::Bool:
		return QStringLiteral("boolean");
	case QMetaType::Int:
	case QMetaType::UInt:
	case QMetaType::LongLong:
	case QMetaType::ULongLong:
	case QMetaType::Double:
		return QStringLiteral("number");
	default:
		return QString::fromLatin1(value.typeName());
	}
}

} // namespace Stagehand

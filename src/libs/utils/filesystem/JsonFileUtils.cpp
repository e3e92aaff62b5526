// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>

namespace Utils::JsonFileUtils {

namespace {

void setError(QString* error, const QString& message)
{
	if (error)
		*error = message;
}

} // namespace

QVariantMap readMap(const QString& path, QString* error)
{
	const QString cleanedPath = path.trimmed();
	if (cleanedPath.isEmpty()) {
		setError(error, QStringLiteral("JSON input path is empty."));
		return {};
	}

	QFile file(cleanedPath);
	if (!file.open(QIODevice::ReadOnly)) {
		setError(error, QStringLiteral("Failed to open JSON file: %1 (%2)").arg(cleanedPath, file.errorString()));
		return {};
	}

	QJsonParseError parseError{};
	const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
	if (parseError.error != QJsonParseError::NoError) {
		setError(error,
				 QStringLiteral("Failed to parse JSON file: %1 (%2)").arg(cleanedPath, parseError.errorString()));
		return {};
	}

	if (!doc.isObject()) {
		setError(error, QStringLiteral("JSON document is not an object: %1").arg(cleanedPath));
		return {};
	}

	if (error)
		error->clear();
	return doc.object().toVariantMap();
}

bool writeMapAtomic(const QString& path, const QVariantMap& map, QString* error, QJsonDocument::JsonFormat format)
{
	const QString cleanedPath = path.trimmed();
	if (cleanedPath.isEmpty()) {
		setError(error, QStringLiteral("JSON output path is empty."));
		return false;
	}

	QSaveFile file(cleanedPath);
	if (!file.open(QIODevice::WriteOnly)) {
		setError(error, QStringLiteral("Failed to open file for writing: %1").arg(cleanedPath));
		return false;
	}

	const QJsonDocument doc(QJsonObject::fromVariantMap(map));
	if (file.write(doc.toJson(format)) < 0) {
		const QString reason = file.errorString();
		file.cancelWriting();
		setError(error, QStringLiteral("Failed to write JSON file: %1 (%2)").arg(cleanedPath, reason));
		return false;
	}

	if (!file.commit()) {
		setError(error, QStringLiteral("Failed to commit JSON file: %1 (%2)").arg(cleanedPath, file.errorString()));
		return false;
	}

	if (error)
		error->clear();
	return true;
}

} // namespace Utils::JsonFileUtils

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/PathUtils.hpp"

#include <QtCore/QDir>

namespace Utils::PathUtils {

namespace {

QString withoutLeadingDot(QStringView ext)
{
	QString out = ext.toString();
	if (out.startsWith(u'.'))
		out.remove(0, 1);
	return out;
}

} // namespace

QString normalizePath(QStringView path)
{
	const QString cleaned = QDir::cleanPath(QDir::fromNativeSeparators(path.toString()).trimmed());
	return cleaned == QStringLiteral(".") ? QString() : cleaned;
}

QString basename(QStringView path)
{
	const QString cleaned = normalizePath(path);
	const qsizetype slash = cleaned.lastIndexOf(u'/');
	if (slash < 0)
		return cleaned;
	return cleaned.mid(slash + 1);
}

QString extension(QStringView path)
{
	const QString name = basename(path);
	const qsizetype dot = name.lastIndexOf(u'.');
	if (dot <= 0)
		return {};
	return name.mid(dot + 1);
}

QString expandUser(QStringView path)
{
	if (path == u"~")
		return QDir::homePath();
	if (path.startsWith(u"~/"))
		return QDir::homePath() + path.mid(1).toString();
	return path.toString();
}

bool hasExtension(QStringView path, QStringView ext, Qt::CaseSensitivity cs)
{
	return QString::compare(extension(path), withoutLeadingDot(ext), cs) == 0;
}

QString ensureExtension(QStringView path, QStringView ext)
{
	const QString wanted = withoutLeadingDot(ext);
	QString result = path.toString();
	if (wanted.isEmpty() || hasExtension(result, wanted))
		return result;
	if (!result.endsWith(u'.'))
		result.append(u'.');
	return result + wanted;
}

} // namespace Utils::PathUtils

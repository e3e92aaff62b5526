// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "FilterRegistry.hpp"

#include <QtCore/QDebug>

namespace Stagehand {

namespace {

QVariantList toList(const QVariant& value)
{
	if (!value.isValid() || value.isNull())
		return {};
	return value.toList();
}

} // namespace

FilterRegistry::FilterRegistry(const ContextStack& contexts)
	: m_contexts(contexts)
{
}

void FilterRegistry::addTransform(const QString& name, Transform transform, const Context& context)
{
	m_filters[name].push_back(Entry{std::move(transform), context});
}

void FilterRegistry::addItem(const QString& name, const QVariant& item)
{
	addItems(name, QVariantList{item}, m_contexts.current());
}

void FilterRegistry::addItem(const QString& name, const QVariant& item, const Context& context)
{
	addItems(name, QVariantList{item}, context);
}

void FilterRegistry::addItems(const QString& name, const QVariantList& items)
{
	addItems(name, items, m_contexts.current());
}

void FilterRegistry::addItems(const QString& name, const QVariantList& items, const Context& context)
{
	add(name,
		[items](const QVariant& value, const QVariantList&) -> QVariant {
			QVariantList out = toList(value);
			out.append(items);
			return out;
		},
		context);
}

QVariant FilterRegistry::apply(const QString& name,
							   QVariant value,
							   const QVariantList& args,
							   ExtensionError* errorOut) const
{
	return fold(name, std::move(value), args, std::nullopt, ContextMatch::Exact, true, errorOut);
}

QVariant FilterRegistry::applyIn(const QString& name,
								 const QString& context,
								 QVariant value,
								 const QVariantList& args,
								 ContextMatch match,
								 ExtensionError* errorOut) const
{
	return fold(name, std::move(value), args, context, match, true, errorOut);
}

QVariant FilterRegistry::applyScoped(const QString& name,
									 const QString& context,
									 QVariant value,
									 const QVariantList& args,
									 ContextMatch match,
									 ExtensionError* errorOut) const
{
	return fold(name, std::move(value), args, context, match, false, errorOut);
}

QVariant FilterRegistry::fold(const QString& name,
							  QVariant value,
							  const QVariantList& args,
							  const std::optional<QString>& context,
							  ContextMatch match,
							  bool includeUnscoped,
							  ExtensionError* errorOut) const
{
	if (errorOut)
		*errorOut = ExtensionError::none();

	// Work on a snapshot: transforms may register new entries while we fold.
	const QList<Entry> entries = m_filters.value(name);
	for (qsizetype i = 0; i < entries.size(); ++i) {
		const Entry& entry = entries.at(i);
		if (!entry.context.isVisibleUnder(context, match))
			continue;
		if (!includeUnscoped && entry.context.isGlobal())
			continue;

		const ExtensionError err = entry.transform(value, args);
		if (!err.ok()) {
			qCWarning(stagehandExtensionSystemLog).noquote()
				<< "Error applying entry" << i << "from context" << entry.context.toString()
				<< "for filter" << name << ":" << err.message();
			if (errorOut) {
				*errorOut = ExtensionError(
					err.code(),
					QStringLiteral("Filter '%1' entry #%2 (%3) failed: %4")
						.arg(name)
						.arg(i)
						.arg(entry.context.toString(), err.message()));
			}
			return {};
		}
	}
	return value;
}

void FilterRegistry::removeMatching(QList<Entry>& entries, const QString& context, ContextMatch match)
{
	entries.removeIf([&](const Entry& entry) {
		return entry.context.matches(context, match);
	});
}

void FilterRegistry::clear(const QString& name)
{
	m_filters.remove(name);
}

void FilterRegistry::clear(const QString& name, const QString& context, ContextMatch match)
{
	auto it = m_filters.find(name);
	if (it == m_filters.end())
		return;

	removeMatching(it.value(), context, match);
	if (it.value().isEmpty())
		m_filters.erase(it);
}

void FilterRegistry::clearAll()
{
	m_filters.clear();
}

void FilterRegistry::clearAll(const QString& context, ContextMatch match)
{
	for (auto it = m_filters.begin(); it != m_filters.end();) {
		removeMatching(it.value(), context, match);
		if (it.value().isEmpty())
			it = m_filters.erase(it);
		else
			++it;
	}
}

bool FilterRegistry::contains(const QString& name) const
{
	return m_filters.contains(name);
}

int FilterRegistry::count(const QString& name) const
{
	return static_cast<int>(m_filters.value(name).size());
}

QStringList FilterRegistry::names() const
{
	QStringList out = m_filters.keys();
	out.sort(Qt::CaseSensitive);
	return out;
}

} // namespace Stagehand

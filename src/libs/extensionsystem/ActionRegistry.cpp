// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ActionRegistry.hpp"

#include <QtCore/QDebug>

namespace Stagehand {

ActionRegistry::ActionRegistry(const ContextStack& contexts)
	: m_contexts(contexts)
{
}

void ActionRegistry::addCallback(const QString& name, Callback callback, const Context& context)
{
	m_actions[name].push_back(Entry{std::move(callback), context});
}

ExtensionError ActionRegistry::doAction(const QString& name, const QVariantList& args)
{
	return run(name, args, std::nullopt, ContextMatch::Exact);
}

ExtensionError ActionRegistry::doActionIn(const QString& name,
										  const QString& context,
										  const QVariantList& args,
										  ContextMatch match)
{
	return run(name, args, context, match);
}

ExtensionError ActionRegistry::doActionOnce(const QString& name, const QVariantList& args)
{
	if (m_done.contains(name) || m_running.contains(name))
		return ExtensionError::none();
	return run(name, args, std::nullopt, ContextMatch::Exact);
}

ExtensionError ActionRegistry::run(const QString& name,
								   const QVariantList& args,
								   const std::optional<QString>& context,
								   ContextMatch match)
{
	// A callback re-triggering the same once-action while it runs is a no-op.
	const bool outermost = !m_running.contains(name);
	if (outermost)
		m_running.insert(name);

	const QList<Entry> entries = m_actions.value(name);
	for (qsizetype i = 0; i < entries.size(); ++i) {
		const Entry& entry = entries.at(i);
		if (!entry.context.isVisibleUnder(context, match))
			continue;

		const ExtensionError err = entry.callback(args);
		if (!err.ok()) {
			qCWarning(stagehandExtensionSystemLog).noquote()
				<< "Error applying action" << name << ": callback" << i
				<< "from context" << entry.context.toString() << "failed:" << err.message();
			if (outermost)
				m_running.remove(name);
			return ExtensionError(err.code(),
								  QStringLiteral("Action '%1' callback #%2 (%3) failed: %4")
									  .arg(name)
									  .arg(i)
									  .arg(entry.context.toString(), err.message()));
		}
	}

	if (outermost)
		m_running.remove(name);
	m_done.insert(name);
	return ExtensionError::none();
}

void ActionRegistry::clear(const QString& name)
{
	m_actions.remove(name);
}

void ActionRegistry::clear(const QString& name, const QString& context, ContextMatch match)
{
	auto it = m_actions.find(name);
	if (it == m_actions.end())
		return;

	it.value().removeIf([&](const Entry& entry) { return entry.context.matches(context, match); });
	if (it.value().isEmpty())
		m_actions.erase(it);
}

void ActionRegistry::clearAll()
{
	m_actions.clear();
}

void ActionRegistry::clearAll(const QString& context, ContextMatch match)
{
	for (auto it = m_actions.begin(); it != m_actions.end();) {
		it.value().removeIf([&](const Entry& entry) { return entry.context.matches(context, match); });
		if (it.value().isEmpty())
			it = m_actions.erase(it);
		else
			++it;
	}
}

void ActionRegistry::reset()
{
	m_actions.clear();
	m_done.clear();
}

bool ActionRegistry::contains(const QString& name) const
{
	return m_actions.contains(name);
}

int ActionRegistry::count(const QString& name) const
{
	return static_cast<int>(m_actions.value(name).size());
}

} // namespace Stagehand

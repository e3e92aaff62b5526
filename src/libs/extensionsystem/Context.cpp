// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "Context.hpp"
#include "ExtensionSystemConstants.hpp"

namespace Stagehand {

Context::Context(const QString& name)
{
	if (!name.isEmpty())
		m_path.push_back(name);
}

Context Context::fromPath(QStringList path)
{
	Context c;
	path.removeAll(QString());
	c.m_path = std::move(path);
	return c;
}

QString Context::pluginContextName(const QString& pluginName)
{
	return QStringLiteral("%1:%2").arg(QLatin1String(Constants::PLUGINS_CONTEXT), pluginName);
}

Context Context::plugin(const QString& pluginName)
{
	return Context(QString::fromLatin1(Constants::PLUGINS_CONTEXT))
		.child(pluginContextName(pluginName));
}

Context Context::pluginInstall(const QString& pluginName)
{
	return Context(QString::fromLatin1(Constants::PLUGINS_CONTEXT))
		.child(QStringLiteral("installed:%1").arg(pluginName));
}

Context Context::child(const QString& name) const
{
	Context c = *this;
	if (!name.isEmpty())
		c.m_path.push_back(name);
	return c;
}

QString Context::name() const
{
	return m_path.isEmpty() ? QString() : m_path.last();
}

QString Context::toString() const
{
	if (m_path.isEmpty())
		return QStringLiteral("<global>");
	return m_path.join(QStringLiteral(" > "));
}

bool Context::matches(const QString& query, ContextMatch match) const
{
	if (m_path.isEmpty() || query.isEmpty())
		return false;

	if (match == ContextMatch::Exact)
		return m_path.last() == query;

	const QString ancestorPrefix = query + QLatin1Char(':');
	for (const QString& entry : m_path) {
		if (entry == query || entry.startsWith(ancestorPrefix))
			return true;
	}
	return false;
}

bool Context::isVisibleUnder(const std::optional<QString>& query, ContextMatch match) const
{
	if (isGlobal() || !query.has_value())
		return true;
	return matches(*query, match);
}

void ContextStack::push(const QString& name)
{
	m_names.push_back(name);
}

void ContextStack::pop()
{
	if (m_names.isEmpty()) {
		qCWarning(stagehandExtensionSystemLog) << "ContextStack::pop() called on an empty stack.";
		return;
	}
	m_names.removeLast();
}

ContextScope::ContextScope(ContextStack& stack, const QString& name)
	: m_stack(&stack)
{
	m_stack->push(name);
}

ContextScope::~ContextScope()
{
	if (m_stack)
		m_stack->pop();
}

} // namespace Stagehand

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ExtensionSystemGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <optional>

namespace Stagehand {

// How a query context selects scoped registrations.
//
// Exact:   the query must equal the innermost context of the registration.
// Subtree: the query may name any context on the registration path, or a
//          ':'-separated ancestor of one ("plugins" selects "plugins:foo").
enum class ContextMatch : quint8 {
	Exact,
	Subtree
};

// Scope tag attached to every filter/action registration. It records the
// full path of context names active at registration time, innermost last.
// An empty path means the registration is unscoped (global).
class STAGEHAND_EXTENSION_SYSTEM_EXPORT Context final {
public:
	Context() = default;
	explicit Context(const QString& name);

	static Context fromPath(QStringList path);

	// plugins / plugins:<name>. Everything a plugin registers while enabled.
	static Context plugin(const QString& pluginName);
	// plugins / installed:<name>. Survives disable.
	static Context pluginInstall(const QString& pluginName);

	static QString pluginContextName(const QString& pluginName);

	Context child(const QString& name) const;

	bool isGlobal() const noexcept { return m_path.isEmpty(); }
	const QStringList& path() const noexcept { return m_path; }
	QString name() const;
	QString toString() const;

	bool matches(const QString& query, ContextMatch match) const;

	// Unscoped registrations are visible to every query; scoped ones only to
	// the "apply everywhere" query (nullopt) or to a matching query.
	bool isVisibleUnder(const std::optional<QString>& query,
						ContextMatch match = ContextMatch::Exact) const;

	bool operator==(const Context& other) const = default;

private:
	QStringList m_path;
};

class STAGEHAND_EXTENSION_SYSTEM_EXPORT ContextStack final {
public:
	void push(const QString& name);
	void pop();

	Context current() const { return Context::fromPath(m_names); }
	int depth() const noexcept { return static_cast<int>(m_names.size()); }

	void clear() { m_names.clear(); }

private:
	QStringList m_names;
};

// Pushes a context on construction and pops it when the scope is left,
// whichever way that happens.
class STAGEHAND_EXTENSION_SYSTEM_EXPORT ContextScope final {
public:
	ContextScope(ContextStack& stack, const QString& name);

	ContextScope(ContextScope&& other) noexcept
		: m_stack(other.m_stack)
	{
		other.m_stack = nullptr;
	}

	ContextScope(const ContextScope&) = delete;
	ContextScope& operator=(const ContextScope&) = delete;
	ContextScope& operator=(ContextScope&&) = delete;

	~ContextScope();

private:
	ContextStack* m_stack = nullptr;
};

} // namespace Stagehand

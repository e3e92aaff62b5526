// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "Context.hpp"
#include "ExtensionError.hpp"
#include "ExtensionSystemGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace Stagehand {

namespace Internal {

template <typename F, typename = void>
struct IsFallibleCallback : std::false_type {};

template <typename F>
struct IsFallibleCallback<F, std::enable_if_t<std::is_same_v<
	std::invoke_result_t<F&, const QVariantList&>, ExtensionError>>> : std::true_type {};

} // namespace Internal

// Named, ordered pipelines of side-effecting callbacks with the same context
// tagging as FilterRegistry, plus a record of the action names already run.
class STAGEHAND_EXTENSION_SYSTEM_EXPORT ActionRegistry final {
public:
	using Callback = std::function<ExtensionError(const QVariantList& args)>;

	explicit ActionRegistry(const ContextStack& contexts);

	ActionRegistry(const ActionRegistry&) = delete;
	ActionRegistry& operator=(const ActionRegistry&) = delete;

	template <class F>
	void add(const QString& name, F&& callback)
	{
		addCallback(name, makeCallback(std::forward<F>(callback)), m_contexts.current());
	}

	template <class F>
	void add(const QString& name, F&& callback, const Context& context)
	{
		addCallback(name, makeCallback(std::forward<F>(callback)), context);
	}

	// Runs every callback registered under name. The first failure stops the
	// remaining callbacks and is returned with its original code.
	ExtensionError doAction(const QString& name, const QVariantList& args = {});
	ExtensionError doActionIn(const QString& name,
							  const QString& context,
							  const QVariantList& args = {},
							  ContextMatch match = ContextMatch::Exact);

	// No-op when name already ran to completion in this registry, whatever the
	// arguments, or is running right now. A failed run can be retried.
	ExtensionError doActionOnce(const QString& name, const QVariantList& args = {});

	bool isDone(const QString& name) const { return m_done.contains(name); }

	void clear(const QString& name);
	void clear(const QString& name, const QString& context, ContextMatch match = ContextMatch::Exact);
	void clearAll();
	void clearAll(const QString& context, ContextMatch match = ContextMatch::Exact);

	// clearAll() and forget which actions already ran.
	void reset();

	bool contains(const QString& name) const;
	int count(const QString& name) const;

private:
	struct Entry {
		Callback callback;
		Context context;
	};

	template <class F>
	static Callback makeCallback(F&& fn)
	{
		using Fn = std::decay_t<F>;
		if constexpr (Internal::IsFallibleCallback<Fn>::value) {
			return Callback(std::forward<F>(fn));
		} else {
			static_assert(std::is_invocable_v<Fn&, const QVariantList&>,
						  "An action callback must be callable as void(const QVariantList&) "
						  "or ExtensionError(const QVariantList&).");
			return [f = Fn(std::forward<F>(fn))](const QVariantList& args) mutable {
				f(args);
				return ExtensionError::none();
			};
		}
	}

	void addCallback(const QString& name, Callback callback, const Context& context);

	ExtensionError run(const QString& name,
					   const QVariantList& args,
					   const std::optional<QString>& context,
					   ContextMatch match);

	const ContextStack& m_contexts;
	QHash<QString, QList<Entry>> m_actions;
	QSet<QString> m_done;
	QSet<QString> m_running;
};

} // namespace Stagehand

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "Context.hpp"
#include "ExtensionError.hpp"
#include "ExtensionSystemGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QList>
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
struct IsFallibleTransform : std::false_type {};

template <typename F>
struct IsFallibleTransform<F, std::enable_if_t<std::is_same_v<
	std::invoke_result_t<F&, QVariant&, const QVariantList&>, ExtensionError>>> : std::true_type {};

} // namespace Internal

// Named, ordered pipelines of value transforms.
//
// apply() folds every visible transform of a pipeline over an initial value,
// in registration order: v0 = initial, vi = transform_i(v(i-1), args...).
// Entries are tagged with a Context when registered and are only ever removed
// through clear()/clearAll().
class STAGEHAND_EXTENSION_SYSTEM_EXPORT FilterRegistry final {
public:
	// Fallible form: mutate the value in place, return ExtensionError::none()
	// on success. Infallible callables of the form
	// QVariant(const QVariant&, const QVariantList&) are adapted by add().
	using Transform = std::function<ExtensionError(QVariant& value, const QVariantList& args)>;

	explicit FilterRegistry(const ContextStack& contexts);

	FilterRegistry(const FilterRegistry&) = delete;
	FilterRegistry& operator=(const FilterRegistry&) = delete;

	// Registers under the context currently on top of the stack.
	template <class F>
	void add(const QString& name, F&& transform)
	{
		addTransform(name, makeTransform(std::forward<F>(transform)), m_contexts.current());
	}

	// Registers under an explicit scope token.
	template <class F>
	void add(const QString& name, F&& transform, const Context& context)
	{
		addTransform(name, makeTransform(std::forward<F>(transform)), context);
	}

	// Appends items to a list-valued pipeline value.
	void addItem(const QString& name, const QVariant& item);
	void addItem(const QString& name, const QVariant& item, const Context& context);
	void addItems(const QString& name, const QVariantList& items);
	void addItems(const QString& name, const QVariantList& items, const Context& context);

	// Folds every entry of the pipeline. On failure the fold is aborted, the
	// error is logged with the filter and entry identity, stored in errorOut
	// with its original code and an invalid QVariant is returned.
	QVariant apply(const QString& name,
				   QVariant value,
				   const QVariantList& args = {},
				   ExtensionError* errorOut = nullptr) const;

	// Same as apply(), restricted to unscoped entries and entries matching context.
	QVariant applyIn(const QString& name,
					 const QString& context,
					 QVariant value,
					 const QVariantList& args = {},
					 ContextMatch match = ContextMatch::Exact,
					 ExtensionError* errorOut = nullptr) const;

	// Same as applyIn(), but unscoped entries are skipped as well: only what
	// was registered under context contributes.
	QVariant applyScoped(const QString& name,
						 const QString& context,
						 QVariant value,
						 const QVariantList& args = {},
						 ContextMatch match = ContextMatch::Exact,
						 ExtensionError* errorOut = nullptr) const;

	// Removal is meant for plugin disable and test teardown only.
	void clear(const QString& name);
	void clear(const QString& name, const QString& context, ContextMatch match = ContextMatch::Exact);
	void clearAll();
	void clearAll(const QString& context, ContextMatch match = ContextMatch::Exact);

	bool contains(const QString& name) const;
	int count(const QString& name) const;
	QStringList names() const;

private:
	struct Entry {
		Transform transform;
		Context context;
	};

	template <class F>
	static Transform makeTransform(F&& fn)
	{
		using Fn = std::decay_t<F>;
		if constexpr (Internal::IsFallibleTransform<Fn>::value) {
			return Transform(std::forward<F>(fn));
		} else {
			static_assert(std::is_invocable_r_v<QVariant, Fn&, const QVariant&, const QVariantList&>,
						  "A filter transform must be callable as QVariant(const QVariant&, const QVariantList&) "
						  "or ExtensionError(QVariant&, const QVariantList&).");
			return [f = Fn(std::forward<F>(fn))](QVariant& value, const QVariantList& args) mutable {
				value = f(std::as_const(value), args);
				return ExtensionError::none();
			};
		}
	}

	void addTransform(const QString& name, Transform transform, const Context& context);

	QVariant fold(const QString& name,
				  QVariant value,
				  const QVariantList& args,
				  const std::optional<QString>& context,
				  ContextMatch match,
				  bool includeUnscoped,
				  ExtensionError* errorOut) const;

	void removeMatching(QList<Entry>& entries, const QString& context, ContextMatch match);

	const ContextStack& m_contexts;
	QHash<QString, QList<Entry>> m_filters;
};

} // namespace Stagehand

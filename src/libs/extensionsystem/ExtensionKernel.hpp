// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ActionRegistry.hpp"
#include "Context.hpp"
#include "ExtensionSystemGlobal.hpp"
#include "FilterRegistry.hpp"

#include <QtCore/QString>

namespace Stagehand {

// Owns the context stack and both registries. One kernel per host process
// (or per test), passed by reference to everything that registers or applies.
class STAGEHAND_EXTENSION_SYSTEM_EXPORT ExtensionKernel final {
public:
	ExtensionKernel();

	ExtensionKernel(const ExtensionKernel&) = delete;
	ExtensionKernel& operator=(const ExtensionKernel&) = delete;

	[[nodiscard]] ContextScope enterContext(const QString& name);

	FilterRegistry& filters() noexcept { return m_filters; }
	const FilterRegistry& filters() const noexcept { return m_filters; }

	ActionRegistry& actions() noexcept { return m_actions; }
	const ActionRegistry& actions() const noexcept { return m_actions; }

	ContextStack& contexts() noexcept { return m_contexts; }
	const ContextStack& contexts() const noexcept { return m_contexts; }

	// Drops every registration, the done set and the context stack.
	void reset();

private:
	ContextStack m_contexts;
	FilterRegistry m_filters;
	ActionRegistry m_actions;
};

} // namespace Stagehand

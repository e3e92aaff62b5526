// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ExtensionKernel.hpp"

namespace Stagehand {

ExtensionKernel::ExtensionKernel()
	: m_filters(m_contexts)
	, m_actions(m_contexts)
{
}

ContextScope ExtensionKernel::enterContext(const QString& name)
{
	return ContextScope(m_contexts, name);
}

void ExtensionKernel::reset()
{
	m_filters.clearAll();
	m_actions.reset();
	m_contexts.clear();
}

} // namespace Stagehand

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "grapholmodel/Diagram.hpp"

#include <algorithm>

namespace GrapholModel {

Diagram::Diagram(DiagramId id, QString name)
	: m_id(std::move(id))
	, m_name(std::move(name))
{
}

Diagram::~Diagram() = default;

GrapholItem* Diagram::findItem(const ItemId& id) const
{
	const auto it = std::find_if(m_items.begin(), m_items.end(),
								 [&id](const auto& item) { return item->id() == id; });
	return it == m_items.end() ? nullptr : it->get();
}

GrapholItem* Diagram::addItem(std::unique_ptr<GrapholItem> item)
{
	if (!item || !item->isValid())
		return nullptr;
	if (findItem(item->id())) {
		qCWarning(grapholmodellog) << "Diagram" << m_id.toString()
								   << "already contains item" << item->id().toString();
		return nullptr;
	}

	item->m_diagramId = m_id;
	GrapholItem* raw = item.get();
	m_items.push_back(std::move(item));

	const QVector<DiagramListener*> listeners = m_listeners;
	for (DiagramListener* listener : listeners)
		listener->diagramItemAdded(*this, *raw);
	return raw;
}

std::unique_ptr<GrapholItem> Diagram::removeItem(const ItemId& id)
{
	GrapholItem* target = findItem(id);
	if (!target)
		return nullptr;

	const QVector<DiagramListener*> listeners = m_listeners;
	for (DiagramListener* listener : listeners)
		listener->diagramItemRemoved(*this, *target);

	// Listeners may have mutated the item list.
	const auto it = std::find_if(m_items.begin(), m_items.end(),
								 [target](const auto& item) { return item.get() == target; });
	if (it == m_items.end())
		return nullptr;

	std::unique_ptr<GrapholItem> removed = std::move(*it);
	m_items.erase(it);
	removed->m_diagramId = DiagramId::null();
	return removed;
}

void Diagram::addListener(DiagramListener* listener)
{
	if (listener && !m_listeners.contains(listener))
		m_listeners.push_back(listener);
}

void Diagram::removeListener(DiagramListener* listener)
{
	m_listeners.removeAll(listener);
}

} // namespace GrapholModel

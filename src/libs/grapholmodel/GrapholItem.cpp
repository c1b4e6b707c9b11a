// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "grapholmodel/GrapholItem.hpp"

namespace GrapholModel {

GrapholNode::GrapholNode(ItemId id, ItemType type, QString text)
	: GrapholItem(std::move(id), type)
	, m_text(std::move(text))
{
}

bool GrapholNode::isValid() const noexcept
{
	return GrapholItem::isValid() && isNode();
}

GrapholEdge::GrapholEdge(ItemId id, ItemType type, ItemId source, ItemId target)
	: GrapholItem(std::move(id), type)
	, m_source(std::move(source))
	, m_target(std::move(target))
{
}

bool GrapholEdge::isValid() const noexcept
{
	return GrapholItem::isValid()
		&& isEdge()
		&& !m_source.isNull()
		&& !m_target.isNull();
}

} // namespace GrapholModel

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "grapholmodel/GrapholModelGlobal.hpp"
#include "grapholmodel/GrapholId.hpp"
#include "grapholmodel/ItemType.hpp"

#include <QtCore/QString>

#include <utility>

namespace GrapholModel {

class Diagram;

class GRAPHOLMODEL_EXPORT GrapholItem
{
public:
	virtual ~GrapholItem() = default;

	const ItemId& id() const noexcept { return m_id; }
	ItemType type() const noexcept { return m_type; }

	// Set by the owning Diagram; null while the item is detached.
	const DiagramId& diagramId() const noexcept { return m_diagramId; }

	bool isNode() const noexcept { return isNodeType(m_type); }
	bool isEdge() const noexcept { return isEdgeType(m_type); }
	bool isPredicate() const noexcept { return isPredicateType(m_type); }

	virtual QString text() const { return {}; }
	virtual bool isValid() const noexcept { return !m_id.isNull(); }

protected:
	GrapholItem(ItemId id, ItemType type)
		: m_id(std::move(id))
		, m_type(type) {}

private:
	friend class Diagram;

	ItemId m_id{};
	ItemType m_type{ItemType::Undefined};
	DiagramId m_diagramId{};
};

class GRAPHOLMODEL_EXPORT GrapholNode final : public GrapholItem
{
public:
	GrapholNode(ItemId id, ItemType type, QString text = {});

	QString text() const override { return m_text; }
	bool isValid() const noexcept override;

private:
	QString m_text;
};

class GRAPHOLMODEL_EXPORT GrapholEdge final : public GrapholItem
{
public:
	GrapholEdge(ItemId id, ItemType type, ItemId source, ItemId target);

	const ItemId& source() const noexcept { return m_source; }
	const ItemId& target() const noexcept { return m_target; }

	bool isValid() const noexcept override;

private:
	ItemId m_source{};
	ItemId m_target{};
};

} // namespace GrapholModel

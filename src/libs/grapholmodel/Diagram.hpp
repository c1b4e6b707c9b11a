// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "grapholmodel/GrapholModelGlobal.hpp"
#include "grapholmodel/GrapholId.hpp"
#include "grapholmodel/GrapholItem.hpp"

#include <QtCore/QString>
#include <QtCore/QVector>

#include <memory>
#include <vector>

namespace GrapholModel {

class Diagram;

class GRAPHOLMODEL_EXPORT DiagramListener
{
public:
	virtual ~DiagramListener() = default;

	// Raised after the item is owned by the diagram.
	virtual void diagramItemAdded(Diagram& diagram, GrapholItem& item) = 0;
	// Raised while the item is still owned by the diagram.
	virtual void diagramItemRemoved(Diagram& diagram, GrapholItem& item) = 0;
};

class GRAPHOLMODEL_EXPORT Diagram final
{
public:
	explicit Diagram(DiagramId id, QString name = {});
	~Diagram();

	Diagram(const Diagram&) = delete;
	Diagram& operator=(const Diagram&) = delete;

	const DiagramId& id() const noexcept { return m_id; }
	const QString& name() const noexcept { return m_name; }

	const std::vector<std::unique_ptr<GrapholItem>>& items() const noexcept { return m_items; }
	bool isEmpty() const noexcept { return m_items.empty(); }

	GrapholItem* findItem(const ItemId& id) const;

	// Takes ownership; returns nullptr (and drops the item) when it is null,
	// invalid or its id is already used in this diagram.
	GrapholItem* addItem(std::unique_ptr<GrapholItem> item);
	std::unique_ptr<GrapholItem> removeItem(const ItemId& id);

	void addListener(DiagramListener* listener);
	void removeListener(DiagramListener* listener);

private:
	DiagramId m_id;
	QString m_name;
	std::vector<std::unique_ptr<GrapholItem>> m_items;
	QVector<DiagramListener*> m_listeners;
};

} // namespace GrapholModel

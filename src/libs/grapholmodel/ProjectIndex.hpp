// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "grapholmodel/GrapholModelGlobal.hpp"
#include "grapholmodel/GrapholId.hpp"
#include "grapholmodel/IndexResult.hpp"
#include "grapholmodel/ItemType.hpp"
#include "grapholmodel/PredicateKey.hpp"
#include "grapholmodel/PredicateMetaData.hpp"
#include "grapholmodel/ProjectIndexConfig.hpp"

#include <QtCore/QHash>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace GrapholModel {

class Diagram;
class GrapholItem;
class ProjectIndexListener;

// Selectors for ProjectIndex::count(). |item| and |predicate| are mutually exclusive.
struct CountFilter final {
	std::optional<ItemType> item;
	std::optional<ItemType> predicate;
	const Diagram* diagram = nullptr;
};

// Every omitted dimension widens the match.
struct PredicateFilter final {
	std::optional<ItemType> type;
	std::optional<QString> name;
	const Diagram* diagram = nullptr;
};

// Incremental index over the diagrams and items of a project.
//
// Items are reachable by diagram, by diagram and type, by diagram and id
// (nodes and edges separately) and, for predicate nodes, by predicate type,
// predicate name and diagram. Buckets are created on first insert and
// dropped as soon as they become empty, so no query ever sees an empty bucket.
//
// The index does not own diagrams or items; callers must remove them from the
// index before destroying them. Not thread-safe.
class GRAPHOLMODEL_EXPORT ProjectIndex final {
public:
	explicit ProjectIndex(ProjectIndexConfig config = {});

	ProjectIndex(const ProjectIndex&) = delete;
	ProjectIndex& operator=(const ProjectIndex&) = delete;

	const ProjectIndexConfig& config() const noexcept { return m_config; }

	// mutators
	IndexResult addDiagram(Diagram& diagram);
	IndexResult removeDiagram(Diagram& diagram);
	IndexResult addItem(Diagram& diagram, GrapholItem& item);
	IndexResult removeItem(Diagram& diagram, GrapholItem& item);

	// |type| must be a predicate type; anything else fails with InvalidArgument.
	// Replaces existing metadata for the same key.
	IndexResult addMeta(ItemType type, const QString& name, PredicateMetaData metadata);
	IndexResult removeMeta(ItemType type, const QString& name);
	IndexResult clearMetas();

	// lookup
	Diagram* diagram(const DiagramId& id) const;
	QSet<Diagram*> diagrams() const;

	GrapholItem* item(const Diagram& diagram, const ItemId& id) const;
	GrapholItem* node(const Diagram& diagram, const ItemId& id) const;
	GrapholItem* edge(const Diagram& diagram, const ItemId& id) const;

	QSet<GrapholItem*> items(const Diagram* diagram = nullptr) const;
	QSet<GrapholItem*> nodes(const Diagram* diagram = nullptr) const;
	QSet<GrapholItem*> edges(const Diagram* diagram = nullptr) const;
	QSet<GrapholItem*> predicates(const PredicateFilter& filter = {}) const;

	CountResult count(const CountFilter& filter = {}) const;
	int itemCount(ItemType type, const Diagram* diagram = nullptr) const;
	int predicateCount(ItemType type, const Diagram* diagram = nullptr) const;

	bool isEmpty() const noexcept { return m_items.isEmpty(); }

	// metadata
	PredicateMetaData meta(ItemType type, const QString& name) const;
	bool hasMeta(ItemType type, const QString& name) const;
	QVector<PredicateKey> metas(const QSet<ItemType>& types = {}) const;
	int metaCount() const noexcept { return static_cast<int>(m_metas.size()); }

	void setMetaDataFactory(MetaDataFactory factory);

	// The key under which a predicate name is stored.
	QString predicateName(const QString& text) const;

	void addListener(ProjectIndexListener* listener);
	void removeListener(ProjectIndexListener* listener);

private:
	using ItemMap = QHash<ItemId, GrapholItem*>;
	using ItemSet = QSet<GrapholItem*>;
	using DiagramItemSets = QHash<DiagramId, ItemSet>;

	IndexError checkReference(const Diagram& diagram, const GrapholItem& item) const;

	template <typename F>
	void notify(F&& f) const;

	static QSet<GrapholItem*> collect(const QHash<DiagramId, ItemMap>& map, const Diagram* diagram);

	ProjectIndexConfig m_config;
	MetaDataFactory m_metaFactory;

	QHash<DiagramId, Diagram*> m_diagrams;
	QHash<DiagramId, ItemMap> m_items;
	QHash<DiagramId, QHash<ItemType, ItemSet>> m_types;
	QHash<DiagramId, ItemMap> m_nodes;
	QHash<DiagramId, ItemMap> m_edges;
	QHash<ItemType, QHash<QString, DiagramItemSets>> m_predicates;
	QHash<PredicateKey, PredicateMetaData> m_metas;

	QVector<ProjectIndexListener*> m_listeners;
};

} // namespace GrapholModel

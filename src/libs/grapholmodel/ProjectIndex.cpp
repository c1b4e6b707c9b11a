// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "grapholmodel/ProjectIndex.hpp"

#include "grapholmodel/Diagram.hpp"
#include "grapholmodel/GrapholItem.hpp"
#include "grapholmodel/ProjectIndexListener.hpp"

#include <algorithm>
#include <utility>

namespace GrapholModel {

namespace {

// Drops map[key] when its bucket is empty.
template <typename Map, typename Key>
void pruneIfEmpty(Map& map, const Key& key)
{
	const auto it = map.find(key);
	if (it != map.end() && it->isEmpty())
		map.erase(it);
}

// Removes |member| from map[key] and drops the bucket if that emptied it.
// Never creates map[key].
template <typename Map, typename Key, typename Member>
void removeFromBucket(Map& map, const Key& key, const Member& member)
{
	const auto it = map.find(key);
	if (it == map.end())
		return;
	it->remove(member);
	if (it->isEmpty())
		map.erase(it);
}

QString describe(const Diagram& diagram, const GrapholItem& item)
{
	return QStringLiteral("%1 '%2' in diagram '%3'")
		.arg(itemTypeName(item.type()), item.id().toString(), diagram.id().toString());
}

} // namespace

ProjectIndex::ProjectIndex(ProjectIndexConfig config)
	: m_config(std::move(config))
	, m_metaFactory(&PredicateMetaData::create)
{
}

template <typename F>
void ProjectIndex::notify(F&& f) const
{
	const QVector<ProjectIndexListener*> listeners = m_listeners;
	for (ProjectIndexListener* listener : listeners)
		f(*listener);
}

IndexError ProjectIndex::checkReference(const Diagram& diagram, const GrapholItem& item) const
{
	if (!item.isValid()) {
		return IndexError(IndexErrorCode::InvalidArgument,
						  QStringLiteral("Invalid %1").arg(describe(diagram, item)));
	}
	if (item.diagramId() != diagram.id()) {
		return IndexError(IndexErrorCode::ForeignReference,
						  QStringLiteral("%1 belongs to diagram '%2'")
							  .arg(describe(diagram, item), item.diagramId().toString()));
	}
	if (m_diagrams.value(diagram.id()) != &diagram) {
		return IndexError(IndexErrorCode::ForeignReference,
						  QStringLiteral("Diagram '%1' is not registered in the index")
							  .arg(diagram.id().toString()));
	}
	return IndexError::none();
}

QString ProjectIndex::predicateName(const QString& text) const
{
	return m_config.normalizePredicateNames ? owlText(text) : text;
}

IndexResult ProjectIndex::addDiagram(Diagram& diagram)
{
	if (diagram.id().isNull())
		return IndexResult::failure(IndexError(IndexErrorCode::InvalidArgument,
											   QStringLiteral("Diagram id is empty")));

	const auto it = m_diagrams.constFind(diagram.id());
	if (it != m_diagrams.constEnd()) {
		if (*it == &diagram)
			return IndexResult::unchanged();
		qCWarning(grapholmodellog) << "addDiagram: id already used by another diagram:" << diagram.id().toString();
		return IndexResult::failure(IndexError(IndexErrorCode::ForeignReference,
											   QStringLiteral("Diagram id '%1' is already used by another diagram")
												   .arg(diagram.id().toString())));
	}

	m_diagrams.insert(diagram.id(), &diagram);
	qCDebug(grapholmodellog) << "addDiagram:" << diagram.id().toString() << "items:" << diagram.items().size();
	notify([&diagram](ProjectIndexListener& l) { l.diagramAdded(diagram); });

	// Listeners may edit the diagram from inside the notifications below.
	QVector<ItemId> ids;
	ids.reserve(static_cast<qsizetype>(diagram.items().size()));
	for (const auto& item : diagram.items())
		ids.push_back(item->id());

	for (const ItemId& id : std::as_const(ids)) {
		GrapholItem* item = diagram.findItem(id);
		if (!item)
			continue;
		const IndexResult r = addItem(diagram, *item);
		if (!r)
			qCWarning(grapholmodellog).noquote() << "addDiagram: skipped item:" << r.error().message();
	}
	return IndexResult::applied();
}

IndexResult ProjectIndex::removeDiagram(Diagram& diagram)
{
	const auto it = m_diagrams.constFind(diagram.id());
	if (it == m_diagrams.constEnd())
		return IndexResult::unchanged();
	if (*it != &diagram) {
		qCWarning(grapholmodellog) << "removeDiagram: foreign diagram with id" << diagram.id().toString();
		return IndexResult::failure(IndexError(IndexErrorCode::ForeignReference,
											   QStringLiteral("Diagram '%1' is not the registered instance")
												   .arg(diagram.id().toString())));
	}

	// Listeners may add or remove items of this diagram while it is torn
	// down, so every pass resolves ids against the live map.
	const DiagramId did = diagram.id();
	QList<ItemId> pending = m_items.value(did).keys();
	while (!pending.isEmpty()) {
		bool progress = false;
		for (const ItemId& id : std::as_const(pending)) {
			const auto it = m_items.constFind(did);
			if (it == m_items.constEnd())
				break;
			GrapholItem* item = it->value(id, nullptr);
			if (!item)
				continue;
			const IndexResult r = removeItem(diagram, *item);
			if (!r)
				qCWarning(grapholmodellog).noquote() << "removeDiagram: skipped item:" << r.error().message();
			progress = progress || r.changed();
		}
		if (!progress)
			break;
		pending = m_items.value(did).keys();
	}

	m_diagrams.remove(diagram.id());
	qCDebug(grapholmodellog) << "removeDiagram:" << diagram.id().toString();
	notify([&diagram](ProjectIndexListener& l) { l.diagramRemoved(diagram); });
	return IndexResult::applied();
}

IndexResult ProjectIndex::addItem(Diagram& diagram, GrapholItem& item)
{
	const IndexError err = checkReference(diagram, item);
	if (!err.ok()) {
		qCWarning(grapholmodellog).noquote() << "addItem:" << err.message();
		return IndexResult::failure(err);
	}

	const DiagramId& did = diagram.id();
	ItemMap& items = m_items[did];
	if (items.contains(item.id()))
		return IndexResult::unchanged();

	items.insert(item.id(), &item);
	m_types[did][item.type()].insert(&item);

	if (item.isNode()) {
		m_nodes[did].insert(item.id(), &item);
		if (item.isPredicate())
			m_predicates[item.type()][predicateName(item.text())][did].insert(&item);
	}
	if (item.isEdge())
		m_edges[did].insert(item.id(), &item);

	qCDebug(grapholmodellog).noquote() << "addItem:" << describe(diagram, item);
	notify([&diagram, &item](ProjectIndexListener& l) { l.itemAdded(diagram, item); });
	return IndexResult::applied();
}

IndexResult ProjectIndex::removeItem(Diagram& diagram, GrapholItem& item)
{
	const DiagramId& did = diagram.id();
	const auto itemsIt = m_items.find(did);
	if (itemsIt == m_items.end() || !itemsIt->contains(item.id()))
		return IndexResult::unchanged();

	IndexError err = checkReference(diagram, item);
	if (err.ok() && itemsIt->value(item.id()) != &item) {
		err = IndexError(IndexErrorCode::ForeignReference,
						 QStringLiteral("%1 is not the indexed instance").arg(describe(diagram, item)));
	}
	if (!err.ok()) {
		qCWarning(grapholmodellog).noquote() << "removeItem:" << err.message();
		return IndexResult::failure(err);
	}

	itemsIt->remove(item.id());
	pruneIfEmpty(m_items, did);

	const auto typesIt = m_types.find(did);
	if (typesIt != m_types.end()) {
		removeFromBucket(*typesIt, item.type(), &item);
		pruneIfEmpty(m_types, did);
	}

	if (item.isNode()) {
		removeFromBucket(m_nodes, did, item.id());
		if (item.isPredicate()) {
			const auto typeIt = m_predicates.find(item.type());
			if (typeIt != m_predicates.end()) {
				const QString name = predicateName(item.text());
				const auto nameIt = typeIt->find(name);
				if (nameIt != typeIt->end()) {
					removeFromBucket(*nameIt, did, &item);
					pruneIfEmpty(*typeIt, name);
				}
				pruneIfEmpty(m_predicates, item.type());
			}
		}
	}
	if (item.isEdge())
		removeFromBucket(m_edges, did, item.id());

	qCDebug(grapholmodellog).noquote() << "removeItem:" << describe(diagram, item);
	notify([&diagram, &item](ProjectIndexListener& l) { l.itemRemoved(diagram, item); });
	return IndexResult::applied();
}

IndexResult ProjectIndex::addMeta(ItemType type, const QString& name, PredicateMetaData metadata)
{
	if (!isPredicateType(type)) {
		qCWarning(grapholmodellog) << "addMeta: not a predicate type:" << itemTypeName(type);
		return IndexResult::failure(IndexError(IndexErrorCode::InvalidArgument,
											   QStringLiteral("Metadata requires a predicate type, got %1")
												   .arg(itemTypeName(type))));
	}

	const PredicateKey key{type, predicateName(name)};
	m_metas.insert(key, std::move(metadata));
	qCDebug(grapholmodellog) << "addMeta:" << itemTypeShortName(type) << key.name;
	notify([&key](ProjectIndexListener& l) { l.metaAdded(key.type, key.name); });
	return IndexResult::applied();
}

IndexResult ProjectIndex::removeMeta(ItemType type, const QString& name)
{
	const PredicateKey key{type, predicateName(name)};
	if (!m_metas.remove(key))
		return IndexResult::unchanged();

	qCDebug(grapholmodellog) << "removeMeta:" << itemTypeShortName(type) << key.name;
	notify([&key](ProjectIndexListener& l) { l.metaRemoved(key.type, key.name); });
	return IndexResult::applied();
}

IndexResult ProjectIndex::clearMetas()
{
	if (m_metas.isEmpty())
		return IndexResult::unchanged();

	m_metas.clear();
	notify([](ProjectIndexListener& l) { l.metasCleared(); });
	return IndexResult::applied();
}

Diagram* ProjectIndex::diagram(const DiagramId& id) const
{
	return m_diagrams.value(id, nullptr);
}

QSet<Diagram*> ProjectIndex::diagrams() const
{
	QSet<Diagram*> out;
	out.reserve(m_diagrams.size());
	for (Diagram* d : m_diagrams)
		out.insert(d);
	return out;
}

GrapholItem* ProjectIndex::item(const Diagram& diagram, const ItemId& id) const
{
	return m_items.value(diagram.id()).value(id, nullptr);
}

GrapholItem* ProjectIndex::node(const Diagram& diagram, const ItemId& id) const
{
	return m_nodes.value(diagram.id()).value(id, nullptr);
}

GrapholItem* ProjectIndex::edge(const Diagram& diagram, const ItemId& id) const
{
	return m_edges.value(diagram.id()).value(id, nullptr);
}

QSet<GrapholItem*> ProjectIndex::collect(const QHash<DiagramId, ItemMap>& map, const Diagram* diagram)
{
	QSet<GrapholItem*> out;
	if (diagram) {
		const auto it = map.constFind(diagram->id());
		if (it == map.constEnd())
			return out;
		for (GrapholItem* item : *it)
			out.insert(item);
		return out;
	}

	for (const ItemMap& bucket : map) {
		for (GrapholItem* item : bucket)
			out.insert(item);
	}
	return out;
}

QSet<GrapholItem*> ProjectIndex::items(const Diagram* diagram) const
{
	return collect(m_items, diagram);
}

QSet<GrapholItem*> ProjectIndex::nodes(const Diagram* diagram) const
{
	return collect(m_nodes, diagram);
}

QSet<GrapholItem*> ProjectIndex::edges(const Diagram* diagram) const
{
	return collect(m_edges, diagram);
}

QSet<GrapholItem*> ProjectIndex::predicates(const PredicateFilter& filter) const
{
	QSet<GrapholItem*> out;
	const std::optional<QString> name = filter.name ? std::optional<QString>(predicateName(*filter.name))
													: std::nullopt;

	const auto unite = [&out, &filter](const DiagramItemSets& occurrences) {
		if (filter.diagram) {
			const auto it = occurrences.constFind(filter.diagram->id());
			if (it != occurrences.constEnd())
				out.unite(*it);
			return;
		}
		for (const ItemSet& set : occurrences)
			out.unite(set);
	};

	for (auto typeIt = m_predicates.constBegin(); typeIt != m_predicates.constEnd(); ++typeIt) {
		if (filter.type && typeIt.key() != *filter.type)
			continue;

		if (name) {
			const auto nameIt = typeIt->constFind(*name);
			if (nameIt != typeIt->constEnd())
				unite(*nameIt);
			continue;
		}
		for (const DiagramItemSets& occurrences : *typeIt)
			unite(occurrences);
	}
	return out;
}

int ProjectIndex::itemCount(ItemType type, const Diagram* diagram) const
{
	if (diagram) {
		const auto it = m_types.constFind(diagram->id());
		return it == m_types.constEnd() ? 0 : static_cast<int>(it->value(type).size());
	}

	// An item lives in exactly one diagram, so per-diagram sets are disjoint.
	int total = 0;
	for (const auto& byType : m_types)
		total += static_cast<int>(byType.value(type).size());
	return total;
}

int ProjectIndex::predicateCount(ItemType type, const Diagram* diagram) const
{
	const auto typeIt = m_predicates.constFind(type);
	if (typeIt == m_predicates.constEnd())
		return 0;
	if (!diagram)
		return static_cast<int>(typeIt->size());

	return static_cast<int>(std::count_if(typeIt->constBegin(), typeIt->constEnd(),
										  [diagram](const DiagramItemSets& occurrences) {
											  return occurrences.contains(diagram->id());
										  }));
}

CountResult ProjectIndex::count(const CountFilter& filter) const
{
	if (filter.item && filter.predicate) {
		qCWarning(grapholmodellog) << "count: item and predicate selectors are mutually exclusive";
		return CountResult::failure(IndexError(IndexErrorCode::ConflictingSelector,
											   QStringLiteral("count() accepts either an item or a predicate selector, not both")));
	}

	if (filter.item)
		return CountResult::success(itemCount(*filter.item, filter.diagram));
	if (filter.predicate)
		return CountResult::success(predicateCount(*filter.predicate, filter.diagram));

	if (filter.diagram)
		return CountResult::success(static_cast<int>(m_items.value(filter.diagram->id()).size()));

	int total = 0;
	for (const ItemMap& bucket : m_items)
		total += static_cast<int>(bucket.size());
	return CountResult::success(total);
}

PredicateMetaData ProjectIndex::meta(ItemType type, const QString& name) const
{
	const PredicateKey key{type, predicateName(name)};
	const auto it = m_metas.constFind(key);
	if (it != m_metas.constEnd())
		return *it;
	return m_metaFactory(key.type, key.name);
}

bool ProjectIndex::hasMeta(ItemType type, const QString& name) const
{
	return m_metas.contains(PredicateKey{type, predicateName(name)});
}

QVector<PredicateKey> ProjectIndex::metas(const QSet<ItemType>& types) const
{
	QVector<PredicateKey> out;
	out.reserve(m_metas.size());
	for (auto it = m_metas.constBegin(); it != m_metas.constEnd(); ++it) {
		if (types.isEmpty() || types.contains(it.key().type))
			out.push_back(it.key());
	}
	std::sort(out.begin(), out.end());
	return out;
}

void ProjectIndex::setMetaDataFactory(MetaDataFactory factory)
{
	m_metaFactory = factory ? std::move(factory) : MetaDataFactory(&PredicateMetaData::create);
}

void ProjectIndex::addListener(ProjectIndexListener* listener)
{
	if (listener && !m_listeners.contains(listener))
		m_listeners.push_back(listener);
}

void ProjectIndex::removeListener(ProjectIndexListener* listener)
{
	m_listeners.removeAll(listener);
}

} // namespace GrapholModel

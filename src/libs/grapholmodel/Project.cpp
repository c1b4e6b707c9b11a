// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "grapholmodel/Project.hpp"

#include <algorithm>
#include <utility>

namespace GrapholModel {

namespace {

const QString kDiagramIdPrefix = QStringLiteral("diagram");

} // namespace

Project::Project(ProjectIndexConfig config)
	: m_index(std::move(config))
{
	m_index.config().applyLoggingRules();
}

Project::~Project()
{
	for (const auto& d : m_diagrams)
		d->removeListener(this);
}

Diagram* Project::createDiagram(QString name)
{
	const auto id = m_ids.next(kDiagramIdPrefix);
	if (!id)
		return nullptr;
	return addDiagram(std::make_unique<Diagram>(DiagramId(*id), std::move(name)));
}

Diagram* Project::addDiagram(std::unique_ptr<Diagram> diagram)
{
	if (!diagram)
		return nullptr;

	const bool owned = std::any_of(m_diagrams.begin(), m_diagrams.end(),
								   [&diagram](const auto& d) { return d.get() == diagram.get(); });
	if (owned)
		return diagram.release();

	// Attached first so items added by index listeners during registration are forwarded.
	diagram->addListener(this);

	const IndexResult r = m_index.addDiagram(*diagram);
	if (!r) {
		diagram->removeListener(this);
		qCWarning(grapholmodellog).noquote() << "Project::addDiagram:" << r.error().message();
		return nullptr;
	}
	if (!r.changed()) {
		// Registered on the index directly; pick up items added since then.
		QVector<ItemId> ids;
		for (const auto& item : diagram->items())
			ids.push_back(item->id());
		for (const ItemId& id : std::as_const(ids)) {
			GrapholItem* item = diagram->findItem(id);
			if (!item)
				continue;
			const IndexResult ir = m_index.addItem(*diagram, *item);
			if (!ir)
				qCWarning(grapholmodellog).noquote() << "Project::addDiagram:" << ir.error().message();
		}
	}

	m_ids.update(diagram->id().toString());
	Diagram* raw = diagram.get();
	m_diagrams.push_back(std::move(diagram));
	return raw;
}

std::unique_ptr<Diagram> Project::removeDiagram(const DiagramId& id)
{
	const auto it = std::find_if(m_diagrams.begin(), m_diagrams.end(),
								 [&id](const auto& d) { return d->id() == id; });
	if (it == m_diagrams.end())
		return nullptr;

	const IndexResult r = m_index.removeDiagram(**it);
	if (!r) {
		qCWarning(grapholmodellog).noquote() << "Project::removeDiagram:" << r.error().message();
		return nullptr;
	}

	std::unique_ptr<Diagram> removed = std::move(*it);
	m_diagrams.erase(it);
	removed->removeListener(this);
	return removed;
}

Diagram* Project::diagram(const DiagramId& id) const
{
	return m_index.diagram(id);
}

Diagram* Project::diagramByName(const QString& name) const
{
	const auto it = std::find_if(m_diagrams.begin(), m_diagrams.end(),
								 [&name](const auto& d) { return d->name() == name; });
	return it == m_diagrams.end() ? nullptr : it->get();
}

void Project::diagramItemAdded(Diagram& diagram, GrapholItem& item)
{
	const IndexResult r = m_index.addItem(diagram, item);
	if (!r)
		qCWarning(grapholmodellog).noquote() << "Project: item not indexed:" << r.error().message();
}

void Project::diagramItemRemoved(Diagram& diagram, GrapholItem& item)
{
	const IndexResult r = m_index.removeItem(diagram, item);
	if (!r)
		qCWarning(grapholmodellog).noquote() << "Project: item not removed from index:" << r.error().message();
}

} // namespace GrapholModel

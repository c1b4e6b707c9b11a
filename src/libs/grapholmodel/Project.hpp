// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "grapholmodel/GrapholModelGlobal.hpp"
#include "grapholmodel/Diagram.hpp"
#include "grapholmodel/ProjectIndex.hpp"
#include "grapholmodel/ProjectIndexConfig.hpp"
#include "grapholmodel/UniqueIdGenerator.hpp"

#include <QtCore/QString>

#include <memory>
#include <vector>

namespace GrapholModel {

// Owns the diagrams of one ontology project and keeps its index in sync
// with them: item changes made on an owned diagram are forwarded to the index.
class GRAPHOLMODEL_EXPORT Project final : private DiagramListener
{
public:
	explicit Project(ProjectIndexConfig config = {});
	~Project() override;

	Project(const Project&) = delete;
	Project& operator=(const Project&) = delete;

	ProjectIndex& index() noexcept { return m_index; }
	const ProjectIndex& index() const noexcept { return m_index; }

	UniqueIdGenerator& ids() noexcept { return m_ids; }

	const std::vector<std::unique_ptr<Diagram>>& diagrams() const noexcept { return m_diagrams; }

	Diagram* createDiagram(QString name = {});

	// Returns nullptr (and drops the diagram) if the index rejects it.
	Diagram* addDiagram(std::unique_ptr<Diagram> diagram);
	std::unique_ptr<Diagram> removeDiagram(const DiagramId& id);

	Diagram* diagram(const DiagramId& id) const;
	Diagram* diagramByName(const QString& name) const;

private:
	void diagramItemAdded(Diagram& diagram, GrapholItem& item) override;
	void diagramItemRemoved(Diagram& diagram, GrapholItem& item) override;

	ProjectIndex m_index;
	UniqueIdGenerator m_ids;
	std::vector<std::unique_ptr<Diagram>> m_diagrams;
};

} // namespace GrapholModel

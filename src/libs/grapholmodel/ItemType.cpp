// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "grapholmodel/ItemType.hpp"

namespace GrapholModel {

QString itemTypeName(ItemType type)
{
	switch (type) {
		case ItemType::ConceptNode: return QStringLiteral("concept node");
		case ItemType::AttributeNode: return QStringLiteral("attribute node");
		case ItemType::RoleNode: return QStringLiteral("role node");
		case ItemType::ValueDomainNode: return QStringLiteral("value domain node");
		case ItemType::IndividualNode: return QStringLiteral("individual node");
		case ItemType::DomainRestrictionNode: return QStringLiteral("domain restriction node");
		case ItemType::RangeRestrictionNode: return QStringLiteral("range restriction node");
		case ItemType::UnionNode: return QStringLiteral("union node");
		case ItemType::EnumerationNode: return QStringLiteral("enumeration node");
		case ItemType::ComplementNode: return QStringLiteral("complement node");
		case ItemType::RoleChainNode: return QStringLiteral("role chain node");
		case ItemType::IntersectionNode: return QStringLiteral("intersection node");
		case ItemType::RoleInverseNode: return QStringLiteral("role inverse node");
		case ItemType::DatatypeRestrictionNode: return QStringLiteral("datatype restriction node");
		case ItemType::DisjointUnionNode: return QStringLiteral("disjoint union node");
		case ItemType::PropertyAssertionNode: return QStringLiteral("property assertion node");
		case ItemType::FacetNode: return QStringLiteral("facet node");
		case ItemType::LiteralNode: return QStringLiteral("literal node");
		case ItemType::HasKeyNode: return QStringLiteral("has key node");
		case ItemType::InclusionEdge: return QStringLiteral("inclusion edge");
		case ItemType::EquivalenceEdge: return QStringLiteral("equivalence edge");
		case ItemType::InputEdge: return QStringLiteral("input edge");
		case ItemType::MembershipEdge: return QStringLiteral("membership edge");
		case ItemType::SameEdge: return QStringLiteral("same edge");
		case ItemType::DifferentEdge: return QStringLiteral("different edge");
		case ItemType::Label: return QStringLiteral("label");
		case ItemType::Undefined: return QStringLiteral("undefined");
	}
	return QStringLiteral("undefined");
}

QString itemTypeShortName(ItemType type)
{
	QString name = itemTypeName(type);
	for (const QString suffix : {QStringLiteral(" node"), QStringLiteral(" edge")}) {
		if (name.endsWith(suffix)) {
			name.chop(suffix.size());
			break;
		}
	}
	return name;
}

} // namespace GrapholModel

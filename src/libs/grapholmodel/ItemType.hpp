// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "grapholmodel/GrapholModelGlobal.hpp"

#include <QtCore/QHashFunctions>
#include <QtCore/QString>

namespace GrapholModel {

// Values match the Graphol file format item codes.
enum class ItemType : quint32 {
	// predicates
	ConceptNode = 65537,
	AttributeNode = 65538,
	RoleNode = 65539,
	ValueDomainNode = 65540,
	IndividualNode = 65541,

	// constructors
	DomainRestrictionNode = 65542,
	RangeRestrictionNode = 65543,
	UnionNode = 65544,
	EnumerationNode = 65545,
	ComplementNode = 65546,
	RoleChainNode = 65547,
	IntersectionNode = 65548,
	RoleInverseNode = 65549,
	DatatypeRestrictionNode = 65550,
	DisjointUnionNode = 65551,
	PropertyAssertionNode = 65552,
	FacetNode = 65553,
	LiteralNode = 65554,
	HasKeyNode = 65555,

	// edges
	InclusionEdge = 65556,
	EquivalenceEdge = 65557,
	InputEdge = 65558,
	MembershipEdge = 65559,
	SameEdge = 65560,
	DifferentEdge = 65561,

	Label = 65562,
	Undefined = 65563
};

constexpr bool isNodeType(ItemType type) noexcept
{
	return type >= ItemType::ConceptNode && type < ItemType::InclusionEdge;
}

constexpr bool isEdgeType(ItemType type) noexcept
{
	return type >= ItemType::InclusionEdge && type <= ItemType::DifferentEdge;
}

constexpr bool isPredicateType(ItemType type) noexcept
{
	return type >= ItemType::ConceptNode && type <= ItemType::IndividualNode;
}

// "concept node", "inclusion edge", ...
GRAPHOLMODEL_EXPORT QString itemTypeName(ItemType type);

// "concept", "inclusion", ...
GRAPHOLMODEL_EXPORT QString itemTypeShortName(ItemType type);

inline size_t qHash(ItemType type, size_t seed = 0) noexcept
{
	return ::qHash(static_cast<quint32>(type), seed);
}

} // namespace GrapholModel

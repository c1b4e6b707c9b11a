// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "grapholmodel/PredicateMetaData.hpp"

namespace GrapholModel {

PredicateMetaData::PredicateMetaData(ItemType type, QString predicate, Characteristics characteristics)
	: m_type(type)
	, m_predicate(predicate.trimmed())
	, m_characteristics(std::move(characteristics))
{
}

PredicateMetaData PredicateMetaData::create(ItemType type, const QString& predicate)
{
	switch (type) {
		case ItemType::RoleNode:
			return PredicateMetaData(type, predicate, RoleCharacteristics{});
		case ItemType::AttributeNode:
			return PredicateMetaData(type, predicate, AttributeCharacteristics{});
		default:
			return PredicateMetaData(type, predicate);
	}
}

MetaDataKind PredicateMetaData::kind() const noexcept
{
	if (std::holds_alternative<RoleCharacteristics>(m_characteristics))
		return MetaDataKind::Role;
	if (std::holds_alternative<AttributeCharacteristics>(m_characteristics))
		return MetaDataKind::Attribute;
	return MetaDataKind::Plain;
}

bool PredicateMetaData::isFunctional() const noexcept
{
	if (const auto* r = role())
		return r->functional;
	if (const auto* a = attribute())
		return a->functional;
	return false;
}

bool PredicateMetaData::isEmpty() const
{
	return *this == create(m_type, m_predicate);
}

} // namespace GrapholModel

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "grapholmodel/GrapholModelGlobal.hpp"
#include "grapholmodel/ItemType.hpp"

#include <QtCore/QString>

#include <functional>
#include <utility>
#include <variant>

namespace GrapholModel {

struct GRAPHOLMODEL_EXPORT AttributeCharacteristics final {
	bool functional = false;

	friend bool operator==(const AttributeCharacteristics&, const AttributeCharacteristics&) noexcept = default;
};

struct GRAPHOLMODEL_EXPORT RoleCharacteristics final {
	bool asymmetric = false;
	bool functional = false;
	bool inverseFunctional = false;
	bool irreflexive = false;
	bool reflexive = false;
	bool symmetric = false;
	bool transitive = false;

	friend bool operator==(const RoleCharacteristics&, const RoleCharacteristics&) noexcept = default;
};

enum class MetaDataKind : quint8 {
	Plain,
	Attribute,
	Role
};

// Descriptive data attached to a predicate identity, not to a node occurrence.
class GRAPHOLMODEL_EXPORT PredicateMetaData final {
public:
	using Characteristics = std::variant<std::monostate, AttributeCharacteristics, RoleCharacteristics>;

	PredicateMetaData() = default;
	PredicateMetaData(ItemType type, QString predicate, Characteristics characteristics = {});

	// Default factory: role and attribute predicates get their characteristics.
	static PredicateMetaData create(ItemType type, const QString& predicate);

	ItemType type() const noexcept { return m_type; }
	const QString& predicate() const noexcept { return m_predicate; }
	const QString& description() const noexcept { return m_description; }
	const QString& url() const noexcept { return m_url; }

	void setDescription(const QString& v) { m_description = v.trimmed(); }
	void setUrl(const QString& v) { m_url = v.trimmed(); }

	MetaDataKind kind() const noexcept;

	const AttributeCharacteristics* attribute() const noexcept { return std::get_if<AttributeCharacteristics>(&m_characteristics); }
	AttributeCharacteristics* attribute() noexcept { return std::get_if<AttributeCharacteristics>(&m_characteristics); }
	const RoleCharacteristics* role() const noexcept { return std::get_if<RoleCharacteristics>(&m_characteristics); }
	RoleCharacteristics* role() noexcept { return std::get_if<RoleCharacteristics>(&m_characteristics); }

	// False for plain predicates.
	bool isFunctional() const noexcept;

	// True when nothing differs from what create() would return.
	bool isEmpty() const;

	friend bool operator==(const PredicateMetaData&, const PredicateMetaData&) = default;

private:
	ItemType m_type{ItemType::Undefined};
	QString m_predicate;
	QString m_description;
	QString m_url;
	Characteristics m_characteristics{};
};

using MetaDataFactory = std::function<PredicateMetaData(ItemType, const QString&)>;

} // namespace GrapholModel

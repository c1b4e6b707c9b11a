// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "grapholmodel/GrapholModelGlobal.hpp"
#include "grapholmodel/ItemType.hpp"

#include <QtCore/QHashFunctions>
#include <QtCore/QString>

#include <compare>

namespace GrapholModel {

// Identity of one predicate across the whole project.
struct GRAPHOLMODEL_EXPORT PredicateKey final {
	ItemType type{ItemType::Undefined};
	QString name;

	friend bool operator==(const PredicateKey&, const PredicateKey&) noexcept = default;
	friend std::strong_ordering operator<=>(const PredicateKey& a, const PredicateKey& b) noexcept {
		if (a.type != b.type)
			return (a.type < b.type) ? std::strong_ordering::less : std::strong_ordering::greater;

		const int c = QString::compare(a.name, b.name, Qt::CaseSensitive);
		if (c < 0) return std::strong_ordering::less;
		if (c > 0) return std::strong_ordering::greater;
		return std::strong_ordering::equal;
	}
};

inline size_t qHash(const PredicateKey& key, size_t seed = 0) noexcept
{
	return qHashMulti(seed, static_cast<quint32>(key.type), key.name);
}

// Replaces every character that is not valid in an OWL identifier with '_'.
GRAPHOLMODEL_EXPORT QString owlText(const QString& text);

} // namespace GrapholModel

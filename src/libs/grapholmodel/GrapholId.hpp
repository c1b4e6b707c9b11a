// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "grapholmodel/GrapholModelGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QHashFunctions>

#include <compare>
#include <utility>

namespace GrapholModel {

// Opaque string key. Diagram and item ids come from the document layer
// (file contents or UniqueIdGenerator) and are never reinterpreted here.
template <typename Tag>
class StringId final {
public:
	StringId() = default;
	explicit StringId(QString value) : m_value(std::move(value)) {}

	static StringId null() { return StringId(); }

	bool isNull() const noexcept { return m_value.isEmpty(); }
	const QString& toString() const noexcept { return m_value; }

	friend bool operator==(const StringId& a, const StringId& b) noexcept {
		return a.m_value == b.m_value;
	}

	friend std::strong_ordering operator<=>(const StringId& a, const StringId& b) noexcept {
		const int c = QString::compare(a.m_value, b.m_value, Qt::CaseSensitive);
		if (c < 0) return std::strong_ordering::less;
		if (c > 0) return std::strong_ordering::greater;
		return std::strong_ordering::equal;
	}

private:
	QString m_value;
};

template <typename Tag>
size_t qHash(const StringId<Tag>& id, size_t seed = 0) noexcept {
	return qHash(id.toString(), seed);
}

struct DiagramIdTag final {};
struct ItemIdTag    final {};

using DiagramId = StringId<DiagramIdTag>;
using ItemId    = StringId<ItemIdTag>;

} // namespace GrapholModel

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "grapholmodel/GrapholModelGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QString>

#include <optional>

namespace GrapholModel {

// Sequential ids of the form <prefix><n>, one counter per prefix.
class GRAPHOLMODEL_EXPORT UniqueIdGenerator final {
public:
	struct Parsed final {
		QString prefix;
		int value = 0;
	};

	// Empty when |prefix| is empty or contains a digit.
	std::optional<QString> next(const QString& prefix);

	static std::optional<Parsed> parse(const QString& id);

	// Makes sure next(prefix) never returns |id| or anything below it.
	bool update(const QString& id);

	std::optional<int> last(const QString& prefix) const;

private:
	QHash<QString, int> m_last;
};

} // namespace GrapholModel

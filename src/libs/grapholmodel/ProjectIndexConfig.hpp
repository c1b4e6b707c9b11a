// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "grapholmodel/GrapholModelGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace GrapholModel {

struct GRAPHOLMODEL_EXPORT ProjectIndexConfig final {
	// Key predicates by their OWL-compatible spelling ("works for" == "works_for").
	bool normalizePredicateNames = true;

	// QLoggingCategory filter rules, e.g. "eddy.grapholmodel.debug=true".
	QString loggingRules;

	QJsonObject toJson() const;

	// Keys absent from |object| keep their current value.
	Utils::Result readJson(const QJsonObject& object);

	Utils::Result load(const QString& path);
	Utils::Result save(const QString& path) const;

	void applyLoggingRules() const;

	friend bool operator==(const ProjectIndexConfig&, const ProjectIndexConfig&) = default;
};

} // namespace GrapholModel

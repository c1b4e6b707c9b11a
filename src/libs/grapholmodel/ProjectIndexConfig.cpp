// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "grapholmodel/ProjectIndexConfig.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QJsonValue>
#include <QtCore/QLoggingCategory>

namespace GrapholModel {

namespace {

const QString kNormalizeKey = QStringLiteral("normalizePredicateNames");
const QString kLoggingRulesKey = QStringLiteral("loggingRules");

} // namespace

QJsonObject ProjectIndexConfig::toJson() const
{
	QJsonObject o;
	o.insert(kNormalizeKey, normalizePredicateNames);
	o.insert(kLoggingRulesKey, loggingRules);
	return o;
}

Utils::Result ProjectIndexConfig::readJson(const QJsonObject& object)
{
	Utils::Result result;

	if (object.contains(kNormalizeKey)) {
		const QJsonValue v = object.value(kNormalizeKey);
		if (v.isBool())
			normalizePredicateNames = v.toBool();
		else
			result.addError(QStringLiteral("'%1' must be a boolean.").arg(kNormalizeKey));
	}

	if (object.contains(kLoggingRulesKey)) {
		const QJsonValue v = object.value(kLoggingRulesKey);
		if (v.isString())
			loggingRules = v.toString();
		else
			result.addError(QStringLiteral("'%1' must be a string.").arg(kLoggingRulesKey));
	}

	if (!result)
		qCWarning(grapholmodellog).noquote() << "Invalid index configuration:" << result.errorString();
	return result;
}

Utils::Result ProjectIndexConfig::load(const QString& path)
{
	QJsonObject object;
	const Utils::Result read = Utils::JsonFileUtils::readObject(path, object);
	if (!read)
		return read;
	return readJson(object);
}

Utils::Result ProjectIndexConfig::save(const QString& path) const
{
	return Utils::JsonFileUtils::writeObjectAtomic(path, toJson());
}

void ProjectIndexConfig::applyLoggingRules() const
{
	if (loggingRules.trimmed().isEmpty())
		return;
	QLoggingCategory::setFilterRules(loggingRules);
}

} // namespace GrapholModel

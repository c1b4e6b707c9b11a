// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "grapholmodel/UniqueIdGenerator.hpp"

#include <QtCore/QRegularExpression>

#include <algorithm>

namespace GrapholModel {

std::optional<QString> UniqueIdGenerator::next(const QString& prefix)
{
	static const QRegularExpression kDigit(QStringLiteral("\\d"));
	if (prefix.isEmpty() || prefix.contains(kDigit)) {
		qCWarning(grapholmodellog) << "Rejected id prefix" << prefix;
		return std::nullopt;
	}

	const auto it = m_last.find(prefix);
	const int value = (it == m_last.end()) ? 0 : *it + 1;
	m_last.insert(prefix, value);
	return prefix + QString::number(value);
}

std::optional<UniqueIdGenerator::Parsed> UniqueIdGenerator::parse(const QString& id)
{
	static const QRegularExpression kId(QStringLiteral("^(\\D+)(\\d+)$"));
	const QRegularExpressionMatch m = kId.match(id);
	if (!m.hasMatch())
		return std::nullopt;

	bool ok = false;
	const int value = m.captured(2).toInt(&ok);
	if (!ok)
		return std::nullopt;
	return Parsed{m.captured(1), value};
}

bool UniqueIdGenerator::update(const QString& id)
{
	const auto parsed = parse(id);
	if (!parsed)
		return false;

	const auto it = m_last.find(parsed->prefix);
	if (it == m_last.end())
		m_last.insert(parsed->prefix, parsed->value);
	else
		*it = std::max(*it, parsed->value);
	return true;
}

std::optional<int> UniqueIdGenerator::last(const QString& prefix) const
{
	const auto it = m_last.constFind(prefix);
	if (it == m_last.constEnd())
		return std::nullopt;
	return *it;
}

} // namespace GrapholModel

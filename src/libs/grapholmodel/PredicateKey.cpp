// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "grapholmodel/PredicateKey.hpp"

#include <QtCore/QRegularExpression>

namespace GrapholModel {

QString owlText(const QString& text)
{
	static const QRegularExpression kInvalidChar(QStringLiteral("\\W"),
												 QRegularExpression::UseUnicodePropertiesOption);
	QString out = text;
	out.replace(kInvalidChar, QStringLiteral("_"));
	return out;
}

} // namespace GrapholModel

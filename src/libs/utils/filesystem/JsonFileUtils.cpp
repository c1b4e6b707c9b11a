// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>

namespace Utils::JsonFileUtils {

namespace {

Result fail(const QString& message)
{
    qCWarning(utilslog).noquote() << message;
    return Result::failure(message);
}

} // namespace

Result writeObjectAtomic(const QString& path, const QJsonObject& object, QJsonDocument::JsonFormat format)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return fail(QStringLiteral("JSON output path is empty."));

    QSaveFile file(cleanedPath);
    if (!file.open(QIODevice::WriteOnly))
        return fail(QStringLiteral("Failed to open file for writing: %1").arg(cleanedPath));

    const QJsonDocument doc(object);
    if (file.write(doc.toJson(format)) < 0) {
        const QString error = file.errorString();
        file.cancelWriting();
        return fail(QStringLiteral("Failed to write JSON file: %1 (%2)").arg(cleanedPath, error));
    }

    if (!file.commit())
        return fail(QStringLiteral("Failed to commit JSON file: %1 (%2)").arg(cleanedPath, file.errorString()));

    qCDebug(utilslog) << "wrote JSON object to" << cleanedPath;
    return Result::success();
}

Result readObject(const QString& path, QJsonObject& out)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return fail(QStringLiteral("JSON input path is empty."));

    QFile file(cleanedPath);
    if (!file.open(QIODevice::ReadOnly))
        return fail(QStringLiteral("Failed to open JSON file: %1 (%2)").arg(cleanedPath, file.errorString()));

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return fail(QStringLiteral("Failed to parse JSON file: %1 (%2)").arg(cleanedPath, parseError.errorString()));

    if (!doc.isObject())
        return fail(QStringLiteral("JSON document is not an object: %1").arg(cleanedPath));

    out = doc.object();
    return Result::success();
}

} // namespace Utils::JsonFileUtils

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "grapholmodel/ProjectIndexConfig.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QTemporaryDir>

using namespace GrapholModel;

TEST(ProjectIndexConfig, Defaults)
{
    const ProjectIndexConfig config;
    EXPECT_TRUE(config.normalizePredicateNames);
    EXPECT_TRUE(config.loggingRules.isEmpty());

    const QJsonObject json = config.toJson();
    EXPECT_TRUE(json.value(QStringLiteral("normalizePredicateNames")).toBool());
    EXPECT_EQ(json.value(QStringLiteral("loggingRules")).toString(), QString());
}

TEST(ProjectIndexConfig, ReadJsonKeepsAbsentKeys)
{
    ProjectIndexConfig config;
    config.loggingRules = QStringLiteral("eddy.*.debug=false");

    QJsonObject json;
    json.insert(QStringLiteral("normalizePredicateNames"), false);
    json.insert(QStringLiteral("somethingElse"), 42);

    const Utils::Result r = config.readJson(json);
    ASSERT_TRUE(r.ok) << r.errorString().toStdString();
    EXPECT_FALSE(config.normalizePredicateNames);
    EXPECT_EQ(config.loggingRules, QStringLiteral("eddy.*.debug=false"));
}

TEST(ProjectIndexConfig, ReadJsonReportsEveryBadKey)
{
    ProjectIndexConfig config;

    QJsonObject json;
    json.insert(QStringLiteral("normalizePredicateNames"), QStringLiteral("yes"));
    json.insert(QStringLiteral("loggingRules"), QJsonArray{1, 2});

    const Utils::Result r = config.readJson(json);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errors.size(), 2);
    EXPECT_EQ(config, ProjectIndexConfig{});
}

TEST(ProjectIndexConfig, SaveAndLoad)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QString path = QDir(temp.path()).filePath(QStringLiteral("index.json"));

    ProjectIndexConfig saved;
    saved.normalizePredicateNames = false;
    saved.loggingRules = QStringLiteral("eddy.grapholmodel.debug=true");
    ASSERT_TRUE(saved.save(path).ok);

    ProjectIndexConfig loaded;
    const Utils::Result r = loaded.load(path);
    ASSERT_TRUE(r.ok) << r.errorString().toStdString();
    EXPECT_EQ(loaded, saved);
}

TEST(ProjectIndexConfig, LoadFailures)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    QDir dir(temp.path());

    ProjectIndexConfig config;
    EXPECT_FALSE(config.load(dir.filePath(QStringLiteral("missing.json"))).ok);

    const QString wrong = dir.filePath(QStringLiteral("wrong.json"));
    {
        QFile f(wrong);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("{\"normalizePredicateNames\": 1}");
    }
    EXPECT_FALSE(config.load(wrong).ok);
    EXPECT_TRUE(config.normalizePredicateNames);
}

#include <gtest/gtest.h>

#include "IndexTestSupport.hpp"

#include "grapholmodel/ProjectIndex.hpp"

using namespace GrapholModel;
using GrapholModel::Test::addNode;
using GrapholModel::Test::RecordingIndexListener;

TEST(ProjectIndexMetadata, SurvivesRemovalOfItsItems) {
    ProjectIndex index;
    Diagram d(DiagramId("d"));
    index.addDiagram(d);
    GrapholItem* a = addNode(index, d, "a", ItemType::RoleNode, "worksFor");
    GrapholItem* b = addNode(index, d, "b", ItemType::RoleNode, "worksFor");

    PredicateMetaData md = PredicateMetaData::create(ItemType::RoleNode, "worksFor");
    md.role()->transitive = true;
    md.setDescription(QStringLiteral("Employment relation"));
    ASSERT_TRUE(index.addMeta(ItemType::RoleNode, QStringLiteral("worksFor"), md).changed());

    index.removeItem(d, *a);
    index.removeItem(d, *b);
    EXPECT_EQ(index.predicateCount(ItemType::RoleNode), 0);

    EXPECT_TRUE(index.hasMeta(ItemType::RoleNode, QStringLiteral("worksFor")));
    EXPECT_EQ(index.meta(ItemType::RoleNode, QStringLiteral("worksFor")), md);
}

TEST(ProjectIndexMetadata, MetaCanPrecedeItems) {
    ProjectIndex index;
    PredicateMetaData md = PredicateMetaData::create(ItemType::ConceptNode, "Person");
    md.setUrl(QStringLiteral("http://example.com/Person"));
    ASSERT_TRUE(index.addMeta(ItemType::ConceptNode, QStringLiteral("Person"), md).ok());

    EXPECT_TRUE(index.isEmpty());
    EXPECT_EQ(index.metaCount(), 1);
    EXPECT_EQ(index.meta(ItemType::ConceptNode, QStringLiteral("Person")).url(),
              QStringLiteral("http://example.com/Person"));
}

TEST(ProjectIndexMetadata, DefaultsForUnknownPredicates) {
    ProjectIndex index;

    const PredicateMetaData attr = index.meta(ItemType::AttributeNode, QStringLiteral("age"));
    EXPECT_EQ(attr.kind(), MetaDataKind::Attribute);
    EXPECT_EQ(attr.type(), ItemType::AttributeNode);
    EXPECT_EQ(attr.predicate(), QStringLiteral("age"));
    EXPECT_FALSE(attr.isFunctional());
    EXPECT_TRUE(attr.isEmpty());

    EXPECT_FALSE(index.hasMeta(ItemType::AttributeNode, QStringLiteral("age")));
    EXPECT_EQ(index.metaCount(), 0);
}

TEST(ProjectIndexMetadata, CustomFactory) {
    ProjectIndex index;
    index.setMetaDataFactory([](ItemType type, const QString& name) {
        PredicateMetaData md(type, name);
        md.setDescription(QStringLiteral("generated"));
        return md;
    });
    EXPECT_EQ(index.meta(ItemType::RoleNode, QStringLiteral("r")).description(), QStringLiteral("generated"));
    EXPECT_EQ(index.meta(ItemType::RoleNode, QStringLiteral("r")).kind(), MetaDataKind::Plain);

    index.setMetaDataFactory({});
    EXPECT_EQ(index.meta(ItemType::RoleNode, QStringLiteral("r")).kind(), MetaDataKind::Role);
}

TEST(ProjectIndexMetadata, KeysUseNormalizedNames) {
    ProjectIndex index;
    index.addMeta(ItemType::RoleNode, QStringLiteral("works for"),
                  PredicateMetaData::create(ItemType::RoleNode, "works for"));

    EXPECT_TRUE(index.hasMeta(ItemType::RoleNode, QStringLiteral("works_for")));
    EXPECT_FALSE(index.hasMeta(ItemType::AttributeNode, QStringLiteral("works_for")));
    ASSERT_EQ(index.metas().size(), 1);
    EXPECT_EQ(index.metas().first().name, QStringLiteral("works_for"));

    EXPECT_TRUE(index.removeMeta(ItemType::RoleNode, QStringLiteral("works_for")).changed());
    EXPECT_EQ(index.metaCount(), 0);
}

TEST(ProjectIndexMetadata, ReplaceRemoveAndClear) {
    ProjectIndex index;
    RecordingIndexListener listener;
    index.addListener(&listener);

    index.addMeta(ItemType::ConceptNode, QStringLiteral("B"), PredicateMetaData::create(ItemType::ConceptNode, "B"));
    index.addMeta(ItemType::RoleNode, QStringLiteral("A"), PredicateMetaData::create(ItemType::RoleNode, "A"));
    index.addMeta(ItemType::ConceptNode, QStringLiteral("A"), PredicateMetaData::create(ItemType::ConceptNode, "A"));

    PredicateMetaData replaced = PredicateMetaData::create(ItemType::ConceptNode, "B");
    replaced.setDescription(QStringLiteral("second"));
    index.addMeta(ItemType::ConceptNode, QStringLiteral("B"), replaced);
    EXPECT_EQ(index.metaCount(), 3);
    EXPECT_EQ(index.meta(ItemType::ConceptNode, QStringLiteral("B")).description(), QStringLiteral("second"));

    const QVector<PredicateKey> all = index.metas();
    ASSERT_EQ(all.size(), 3);
    EXPECT_EQ(all.at(0), (PredicateKey{ItemType::ConceptNode, QStringLiteral("A")}));
    EXPECT_EQ(all.at(1), (PredicateKey{ItemType::ConceptNode, QStringLiteral("B")}));
    EXPECT_EQ(all.at(2), (PredicateKey{ItemType::RoleNode, QStringLiteral("A")}));
    EXPECT_EQ(index.metas({ItemType::RoleNode}).size(), 1);
    EXPECT_TRUE(index.metas({ItemType::AttributeNode}).isEmpty());

    const IndexResult missing = index.removeMeta(ItemType::AttributeNode, QStringLiteral("A"));
    EXPECT_TRUE(missing.ok());
    EXPECT_FALSE(missing.changed());

    EXPECT_TRUE(index.removeMeta(ItemType::RoleNode, QStringLiteral("A")).changed());
    EXPECT_TRUE(index.clearMetas().changed());
    EXPECT_EQ(index.metaCount(), 0);
    EXPECT_FALSE(index.clearMetas().changed());

    EXPECT_EQ(listener.events, (QStringList{QStringLiteral("metaAdded:concept/B"),
                                            QStringLiteral("metaAdded:role/A"),
                                            QStringLiteral("metaAdded:concept/A"),
                                            QStringLiteral("metaAdded:concept/B"),
                                            QStringLiteral("metaRemoved:role/A"),
                                            QStringLiteral("metasCleared")}));
}

TEST(ProjectIndexMetadata, OnlyPredicateTypesCarryMetadata) {
    ProjectIndex index;
    const IndexResult r = index.addMeta(ItemType::UnionNode, QStringLiteral("or"),
                                        PredicateMetaData(ItemType::UnionNode, QStringLiteral("or")));
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error().code(), IndexErrorCode::InvalidArgument);
    EXPECT_EQ(index.metaCount(), 0);
}

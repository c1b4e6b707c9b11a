#include <gtest/gtest.h>

#include "grapholmodel/ItemType.hpp"

using namespace GrapholModel;

static_assert(isPredicateType(ItemType::IndividualNode));
static_assert(!isPredicateType(ItemType::DomainRestrictionNode));
static_assert(isNodeType(ItemType::HasKeyNode));
static_assert(!isNodeType(ItemType::InclusionEdge));
static_assert(isEdgeType(ItemType::DifferentEdge));
static_assert(!isEdgeType(ItemType::Label));

TEST(ItemType, ClassificationIsExclusive) {
    for (quint32 v = static_cast<quint32>(ItemType::ConceptNode);
         v <= static_cast<quint32>(ItemType::Undefined); ++v) {
        const auto t = static_cast<ItemType>(v);
        EXPECT_FALSE(isNodeType(t) && isEdgeType(t)) << v;
        if (isPredicateType(t))
            EXPECT_TRUE(isNodeType(t)) << v;
    }

    EXPECT_FALSE(isNodeType(ItemType::Label));
    EXPECT_FALSE(isNodeType(ItemType::Undefined));
    EXPECT_FALSE(isEdgeType(ItemType::Undefined));
}

TEST(ItemType, FileFormatCodes) {
    EXPECT_EQ(static_cast<quint32>(ItemType::ConceptNode), 65537u);
    EXPECT_EQ(static_cast<quint32>(ItemType::InclusionEdge), 65556u);
    EXPECT_EQ(static_cast<quint32>(ItemType::Undefined), 65563u);
}

TEST(ItemType, Names) {
    EXPECT_EQ(itemTypeName(ItemType::RoleNode), QStringLiteral("role node"));
    EXPECT_EQ(itemTypeShortName(ItemType::RoleNode), QStringLiteral("role"));
    EXPECT_EQ(itemTypeName(ItemType::EquivalenceEdge), QStringLiteral("equivalence edge"));
    EXPECT_EQ(itemTypeShortName(ItemType::EquivalenceEdge), QStringLiteral("equivalence"));
    EXPECT_EQ(itemTypeShortName(ItemType::ValueDomainNode), QStringLiteral("value domain"));
    EXPECT_EQ(itemTypeShortName(ItemType::Label), QStringLiteral("label"));
}

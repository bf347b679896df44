// =============================================================================
// Transaction Grouper Tests
// =============================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <set>

#include "factlog/reconstruct/grouper.hpp"
#include "order_history.hpp"

using namespace factlog;
using namespace factlog::testing;

namespace {

// Order-insensitive view of a group's contents
std::multiset<std::string> fact_keys(const TxGroup& group) {
    std::multiset<std::string> keys;
    for (const auto& f : group.facts) {
        keys.insert(f.attribute + "|" + f.value.encode() + "|" + (f.added ? "+" : "-"));
    }
    return keys;
}

} // namespace

TEST(GrouperTest, EmptyInputYieldsNoGroups) {
    EXPECT_TRUE(group_by_transaction({}).empty());
}

TEST(GrouperTest, OneGroupPerTransactionAscending) {
    auto groups = group_by_transaction(order_history());

    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].tx, TX_PLACE);
    EXPECT_EQ(groups[1].tx, TX_ASSIGN);
    EXPECT_EQ(groups[2].tx, TX_SHIP);

    EXPECT_EQ(groups[0].facts.size(), 4u);
    EXPECT_EQ(groups[1].facts.size(), 4u);
    EXPECT_EQ(groups[2].facts.size(), 7u);

    for (const auto& group : groups) {
        for (const auto& fact : group.facts) {
            EXPECT_EQ(fact.tx, group.tx);
        }
    }
}

TEST(GrouperTest, InvariantUnderPermutation) {
    auto facts = order_history();
    auto expected = group_by_transaction(facts);

    std::mt19937 rng(20180701);
    for (int round = 0; round < 25; ++round) {
        std::shuffle(facts.begin(), facts.end(), rng);
        auto groups = group_by_transaction(facts);

        ASSERT_EQ(groups.size(), expected.size());
        for (size_t i = 0; i < groups.size(); ++i) {
            EXPECT_EQ(groups[i].tx, expected[i].tx);
            EXPECT_EQ(fact_keys(groups[i]), fact_keys(expected[i]));
        }
    }
}

TEST(GrouperTest, GroupingIgnoresAttributeAndValue) {
    std::vector<FactRecord> facts = {
        {7, "a", 1, true},
        {3, "a", 1, true},
        {7, "b", 1, true},
        {3, "b", 2, true},
    };
    auto groups = group_by_transaction(facts);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].tx, 3);
    EXPECT_EQ(groups[1].tx, 7);
    EXPECT_EQ(groups[0].facts.size(), 2u);
    EXPECT_EQ(groups[1].facts.size(), 2u);
}

TEST(GrouperTest, CarriesTransactionInstant) {
    Instant when(1530446400000);
    std::vector<FactRecord> facts = {
        {1, "a", "x", true},
        {1, "b", "y", true, when},
        {2, "a", "z", true},
    };
    auto groups = group_by_transaction(facts);
    ASSERT_EQ(groups.size(), 2u);
    ASSERT_TRUE(groups[0].tx_instant.has_value());
    EXPECT_EQ(*groups[0].tx_instant, when);
    EXPECT_FALSE(groups[1].tx_instant.has_value());
}

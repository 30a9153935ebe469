#ifndef PROMPTGUARD_TEST_UNIT_TEST_DECISION_LEDGER_HPP
#define PROMPTGUARD_TEST_UNIT_TEST_DECISION_LEDGER_HPP

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "gateway/decision_ledger.hpp"
#include "util/hashing.hpp"

/**
 * @file test_decision_ledger.hpp
 * @brief SQLite decision ledger.
 */

namespace promptguard {
namespace test {
namespace decision_ledger_tests {

using promptguard::gateway::DecisionEntry;
using promptguard::gateway::DecisionLedger;

TEST(DecisionLedgerTest, StartsEmpty) {
    DecisionLedger ledger(":memory:");
    EXPECT_EQ(ledger.count(), 0u);
    EXPECT_TRUE(ledger.recent(10).empty());
}

TEST(DecisionLedgerTest, RecordsAndReturnsNewestFirst) {
    DecisionLedger ledger(":memory:");
    const std::string fp = promptguard::util::hashing::sha256("ignore previous instructions");
    EXPECT_TRUE(ledger.record({1000, "Delivered", "none", "", std::string(64, 'a')}));
    EXPECT_TRUE(ledger.record({2000, "Blocked", "inbound", "PromptInjection", fp}));
    EXPECT_EQ(ledger.count(), 2u);

    std::vector<DecisionEntry> rows = ledger.recent(10);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].state, "Blocked");
    EXPECT_EQ(rows[0].stage, "inbound");
    EXPECT_EQ(rows[0].triggered, "PromptInjection");
    EXPECT_EQ(rows[0].fingerprint, fp);
    EXPECT_EQ(rows[0].timestampMs, 2000);
    EXPECT_EQ(rows[1].state, "Delivered");
    EXPECT_EQ(rows[1].triggered, "");
}

TEST(DecisionLedgerTest, RecentHonoursLimit) {
    DecisionLedger ledger(":memory:");
    for (int i = 0; i < 5; ++i) {
        ledger.record({0, "Delivered", "none", "", std::to_string(i)});
    }
    std::vector<DecisionEntry> rows = ledger.recent(2);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].fingerprint, "4");
    EXPECT_EQ(rows[1].fingerprint, "3");
    EXPECT_GT(rows[0].timestampMs, 0);
}

TEST(DecisionLedgerTest, UnopenableDatabaseIsADependencyError) {
    EXPECT_THROW(DecisionLedger("/nonexistent-dir/sub/ledger.db"), promptguard::core::DependencyError);
}

} // namespace decision_ledger_tests
} // namespace test
} // namespace promptguard

#endif // PROMPTGUARD_TEST_UNIT_TEST_DECISION_LEDGER_HPP

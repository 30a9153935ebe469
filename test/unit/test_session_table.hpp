#ifndef PROMPTGUARD_TEST_UNIT_TEST_SESSION_TABLE_HPP
#define PROMPTGUARD_TEST_UNIT_TEST_SESSION_TABLE_HPP

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "core/vault.hpp"
#include "gateway/session_table.hpp"
#include "pipeline/pipeline_runner.hpp"
#include "pipeline/scanner_set.hpp"

/**
 * @file test_session_table.hpp
 * @brief Session creation, reuse, LRU eviction and idle expiry.
 */

namespace promptguard {
namespace test {
namespace session_table_tests {

using gateway::SessionTable;

namespace {

SessionTable::RunnerFactory countingFactory(std::shared_ptr<int> builds)
{
    return [builds](const std::shared_ptr<core::Vault> &) {
        ++*builds;
        return std::make_unique<pipeline::PipelineRunner>(pipeline::ScannerSet(core::Direction::Inbound),
                                                          pipeline::ScannerSet(core::Direction::Outbound));
    };
}

} // namespace

TEST(SessionTableTest, SameIdReusesSessionAndVault) {
    auto builds = std::make_shared<int>(0);
    SessionTable table(countingFactory(builds), 4, std::chrono::seconds(60));

    auto a = table.acquire("a");
    auto again = table.acquire("a");
    auto b = table.acquire("b");
    EXPECT_EQ(a, again);
    EXPECT_NE(a->vault, b->vault);
    EXPECT_EQ(*builds, 2);
    EXPECT_EQ(table.size(), 2u);

    a->vault->reserve("a@b.com", "EMAIL");
    EXPECT_FALSE(b->vault->resolve("[REDACTED_EMAIL_1]").has_value());
}

TEST(SessionTableTest, LeastRecentlyUsedSessionIsEvicted) {
    auto builds = std::make_shared<int>(0);
    SessionTable table(countingFactory(builds), 2, std::chrono::seconds(60));

    table.acquire("first");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    auto second = table.acquire("second");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    table.acquire("first");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    table.acquire("third");

    EXPECT_EQ(table.size(), 2u);
    EXPECT_TRUE(table.contains("first"));
    EXPECT_FALSE(table.contains("second"));
    EXPECT_TRUE(table.contains("third"));
    // A request still holding an evicted session can finish with it.
    EXPECT_TRUE(second->runner != nullptr);
    EXPECT_EQ(second->vault->reserve("a@b.com", "EMAIL"), "[REDACTED_EMAIL_1]");
}

TEST(SessionTableTest, IdleSessionsExpire) {
    auto builds = std::make_shared<int>(0);
    SessionTable table(countingFactory(builds), 8, std::chrono::seconds(60));
    table.acquire("a");
    table.acquire("b");

    EXPECT_EQ(table.expireIdle(SessionTable::Clock::now()), 0u);
    EXPECT_EQ(table.expireIdle(SessionTable::Clock::now() + std::chrono::minutes(5)), 2u);
    EXPECT_EQ(table.size(), 0u);
}

TEST(SessionTableTest, EndForgetsTheVault) {
    auto builds = std::make_shared<int>(0);
    SessionTable table(countingFactory(builds), 8, std::chrono::seconds(60), 5);
    auto s = table.acquire("s");
    EXPECT_EQ(s->vault->maxEntries(), 5u);
    s->vault->reserve("a@b.com", "EMAIL");

    EXPECT_TRUE(table.end("s"));
    EXPECT_FALSE(table.end("s"));
    EXPECT_EQ(s->vault->size(), 0u);
    EXPECT_NE(table.acquire("s")->vault, s->vault);
}

TEST(SessionTableTest, FactoryFailureStoresNothing) {
    SessionTable table([](const std::shared_ptr<core::Vault> &) -> std::unique_ptr<pipeline::PipelineRunner> {
        throw std::runtime_error("scanner set unavailable");
    }, 8, std::chrono::seconds(60));
    EXPECT_THROW(table.acquire("s"), std::runtime_error);
    EXPECT_EQ(table.size(), 0u);
}

} // namespace session_table_tests
} // namespace test
} // namespace promptguard

#endif // PROMPTGUARD_TEST_UNIT_TEST_SESSION_TABLE_HPP

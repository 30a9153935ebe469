#ifndef PROMPTGUARD_TEST_UNIT_TEST_VAULT_HPP
#define PROMPTGUARD_TEST_UNIT_TEST_VAULT_HPP

#include <gtest/gtest.h>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "core/vault.hpp"

/**
 * @file test_vault.hpp
 * @brief Vault placeholder issuance, resolution, eviction and session reset.
 */

namespace promptguard {
namespace test {
namespace vault_tests {

using promptguard::core::Vault;

TEST(VaultTest, SameValueGetsSamePlaceholderWithinSession) {
    Vault vault;
    std::string first = vault.reserve("a@b.com", "EMAIL");
    std::string second = vault.reserve("a@b.com", "EMAIL");
    EXPECT_EQ(first, "[REDACTED_EMAIL_1]");
    EXPECT_EQ(first, second);
    EXPECT_EQ(vault.size(), 1u);
}

TEST(VaultTest, CountersArePerCategory) {
    Vault vault;
    EXPECT_EQ(vault.reserve("a@b.com", "EMAIL"), "[REDACTED_EMAIL_1]");
    EXPECT_EQ(vault.reserve("c@d.org", "EMAIL"), "[REDACTED_EMAIL_2]");
    EXPECT_EQ(vault.reserve("555-123-4567", "PHONE"), "[REDACTED_PHONE_1]");
}

TEST(VaultTest, CategoryIsNormalised) {
    Vault vault;
    EXPECT_EQ(vault.reserve("x", "ip address"), "[REDACTED_IP_ADDRESS_1]");
    EXPECT_EQ(vault.reserve("y", ""), "[REDACTED_PII_1]");
}

TEST(VaultTest, ResolveReturnsOriginalOrNothing) {
    Vault vault;
    std::string ph = vault.reserve("123-45-6789", "SSN");
    auto original = vault.resolve(ph);
    ASSERT_TRUE(original.has_value());
    EXPECT_EQ(*original, "123-45-6789");
    EXPECT_FALSE(vault.resolve("[REDACTED_SSN_99]").has_value());
}

TEST(VaultTest, NeverIssuesPlaceholderAlreadyInText) {
    Vault vault;
    const std::string message = "Forward [REDACTED_EMAIL_1] to a@b.com";
    std::string ph = vault.reserve("a@b.com", "EMAIL", message);
    EXPECT_EQ(ph, "[REDACTED_EMAIL_2]");
    EXPECT_EQ(message.find(ph), std::string::npos);
    EXPECT_FALSE(vault.resolve("[REDACTED_EMAIL_1]").has_value());
}

TEST(VaultTest, StablePlaceholderIsReplacedWhenItCollidesWithText) {
    Vault vault;
    std::string ph = vault.reserve("a@b.com", "EMAIL");
    ASSERT_EQ(ph, "[REDACTED_EMAIL_1]");
    std::string again = vault.reserve("a@b.com", "EMAIL", "literal [REDACTED_EMAIL_1] and a@b.com");
    EXPECT_NE(again, ph);
    EXPECT_EQ(*vault.resolve(again), "a@b.com");
    EXPECT_EQ(*vault.resolve(ph), "a@b.com");
}

TEST(VaultTest, OldestEntriesAreEvictedBeyondCapacity) {
    Vault vault(3);
    std::vector<std::string> placeholders;
    for (int i = 1; i <= 5; ++i) {
        placeholders.push_back(vault.reserve("user" + std::to_string(i) + "@b.com", "EMAIL"));
    }
    EXPECT_EQ(vault.size(), 3u);
    EXPECT_FALSE(vault.resolve(placeholders[0]).has_value());
    EXPECT_FALSE(vault.resolve(placeholders[1]).has_value());
    EXPECT_EQ(*vault.resolve(placeholders[4]), "user5@b.com");

    // Evicted names are not reused for a different value.
    std::string again = vault.reserve("user1@b.com", "EMAIL");
    EXPECT_EQ(again, "[REDACTED_EMAIL_6]");
    EXPECT_EQ(vault.size(), 3u);
}

TEST(VaultTest, ClearForgetsEverythingAndStartsNewSession) {
    Vault vault;
    std::string oldSession = vault.sessionId();
    std::string ph = vault.reserve("a@b.com", "EMAIL");
    vault.clear();
    EXPECT_EQ(vault.size(), 0u);
    EXPECT_FALSE(vault.resolve(ph).has_value());
    EXPECT_NE(vault.sessionId(), oldSession);
    EXPECT_EQ(vault.reserve("other@b.com", "EMAIL"), "[REDACTED_EMAIL_1]");
}

TEST(VaultTest, SessionIdIsHex) {
    Vault vault;
    std::string id = vault.sessionId();
    EXPECT_EQ(id.size(), 16u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(VaultTest, ConcurrentReservationsNeverCollide) {
    Vault vault;
    const int threads = 8;
    const int perThread = 200;
    std::vector<std::vector<std::string>> issued(threads);
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&vault, &issued, t, perThread]() {
            for (int i = 0; i < perThread; ++i) {
                std::string value = "user" + std::to_string(t) + "_" + std::to_string(i) + "@example.com";
                issued[t].push_back(vault.reserve(value, "EMAIL"));
            }
        });
    }
    for (auto &w : workers) {
        w.join();
    }

    std::set<std::string> unique;
    for (int t = 0; t < threads; ++t) {
        for (int i = 0; i < perThread; ++i) {
            const std::string &ph = issued[t][i];
            unique.insert(ph);
            auto original = vault.resolve(ph);
            ASSERT_TRUE(original.has_value());
            EXPECT_EQ(*original, "user" + std::to_string(t) + "_" + std::to_string(i) + "@example.com");
        }
    }
    EXPECT_EQ(unique.size(), static_cast<size_t>(threads * perThread));
    EXPECT_EQ(vault.size(), static_cast<size_t>(threads * perThread));
}

} // namespace vault_tests
} // namespace test
} // namespace promptguard

#endif // PROMPTGUARD_TEST_UNIT_TEST_VAULT_HPP

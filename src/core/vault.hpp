#ifndef PROMPTGUARD_CORE_VAULT_HPP
#define PROMPTGUARD_CORE_VAULT_HPP

#include <algorithm>
#include <cctype>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include "../util/hashing.hpp"
#include "../util/logger.hpp"

/**
 * @file vault.hpp
 * @brief Reversible store between placeholder tokens and the sensitive values they replaced.
 *
 * DESIGN:
 *   - Placeholders look like [REDACTED_EMAIL_1]; numbering is per category.
 *   - Anonymization is stable within a session: reserving the same (category, value)
 *     twice returns the same placeholder.
 *   - A placeholder is never handed out if it already occurs literally in the text
 *     being anonymized; the counter skips ahead instead.
 *   - At most maxEntries() placeholders are held. Reserving beyond that evicts
 *     the oldest one, which then resolves as unknown. Counters never rewind, so
 *     an evicted placeholder name is not handed out again in the same session.
 *   - clear() drops everything and starts a new session id.
 *   - All public methods lock a single mutex, so concurrent requests may share one Vault.
 *
 * USAGE:
 *   @code
 *   promptguard::core::Vault vault;
 *   std::string ph = vault.reserve("a@b.com", "EMAIL", message);   // "[REDACTED_EMAIL_1]"
 *   auto original = vault.resolve(ph);                            // "a@b.com"
 *   vault.clear();                                                // end of conversation
 *   @endcode
 */

namespace promptguard {
namespace core {

class Vault
{
public:
    static constexpr size_t kDefaultMaxEntries = 10000;

    explicit Vault(size_t maxEntries = kDefaultMaxEntries)
        : maxEntries_(maxEntries == 0 ? kDefaultMaxEntries : maxEntries),
          sessionId_(util::hashing::randomHex(8))
    {
    }

    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    /**
     * @brief Placeholder for @p original in @p category, creating one if needed.
     * @param original The sensitive value being redacted.
     * @param category Upper-case entity label (EMAIL, PHONE, ...). Sanitised to [A-Z0-9_].
     * @param surroundingText Text the placeholder will be inserted into; a fresh
     *        placeholder never equals a substring already present there.
     */
    std::string reserve(const std::string &original,
                        const std::string &category = "PII",
                        const std::string &surroundingText = std::string())
    {
        const std::string cat = normaliseCategory(category);
        const std::string key = cat + '\x1f' + original;

        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = byOriginal_.find(key);
        if (existing != byOriginal_.end()
            && surroundingText.find(existing->second) == std::string::npos) {
            return existing->second;
        }

        size_t &counter = counters_[cat];
        std::string placeholder;
        do {
            ++counter;
            placeholder = "[REDACTED_" + cat + "_" + std::to_string(counter) + "]";
        } while (byPlaceholder_.count(placeholder) > 0
                 || surroundingText.find(placeholder) != std::string::npos);

        while (order_.size() >= maxEntries_) {
            evictOldest();
        }
        byPlaceholder_[placeholder] = original;
        byOriginal_[key] = placeholder;
        order_.emplace_back(placeholder, key);
        util::logger::debug("[Vault] session " + sessionId_ + " reserved " + placeholder);
        return placeholder;
    }

    /**
     * @return The original value, or std::nullopt if the placeholder is unknown.
     */
    std::optional<std::string> resolve(const std::string &placeholder) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = byPlaceholder_.find(placeholder);
        if (it == byPlaceholder_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Drop every entry and start a new session. Counters restart at 1.
     */
    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        util::logger::info("[Vault] clearing session " + sessionId_ + " ("
                           + std::to_string(byPlaceholder_.size()) + " entries)");
        byPlaceholder_.clear();
        byOriginal_.clear();
        order_.clear();
        counters_.clear();
        sessionId_ = util::hashing::randomHex(8);
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return byPlaceholder_.size();
    }

    size_t maxEntries() const { return maxEntries_; }

    std::string sessionId() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessionId_;
    }

private:
    // Caller holds mutex_.
    void evictOldest()
    {
        const auto &oldest = order_.front();
        byPlaceholder_.erase(oldest.first);
        auto it = byOriginal_.find(oldest.second);
        if (it != byOriginal_.end() && it->second == oldest.first) {
            byOriginal_.erase(it);
        }
        util::logger::debug("[Vault] session " + sessionId_ + " evicted " + oldest.first);
        order_.pop_front();
    }

    static std::string normaliseCategory(const std::string &category)
    {
        std::string out;
        out.reserve(category.size());
        for (unsigned char c : category) {
            if (std::isalnum(c)) {
                out.push_back(static_cast<char>(std::toupper(c)));
            } else {
                out.push_back('_');
            }
        }
        return out.empty() ? std::string("PII") : out;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> byPlaceholder_;
    std::unordered_map<std::string, std::string> byOriginal_;
    std::deque<std::pair<std::string, std::string>> order_;  ///< (placeholder, original key), oldest first
    std::map<std::string, size_t> counters_;
    const size_t maxEntries_;
    std::string sessionId_;
};

} // namespace core
} // namespace promptguard

#endif // PROMPTGUARD_CORE_VAULT_HPP

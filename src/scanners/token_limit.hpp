#ifndef PROMPTGUARD_SCANNERS_TOKEN_LIMIT_HPP
#define PROMPTGUARD_SCANNERS_TOKEN_LIMIT_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include "scanner.hpp"
#include "../classifiers/providers.hpp"
#include "../core/errors.hpp"

namespace promptguard {
namespace scanners {

/**
 * @class TokenLimit
 * @brief Rejects prompts longer than the model's token budget.
 *        Valid: score = count / limit. Invalid: score = 1.0. Text is never cut.
 *        Text longer than kMaxBytesPerToken bytes per allowed token is rejected
 *        on its size alone, without being counted.
 */
class TokenLimit : public Scanner
{
public:
    static constexpr size_t kMaxBytesPerToken = 32;

    TokenLimit(std::shared_ptr<classifiers::TokenCounter> counter, size_t limit)
        : Scanner("TokenLimit"), counter_(std::move(counter)), limit_(limit)
    {
        if (!counter_) {
            throw std::invalid_argument("TokenLimit requires a token counter");
        }
        if (limit_ == 0) {
            throw core::ConfigurationError("TokenLimit: limit must be positive");
        }
    }

    bool supports(Direction direction) const override
    {
        return direction == Direction::Inbound;
    }

    ScanOutput scan(const std::string &text,
                    const std::optional<std::string> &) const override
    {
        if (text.size() / kMaxBytesPerToken >= limit_) {
            return ScanOutput::fail(text, 1.0, std::to_string(text.size()) + " bytes exceed the "
                                                   + std::to_string(limit_) + " token limit");
        }
        const size_t tokens = counter_->count(text);
        const std::string details = std::to_string(tokens) + "/" + std::to_string(limit_) + " tokens";
        if (tokens > limit_) {
            return ScanOutput::fail(text, 1.0, details);
        }
        return ScanOutput::pass(text, static_cast<double>(tokens) / static_cast<double>(limit_), details);
    }

    size_t limit() const { return limit_; }

private:
    std::shared_ptr<classifiers::TokenCounter> counter_;
    size_t limit_;
};

} // namespace scanners
} // namespace promptguard

#endif // PROMPTGUARD_SCANNERS_TOKEN_LIMIT_HPP

#ifndef PROMPTGUARD_SCANNERS_SCANNER_HPP
#define PROMPTGUARD_SCANNERS_SCANNER_HPP

#include <algorithm>
#include <optional>
#include <string>
#include <vector>
#include "../core/scan_mode.hpp"

/**
 * @file scanner.hpp
 * @brief The unit of work of a pipeline: text in, (text, verdict, risk score) out.
 *
 * Contract:
 *   - scan() receives the text produced by the previous scanner and, optionally,
 *     the prior text (the user's original prompt on the outbound side).
 *   - It returns the possibly modified text, a validity flag and a risk score in [0,1].
 *   - It may throw on an internal failure; the PipelineRunner turns that into a
 *     fail-closed record. It must not hold locks across the call.
 *   - Implementations are shared between concurrent requests and must be
 *     thread-safe; only Anonymize/Deanonymize touch shared state (the Vault).
 */

namespace promptguard {
namespace scanners {

using core::Direction;
using core::ScanMode;

/**
 * @struct ScanOutput
 * @brief What a single scanner reports for one text.
 */
struct ScanOutput
{
    std::string text;
    bool valid = true;
    double score = 0.0;
    std::string details;                 ///< short human-readable reason, may be empty
    std::vector<std::string> warnings;   ///< non-fatal findings, e.g. vault misses

    static ScanOutput pass(std::string text, double score = 0.0, std::string details = std::string())
    {
        ScanOutput out;
        out.text = std::move(text);
        out.valid = true;
        out.score = score;
        out.details = std::move(details);
        return out;
    }

    static ScanOutput fail(std::string text, double score, std::string details)
    {
        ScanOutput out;
        out.text = std::move(text);
        out.valid = false;
        out.score = score;
        out.details = std::move(details);
        return out;
    }
};

inline double clampScore(double score)
{
    return std::min(1.0, std::max(0.0, score));
}

class Scanner
{
public:
    Scanner(std::string name, ScanMode mode = ScanMode::Block)
        : name_(std::move(name)), mode_(mode)
    {
    }

    virtual ~Scanner() = default;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    /// Stable identity used in reports and block messages.
    const std::string &name() const { return name_; }

    ScanMode mode() const { return mode_; }

    /**
     * @brief True for scanners whose job is to rewrite text (Anonymize, Deanonymize).
     *        Such scanners never reject.
     */
    virtual bool transformsText() const { return false; }

    /**
     * @brief Directions this scanner may be placed in.
     */
    virtual bool supports(Direction direction) const = 0;

    virtual ScanOutput scan(const std::string &text,
                            const std::optional<std::string> &priorText) const = 0;

private:
    std::string name_;
    ScanMode mode_;
};

} // namespace scanners
} // namespace promptguard

#endif // PROMPTGUARD_SCANNERS_SCANNER_HPP

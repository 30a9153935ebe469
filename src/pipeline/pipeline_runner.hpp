#ifndef PROMPTGUARD_PIPELINE_PIPELINE_RUNNER_HPP
#define PROMPTGUARD_PIPELINE_PIPELINE_RUNNER_HPP

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include "scan_result.hpp"
#include "scanner_set.hpp"
#include "../core/errors.hpp"
#include "../util/logger.hpp"

/**
 * @file pipeline_runner.hpp
 * @brief Executes a ScannerSet over a text and aggregates the verdicts.
 *
 * POLICY:
 *   - Scanners run sequentially in declared order; each receives the text
 *     produced by the previous one, plus the caller's priorText unchanged.
 *   - Run-all, block-on-any: an invalid verdict never stops the loop. The
 *     aggregate verdict is Block if any Block-mode scanner is invalid.
 *   - Monitor-mode scanners that are invalid land in ScanResult::monitored.
 *   - Fail-closed: a scanner that throws is recorded as invalid with score 1.0
 *     and counts as a block whatever its mode. The text it was given is passed
 *     on unchanged to the next scanner.
 *
 * USAGE:
 *   @code
 *   ScannerSet in(Direction::Inbound);
 *   in.add(std::make_shared<scanners::Anonymize>(vault));
 *   ScannerSet out(Direction::Outbound);
 *   out.add(std::make_shared<scanners::Deanonymize>(vault));
 *   PipelineRunner runner(std::move(in), std::move(out));
 *   ScanResult r = runner.run(Direction::Inbound, "My email is a@b.com");
 *   @endcode
 */

namespace promptguard {
namespace pipeline {

class PipelineRunner
{
public:
    /**
     * @throw core::ConfigurationError if a set has the wrong direction or violates
     *        the ordering rules.
     */
    PipelineRunner(ScannerSet inbound, ScannerSet outbound)
        : inbound_(std::move(inbound)), outbound_(std::move(outbound))
    {
        if (inbound_.direction() != core::Direction::Inbound
            || outbound_.direction() != core::Direction::Outbound) {
            throw core::ConfigurationError("PipelineRunner: scanner sets passed in the wrong direction");
        }
        inbound_.validate();
        outbound_.validate();
    }

    const ScannerSet &set(core::Direction direction) const
    {
        return direction == core::Direction::Inbound ? inbound_ : outbound_;
    }

    /**
     * @param priorText on the outbound side, the user's original (pre-anonymization) prompt.
     */
    ScanResult run(core::Direction direction,
                   const std::string &text,
                   const std::optional<std::string> &priorText = std::nullopt) const
    {
        ScanResult result;
        result.direction = direction;
        result.text = text;

        for (const auto &scanner : set(direction).scanners()) {
            ScannerRecord record;
            record.scanner = scanner->name();
            record.mode = scanner->mode();

            auto started = std::chrono::steady_clock::now();
            try {
                scanners::ScanOutput out = scanner->scan(result.text, priorText);
                record.valid = out.valid;
                record.score = scanners::clampScore(out.score);
                record.details = std::move(out.details);
                result.text = std::move(out.text);
                for (auto &w : out.warnings) {
                    result.warnings.push_back({scanner->name(), warningKind(w), std::move(w)});
                }
            }
            catch (const std::exception &ex) {
                markFaulted(record, ex.what());
            }
            catch (...) {
                markFaulted(record, "unknown exception");
            }
            record.elapsedMs = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - started).count();

            if (!record.valid) {
                if (record.faulted || record.mode == core::ScanMode::Block) {
                    result.triggered.push_back(record.scanner);
                } else {
                    result.monitored.push_back(record.scanner);
                    result.warnings.push_back({record.scanner, "Monitor", record.details});
                    util::logger::warn("[" + core::toString(direction) + "] " + record.scanner
                                       + " flagged (monitor only): " + record.details);
                }
            }
            util::logger::debug("[" + core::toString(direction) + "] " + record.scanner
                                + " valid=" + (record.valid ? "true" : "false")
                                + " score=" + std::to_string(record.score));
            result.records.push_back(std::move(record));
        }

        result.verdict = result.triggered.empty() ? Verdict::Allow : Verdict::Block;
        return result;
    }

private:
    ScannerSet inbound_;
    ScannerSet outbound_;

    static std::string warningKind(const std::string &message)
    {
        auto colon = message.find(':');
        if (colon != std::string::npos && colon > 0 && message.find(' ') > colon) {
            return message.substr(0, colon);
        }
        return "Warning";
    }

    static void markFaulted(ScannerRecord &record, const std::string &what)
    {
        const core::ScannerFault fault(record.scanner, what);
        record.valid = false;
        record.faulted = true;
        record.score = 1.0;
        record.details = fault.what();
        util::logger::error("[PipelineRunner] " + std::string(fault.what()) + ", failing closed");
    }
};

} // namespace pipeline
} // namespace promptguard

#endif // PROMPTGUARD_PIPELINE_PIPELINE_RUNNER_HPP

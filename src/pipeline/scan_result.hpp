#ifndef PROMPTGUARD_PIPELINE_SCAN_RESULT_HPP
#define PROMPTGUARD_PIPELINE_SCAN_RESULT_HPP

#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include "../core/scan_mode.hpp"

/**
 * @file scan_result.hpp
 * @brief Per-run report of a PipelineRunner: one record per scanner plus the
 *        aggregate verdict. Created fresh per call and never persisted.
 */

namespace promptguard {
namespace pipeline {

enum class Verdict {
    Allow,
    Block
};

inline const char *toString(Verdict verdict)
{
    return verdict == Verdict::Allow ? "allow" : "block";
}

/**
 * @struct ScanWarning
 * @brief A non-fatal finding, e.g. a placeholder the vault could not resolve.
 */
struct ScanWarning
{
    std::string scanner;
    std::string kind;      ///< "VaultMiss", "Monitor", ...
    std::string message;
};

/**
 * @struct ScannerRecord
 * @brief What one scanner reported during one run.
 */
struct ScannerRecord
{
    std::string scanner;
    bool valid = true;
    double score = 0.0;
    core::ScanMode mode = core::ScanMode::Block;
    bool faulted = false;      ///< scanner threw; always counted as a block
    std::string details;
    double elapsedMs = 0.0;
};

struct ScanResult
{
    core::Direction direction = core::Direction::Inbound;
    std::string text;                       ///< text after every transformation
    Verdict verdict = Verdict::Allow;
    std::vector<std::string> triggered;     ///< scanners that caused the block, in run order
    std::vector<std::string> monitored;     ///< invalid in monitor mode, reported only
    std::vector<ScannerRecord> records;     ///< one per scanner, in run order
    std::vector<ScanWarning> warnings;

    bool blocked() const { return verdict == Verdict::Block; }

    /**
     * @return the record for @p scanner, or nullptr if it did not run.
     */
    const ScannerRecord *find(const std::string &scanner) const
    {
        for (const auto &r : records) {
            if (r.scanner == scanner) {
                return &r;
            }
        }
        return nullptr;
    }

    /// "Name=0.12 Other=0.00" for log lines.
    std::string scoresSummary() const
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        for (size_t i = 0; i < records.size(); ++i) {
            if (i > 0) {
                oss << ' ';
            }
            oss << records[i].scanner << '=';
            if (records[i].faulted) {
                oss << "fault";
            } else {
                oss << records[i].score;
            }
        }
        return oss.str();
    }
};

} // namespace pipeline
} // namespace promptguard

#endif // PROMPTGUARD_PIPELINE_SCAN_RESULT_HPP

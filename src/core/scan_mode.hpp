#ifndef PROMPTGUARD_CORE_SCAN_MODE_HPP
#define PROMPTGUARD_CORE_SCAN_MODE_HPP

#include <string>
#include "errors.hpp"
#include "../util/text_utils.hpp"

namespace promptguard {
namespace core {

/**
 * @brief How an invalid verdict from a scanner is surfaced.
 *   Block   - the verdict contributes to the aggregate block decision.
 *   Monitor - the verdict is reported but never blocks on its own.
 */
enum class ScanMode {
    Block,
    Monitor
};

/**
 * @brief Direction a scanner set is applied in.
 */
enum class Direction {
    Inbound,
    Outbound
};

inline std::string toString(ScanMode mode)
{
    return mode == ScanMode::Block ? "block" : "monitor";
}

inline std::string toString(Direction direction)
{
    return direction == Direction::Inbound ? "inbound" : "outbound";
}

/**
 * @throw ConfigurationError for anything but "block" or "monitor" (case-insensitive).
 */
inline ScanMode parseScanMode(const std::string &value)
{
    std::string lower = util::text::toLower(value);
    if (lower == "block") {
        return ScanMode::Block;
    }
    if (lower == "monitor") {
        return ScanMode::Monitor;
    }
    throw ConfigurationError("invalid scan mode '" + value + "' (expected block or monitor)");
}

} // namespace core
} // namespace promptguard

#endif // PROMPTGUARD_CORE_SCAN_MODE_HPP

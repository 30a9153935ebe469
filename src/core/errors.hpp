#ifndef PROMPTGUARD_CORE_ERRORS_HPP
#define PROMPTGUARD_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Exception types used across the gateway.
 *
 * Propagation:
 *   - ScannerFault never leaves the PipelineRunner; it becomes a fail-closed record.
 *   - GenerationError ends the request inside the Gateway.
 *   - ConfigurationError escapes Gateway construction.
 *   - DependencyError escapes scanner construction; the Gateway turns it into
 *     unprotected mode when the configuration allows it.
 *
 * A vault miss is not an exception, see ScanWarning in scan_result.hpp.
 */

namespace promptguard {
namespace core {

class GuardError : public std::runtime_error
{
public:
    explicit GuardError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @brief A single scanner failed internally.
 */
class ScannerFault : public GuardError
{
public:
    ScannerFault(const std::string &scanner, const std::string &detail)
        : GuardError("scanner '" + scanner + "' failed: " + detail), scanner_(scanner)
    {
    }

    const std::string &scanner() const { return scanner_; }

private:
    std::string scanner_;
};

/**
 * @brief The external text generator is unavailable or returned an error.
 */
class GenerationError : public GuardError
{
public:
    explicit GenerationError(const std::string &what)
        : GuardError(what)
    {
    }
};

/**
 * @brief Invalid configuration value, unknown scanner/topic/language, or bad scanner order.
 */
class ConfigurationError : public GuardError
{
public:
    explicit ConfigurationError(const std::string &what)
        : GuardError(what)
    {
    }
};

/**
 * @brief A capability provider could not be initialised (missing resource, unreadable file).
 */
class DependencyError : public GuardError
{
public:
    explicit DependencyError(const std::string &what)
        : GuardError(what)
    {
    }
};

} // namespace core
} // namespace promptguard

#endif // PROMPTGUARD_CORE_ERRORS_HPP

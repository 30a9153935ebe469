#ifndef PROMPTGUARD_GENERATOR_GENERATOR_HPP
#define PROMPTGUARD_GENERATOR_GENERATOR_HPP

#include <string>

namespace promptguard {
namespace generator {

/**
 * @class Generator
 * @brief The external text model, reached only through this narrow contract.
 *
 * generate() may block for a long time and is called without any gateway lock
 * held. Implementations report failures by throwing core::GenerationError.
 */
class Generator
{
public:
    virtual ~Generator() = default;

    virtual std::string generate(const std::string &prompt, int maxTokens, double temperature) = 0;

    /// True if the backend answers; used for the health report only.
    virtual bool ready() = 0;
};

} // namespace generator
} // namespace promptguard

#endif // PROMPTGUARD_GENERATOR_GENERATOR_HPP

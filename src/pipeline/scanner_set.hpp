#ifndef PROMPTGUARD_PIPELINE_SCANNER_SET_HPP
#define PROMPTGUARD_PIPELINE_SCANNER_SET_HPP

#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "../core/errors.hpp"
#include "../core/scan_mode.hpp"
#include "../scanners/scanner.hpp"

/**
 * @file scanner_set.hpp
 * @brief Ordered, direction-tagged collection of scanners.
 *
 * ORDERING RULES (checked by validate()):
 *   - Every scanner must support the set's direction; names are unique.
 *   - Inbound: Anonymize, when present, runs before every scanner that can
 *     reject, so they only ever see redacted text.
 *   - Outbound: Deanonymize, when present, runs before NoRefusal, Relevance,
 *     Sensitive and Code, so those judge restored text rather than placeholders.
 */

namespace promptguard {
namespace pipeline {

class ScannerSet
{
public:
    explicit ScannerSet(core::Direction direction)
        : direction_(direction)
    {
    }

    core::Direction direction() const { return direction_; }

    /**
     * @throw core::ConfigurationError if the scanner does not support this direction
     *        or a scanner of the same name is already present.
     */
    ScannerSet &add(std::shared_ptr<scanners::Scanner> scanner)
    {
        if (!scanner) {
            throw std::invalid_argument("ScannerSet::add: null scanner");
        }
        if (!scanner->supports(direction_)) {
            throw core::ConfigurationError(scanner->name() + " cannot run in the "
                                           + core::toString(direction_) + " direction");
        }
        for (const auto &existing : scanners_) {
            if (existing->name() == scanner->name()) {
                throw core::ConfigurationError("duplicate scanner '" + scanner->name() + "' in "
                                               + core::toString(direction_) + " set");
            }
        }
        scanners_.push_back(std::move(scanner));
        return *this;
    }

    /**
     * @brief Check the ordering rules against the current contents.
     * @throw core::ConfigurationError describing the first violation.
     */
    void validate() const
    {
        if (direction_ == core::Direction::Inbound) {
            const int anon = indexOf("Anonymize");
            if (anon < 0) {
                return;
            }
            for (int i = 0; i < anon; ++i) {
                const auto &s = scanners_[static_cast<size_t>(i)];
                if (!s->transformsText()) {
                    throw core::ConfigurationError("inbound scanner '" + s->name()
                                                   + "' must run after Anonymize");
                }
            }
            return;
        }

        const int deanon = indexOf("Deanonymize");
        if (deanon < 0) {
            return;
        }
        static const std::set<std::string> needsRestored = {"NoRefusal", "Relevance", "Sensitive", "Code"};
        for (int i = 0; i < deanon; ++i) {
            const auto &s = scanners_[static_cast<size_t>(i)];
            if (needsRestored.count(s->name()) > 0) {
                throw core::ConfigurationError("outbound scanner '" + s->name()
                                               + "' must run after Deanonymize");
            }
        }
    }

    const std::vector<std::shared_ptr<scanners::Scanner>> &scanners() const { return scanners_; }

    size_t size() const { return scanners_.size(); }
    bool empty() const { return scanners_.empty(); }

    std::vector<std::string> names() const
    {
        std::vector<std::string> out;
        for (const auto &s : scanners_) {
            out.push_back(s->name());
        }
        return out;
    }

private:
    core::Direction direction_;
    std::vector<std::shared_ptr<scanners::Scanner>> scanners_;

    int indexOf(const std::string &name) const
    {
        for (size_t i = 0; i < scanners_.size(); ++i) {
            if (scanners_[i]->name() == name) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }
};

} // namespace pipeline
} // namespace promptguard

#endif // PROMPTGUARD_PIPELINE_SCANNER_SET_HPP

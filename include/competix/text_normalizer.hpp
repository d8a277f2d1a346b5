#ifndef COMPETIX_TEXT_NORMALIZER_HPP
#define COMPETIX_TEXT_NORMALIZER_HPP

#include "company.hpp"
#include "config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace competix {

/**
 * Cleans short company descriptions.
 *
 * Folds Latin accents to ASCII, lowercases, maps punctuation without meaning
 * to whitespace (keeps '&', '+', and inner '-' and '/'), drops legal-form
 * token runs (inc, llc, ltd, ...) and collapses whitespace. The result is a pure
 * function of the input and normalize(normalize(x)) == normalize(x).
 * An empty result means "no usable description".
 */
class TextNormalizer {
public:
    explicit TextNormalizer(NormalizerConfig cfg = {});

    std::string normalize(std::string_view text) const;

    // One entry per company, same order as the input.
    std::vector<NormalizedCompany> normalize_all(
        const std::vector<Company>& companies) const;

    // True when text tokenizes to exactly one configured legal form.
    bool is_legal_suffix(std::string_view text) const;

private:
    NormalizerConfig cfg_;
    std::vector<std::vector<std::string>> suffixes_;  // token sequences
};

}  // namespace competix

#endif  // COMPETIX_TEXT_NORMALIZER_HPP

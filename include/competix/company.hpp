#ifndef COMPETIX_COMPANY_HPP
#define COMPETIX_COMPANY_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace competix {

// One input record. Tags are already split, trimmed, lowercased and unique.
struct Company {
    std::string id;
    std::string customers;   // raw customer description
    std::string product;     // raw product description
    std::vector<std::string> tags;
};

// Output of TextNormalizer for one company; row is the index into the input.
struct NormalizedCompany {
    size_t row = 0;
    std::string customers;
    std::string product;

    bool has_customers() const { return !customers.empty(); }
    bool has_product() const { return !product.empty(); }
};

enum class ExclusionReason : uint8_t {
    EmptyDescriptions,    // both normalized fields empty
    DuplicateIdentifier,  // id seen on an earlier row
    DegenerateEmbedding,  // fused vector has zero length
};

const char* to_string(ExclusionReason reason);

struct Exclusion {
    size_t row = 0;
    std::string id;
    ExclusionReason reason = ExclusionReason::EmptyDescriptions;
};

// Split a delimiter-separated tag list into the canonical tag set.
std::vector<std::string> parse_tags(const std::string& raw, char delimiter = ',');

}  // namespace competix

#endif  // COMPETIX_COMPANY_HPP

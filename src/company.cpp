#include "competix/company.hpp"

#include <algorithm>
#include <cctype>

namespace competix {

const char* to_string(ExclusionReason reason) {
    switch (reason) {
        case ExclusionReason::EmptyDescriptions:   return "empty_descriptions";
        case ExclusionReason::DuplicateIdentifier: return "duplicate_identifier";
        case ExclusionReason::DegenerateEmbedding: return "degenerate_embedding";
    }
    return "unknown";
}

std::vector<std::string> parse_tags(const std::string& raw, char delimiter) {
    std::vector<std::string> tags;
    size_t start = 0;
    while (start <= raw.size()) {
        size_t end = raw.find(delimiter, start);
        if (end == std::string::npos) end = raw.size();

        size_t b = start, e = end;
        while (b < e && std::isspace(static_cast<unsigned char>(raw[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(raw[e - 1]))) --e;
        if (e > b) {
            std::string tag = raw.substr(b, e - b);
            for (char& c : tag)
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            tags.push_back(std::move(tag));
        }
        start = end + 1;
    }
    std::sort(tags.begin(), tags.end());
    tags.erase(std::unique(tags.begin(), tags.end()), tags.end());
    return tags;
}

}  // namespace competix

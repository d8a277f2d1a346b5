#include "competix/data_generator.hpp"

#include <random>
#include <stdexcept>
#include <string>

namespace competix {

namespace {

const char* const kFiller[] = {
    "platform", "solutions", "services", "software", "tools", "network",
    "global", "smart", "digital", "integrated", "cloud", "data",
};

const char* const kLegal[] = {"Inc.", "LLC", "Ltd", "Corp", "GmbH", "", "", ""};

const char* const kSyllables[] = {
    "ac", "bri", "cor", "dyn", "el", "fa", "gen", "hal", "io", "ju",
    "kin", "lum", "mar", "nov", "or", "pex", "qua", "ro", "sy", "tek",
};

// Segment vocabularies are pseudo-words so segments share no content tokens.
std::string segment_word(size_t segment, size_t j) {
    const size_t ns = sizeof(kSyllables) / sizeof(kSyllables[0]);
    size_t x = segment * 131 + j * 17 + 7;
    std::string w = kSyllables[x % ns];
    w += kSyllables[(x / ns + segment) % ns];
    w += kSyllables[(x / (ns * ns) + j) % ns];
    w += std::to_string(segment);
    return w;
}

std::string sentence(std::mt19937_64& rng, size_t segment, size_t vocab,
                     size_t words) {
    std::uniform_int_distribution<size_t> pick_word(0, vocab - 1);
    std::uniform_int_distribution<size_t> pick_filler(
        0, sizeof(kFiller) / sizeof(kFiller[0]) - 1);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::string out;
    for (size_t w = 0; w < words; ++w) {
        if (!out.empty()) out.push_back(' ');
        if (coin(rng) < 0.25) out += kFiller[pick_filler(rng)];
        else out += segment_word(segment, pick_word(rng));
    }
    return out;
}

}  // namespace

std::vector<Company> generate_companies(size_t n, size_t num_segments,
                                        uint64_t seed, double empty_rate) {
    if (num_segments == 0) throw std::invalid_argument("generate_companies: num_segments must be > 0");
    if (empty_rate < 0.0 || empty_rate > 1.0)
        throw std::invalid_argument("generate_companies: empty_rate must be in [0, 1]");

    constexpr size_t kVocab = 24;
    constexpr size_t kTagsPerSegment = 4;
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<size_t> pick_len(4, 10);
    std::uniform_int_distribution<size_t> pick_legal(0, sizeof(kLegal) / sizeof(kLegal[0]) - 1);
    std::uniform_int_distribution<size_t> pick_tag(0, kTagsPerSegment - 1);

    std::vector<Company> out(n);
    for (size_t i = 0; i < n; ++i) {
        const size_t seg = i % num_segments;
        Company& c = out[i];
        c.id = "Company " + std::to_string(i);
        const char* legal = kLegal[pick_legal(rng)];
        if (*legal) c.id += std::string(" ") + legal;

        if (coin(rng) >= empty_rate) {
            c.product = sentence(rng, seg, kVocab, pick_len(rng));
            c.customers = sentence(rng, seg, kVocab, pick_len(rng));
        }
        std::string raw_tags = "segment " + std::to_string(seg) + "," +
                               "topic " + std::to_string(seg * kTagsPerSegment + pick_tag(rng));
        c.tags = parse_tags(raw_tags);
    }
    return out;
}

std::vector<int> generate_segment_labels(size_t n, size_t num_segments) {
    if (num_segments == 0) throw std::invalid_argument("generate_segment_labels: num_segments must be > 0");
    std::vector<int> labels(n);
    for (size_t i = 0; i < n; ++i) labels[i] = static_cast<int>(i % num_segments);
    return labels;
}

}  // namespace competix

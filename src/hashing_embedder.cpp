#include "competix/hashing_embedder.hpp"

#include <xxhash.h>

#include <cmath>
#include <stdexcept>
#include <string_view>
#include <map>

namespace competix {

namespace {

std::vector<std::string_view> split_ws(const std::string& text) {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && text[i] == ' ') ++i;
        size_t start = i;
        while (i < text.size() && text[i] != ' ') ++i;
        if (i > start) tokens.emplace_back(text.data() + start, i - start);
    }
    return tokens;
}

}  // namespace

HashingEmbedder::HashingEmbedder(size_t dim, uint64_t hash_seed,
                                 float bigram_weight)
    : dim_(dim), hash_seed_(hash_seed), bigram_weight_(bigram_weight) {
    if (dim == 0)
        throw std::invalid_argument("HashingEmbedder: dim must be > 0");
    if (!(bigram_weight >= 0.0f))
        throw std::invalid_argument("HashingEmbedder: bigram_weight must be >= 0");
}

std::string HashingEmbedder::id() const {
    return "hashing-" + std::to_string(dim_);
}

std::vector<float> HashingEmbedder::embed_one(const std::string& text) const {
    std::vector<float> v(dim_, 0.0f);
    auto tokens = split_ws(text);
    if (tokens.empty()) return v;

    // Term frequencies keyed by feature hash; bigrams use a separator byte
    // that cannot appear inside a normalized token.
    std::map<uint64_t, std::pair<float, float>> tf;  // hash -> (count, weight)
    for (size_t t = 0; t < tokens.size(); ++t) {
        uint64_t h = XXH64(tokens[t].data(), tokens[t].size(), hash_seed_);
        auto& e = tf[h];
        e.first += 1.0f;
        e.second = 1.0f;
        if (t + 1 < tokens.size() && bigram_weight_ > 0.0f) {
            std::string bigram;
            bigram.reserve(tokens[t].size() + tokens[t + 1].size() + 1);
            bigram.append(tokens[t]);
            bigram.push_back('\x1f');
            bigram.append(tokens[t + 1]);
            uint64_t hb = XXH64(bigram.data(), bigram.size(), hash_seed_);
            auto& b = tf[hb];
            b.first += 1.0f;
            b.second = bigram_weight_;
        }
    }

    for (const auto& [h, cw] : tf) {
        size_t bucket = static_cast<size_t>(h % dim_);
        float sign = ((h >> 63) & 1ULL) ? -1.0f : 1.0f;
        v[bucket] += sign * cw.second * (1.0f + std::log(cw.first));
    }

    double norm = 0.0;
    for (float x : v) norm += static_cast<double>(x) * x;
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (float& x : v) x *= inv;
    }
    return v;
}

std::vector<std::vector<float>> HashingEmbedder::encode(
    const std::vector<std::string>& texts) const {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto& t : texts) out.push_back(embed_one(t));
    return out;
}

}  // namespace competix

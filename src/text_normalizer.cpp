#include "competix/text_normalizer.hpp"
#include "competix/log.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace competix {

namespace {

const char* const kLegalSuffixes[] = {
    "inc", "incorporated", "llc", "llp", "ltd", "limited",
    "corp", "corporation", "plc", "gmbh",
};

// Latin-1 Supplement letters U+00C0..U+00FF folded to ASCII; 0 = drop.
const char* const kLatin1Fold[64] = {
    "a", "a", "a", "a", "a", "a", "ae", "c",   // C0-C7
    "e", "e", "e", "e", "i", "i", "i", "i",    // C8-CF
    "d", "n", "o", "o", "o", "o", "o", nullptr,// D0-D7 (D7 = multiplication)
    "o", "u", "u", "u", "u", "y", "th", "ss",  // D8-DF
    "a", "a", "a", "a", "a", "a", "ae", "c",   // E0-E7
    "e", "e", "e", "e", "i", "i", "i", "i",    // E8-EF
    "d", "n", "o", "o", "o", "o", "o", nullptr,// F0-F7 (F7 = division)
    "o", "u", "u", "u", "u", "y", "th", "y",   // F8-FF
};

// Decode one UTF-8 sequence at s[i]; returns code point and advances i.
// Malformed bytes decode as U+FFFD and consume one byte.
uint32_t next_code_point(std::string_view s, size_t& i) {
    auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) { ++i; return b0; }

    int len = 0;
    uint32_t cp = 0;
    if ((b0 & 0xE0) == 0xC0)      { len = 2; cp = b0 & 0x1F; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; }
    else { ++i; return 0xFFFD; }

    if (i + static_cast<size_t>(len) > s.size()) { ++i; return 0xFFFD; }
    for (int k = 1; k < len; ++k) {
        auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) { ++i; return 0xFFFD; }
        cp = (cp << 6) | (b & 0x3F);
    }
    i += static_cast<size_t>(len);
    return cp;
}

// ASCII-only text: accents folded, separators to space, other symbols dropped.
std::string fold_to_ascii(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = next_code_point(text, i);
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp >= 0xC0 && cp <= 0xFF) {
            if (const char* f = kLatin1Fold[cp - 0xC0]) out.append(f);
        } else if (cp == 0xA0 || (cp >= 0x2000 && cp <= 0x206F) ||
                   cp == 0x3000) {
            out.push_back(' ');
        }
    }
    return out;
}

inline bool is_word_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

inline bool is_kept_symbol(char c) {
    return c == '&' || c == '+' || c == '-' || c == '/';
}

inline bool is_joiner(char c) { return c == '-' || c == '/'; }

// Folded, lowercased, symbol-mapped tokens; no legal-form removal.
std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    if (text.empty()) return tokens;

    std::string ascii = fold_to_ascii(text);

    // Lowercase and classify; apostrophes join ("women's" -> "womens").
    std::string mapped;
    mapped.reserve(ascii.size());
    for (char c : ascii) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        if (c == '\'' || c == '`') continue;
        mapped.push_back(is_word_char(c) || is_kept_symbol(c) ? c : ' ');
    }

    size_t i = 0;
    while (i < mapped.size()) {
        while (i < mapped.size() && mapped[i] == ' ') ++i;
        size_t start = i;
        while (i < mapped.size() && mapped[i] != ' ') ++i;
        size_t end = i;

        // Dangling joiners carry no meaning at token edges.
        while (start < end && is_joiner(mapped[start])) ++start;
        while (end > start && is_joiner(mapped[end - 1])) --end;
        if (start == end) continue;

        tokens.emplace_back(mapped.data() + start, end - start);
    }
    return tokens;
}

// Length of the longest form (forms sorted longest first) starting at tokens[i].
size_t match_length(const std::vector<std::vector<std::string>>& forms,
                    const std::vector<std::string>& tokens, size_t i) {
    for (const auto& form : forms) {
        if (form.size() > tokens.size() - i) continue;
        if (std::equal(form.begin(), form.end(), tokens.begin() + static_cast<std::ptrdiff_t>(i)))
            return form.size();
    }
    return 0;
}

}  // namespace

TextNormalizer::TextNormalizer(NormalizerConfig cfg) : cfg_(std::move(cfg)) {
    cfg_.validate();
    for (const char* s : kLegalSuffixes) suffixes_.push_back({s});
    for (const auto& s : cfg_.extra_legal_suffixes) {
        // "S.A." becomes the two-token form {"s", "a"}.
        auto tokens = tokenize(s);
        if (tokens.empty()) {
            CX_WARN("normalize", "legal suffix '%s' has no tokens, ignored", s.c_str());
            continue;
        }
        suffixes_.push_back(std::move(tokens));
    }
    // Longest form wins when several start at the same token.
    std::stable_sort(suffixes_.begin(), suffixes_.end(),
                     [](const auto& a, const auto& b) { return a.size() > b.size(); });
}

bool TextNormalizer::is_legal_suffix(std::string_view text) const {
    auto tokens = tokenize(text);
    if (tokens.empty()) return false;
    for (const auto& suffix : suffixes_) {
        if (suffix == tokens) return true;
    }
    return false;
}

std::string TextNormalizer::normalize(std::string_view text) const {
    std::vector<std::string> tokens = tokenize(text);

    // Dropping a form can join its neighbours into another; stop when a pass
    // finds none, so the output never contains one.
    bool removed = true;
    while (removed) {
        removed = false;
        std::vector<std::string> kept;
        kept.reserve(tokens.size());
        for (size_t i = 0; i < tokens.size();) {
            size_t len = match_length(suffixes_, tokens, i);
            if (len > 0) {
                i += len;
                removed = true;
                continue;
            }
            kept.push_back(std::move(tokens[i++]));
        }
        tokens.swap(kept);
    }

    std::string out;
    for (const auto& token : tokens) {
        if (!out.empty()) out.push_back(' ');
        out.append(token);
    }
    return out;
}

std::vector<NormalizedCompany> TextNormalizer::normalize_all(
    const std::vector<Company>& companies) const {
    std::vector<NormalizedCompany> out(companies.size());
    size_t both_empty = 0;

    #pragma omp parallel for schedule(static) reduction(+:both_empty)
    for (size_t r = 0; r < companies.size(); ++r) {
        out[r].row = r;
        out[r].customers = normalize(companies[r].customers);
        out[r].product = normalize(companies[r].product);
        if (!out[r].has_customers() && !out[r].has_product()) ++both_empty;
    }

    CX_INFO("normalize", "normalized %zu companies (%zu without usable text)",
            companies.size(), both_empty);
    return out;
}

}  // namespace competix

#include <gtest/gtest.h>
#include "competix/company.hpp"
#include "competix/text_normalizer.hpp"

#include <random>
#include <string>
#include <vector>

using namespace competix;

TEST(TextNormalizer, StripsLegalSuffixes) {
    TextNormalizer norm;
    EXPECT_EQ(norm.normalize("Tech-Savvy Homeowners Inc."), "tech-savvy homeowners");
    EXPECT_EQ(norm.normalize("AI-Driven Platform LLC"), "ai-driven platform");
    EXPECT_EQ(norm.normalize("Acme Corporation Ltd"), "acme");
    EXPECT_EQ(norm.normalize("Widgets GmbH"), "widgets");
}

TEST(TextNormalizer, KeepsMeaningfulSymbols) {
    TextNormalizer norm;
    EXPECT_EQ(norm.normalize("E-commerce & SaaS Solutions"), "e-commerce & saas solutions");
    EXPECT_EQ(norm.normalize("B2B/B2C  marketplaces, C++ tooling!"),
              "b2b/b2c marketplaces c++ tooling");
    EXPECT_EQ(norm.normalize("small - and medium-sized firms"), "small and medium-sized firms");
}

TEST(TextNormalizer, FoldsAccentsAndSeparators) {
    TextNormalizer norm;
    EXPECT_EQ(norm.normalize("Caf\xC3\xA9 Owners"), "cafe owners");
    EXPECT_EQ(norm.normalize("Stra\xC3\x9F" "e Retailers"), "strasse retailers");
    // U+2014 em dash and U+00A0 no-break space act as whitespace.
    EXPECT_EQ(norm.normalize("banks\xE2\x80\x94insurers\xC2\xA0" "and brokers"),
              "banks insurers and brokers");
    EXPECT_EQ(norm.normalize("women's apparel"), "womens apparel");
}

TEST(TextNormalizer, EmptyAndSuffixOnlyInputs) {
    TextNormalizer norm;
    EXPECT_EQ(norm.normalize(""), "");
    EXPECT_EQ(norm.normalize("   \t\n"), "");
    EXPECT_EQ(norm.normalize("Inc. LLC, Ltd"), "");
    EXPECT_EQ(norm.normalize("--- / ..."), "");
}

TEST(TextNormalizer, ExtraSuffixes) {
    NormalizerConfig cfg;
    cfg.extra_legal_suffixes = {"SARL", "AG"};
    TextNormalizer norm(cfg);
    EXPECT_TRUE(norm.is_legal_suffix("ag"));
    EXPECT_TRUE(norm.is_legal_suffix("sarl"));
    EXPECT_TRUE(norm.is_legal_suffix("inc"));
    EXPECT_FALSE(norm.is_legal_suffix("payments"));
    EXPECT_EQ(norm.normalize("Payments AG"), "payments");
    EXPECT_EQ(norm.normalize("Logistique Sarl"), "logistique");

    NormalizerConfig bad;
    bad.extra_legal_suffixes = {""};
    EXPECT_THROW(TextNormalizer{bad}, std::invalid_argument);
}

TEST(TextNormalizer, PunctuatedExtraSuffixes) {
    NormalizerConfig cfg;
    cfg.extra_legal_suffixes = {"S.A.", "S.p.A.", "GmbH & Co. KG"};
    TextNormalizer norm(cfg);
    EXPECT_EQ(norm.normalize("Banco Popular S.A."), "banco popular");
    EXPECT_EQ(norm.normalize("Banco Popular, s. a."), "banco popular");
    EXPECT_EQ(norm.normalize("Ferrari S.p.A."), "ferrari");
    EXPECT_EQ(norm.normalize("M\xC3\xBCller GmbH & Co. KG"), "muller");
    EXPECT_TRUE(norm.is_legal_suffix("S.A."));
    EXPECT_TRUE(norm.is_legal_suffix("s a"));
    EXPECT_FALSE(norm.is_legal_suffix("s"));

    // A partial form is ordinary text.
    EXPECT_EQ(norm.normalize("S. Antonio Bakery"), "s antonio bakery");

    // Removing one form can make another adjacent.
    EXPECT_EQ(norm.normalize("s s. a. a"), "");

    for (const char* in : {"Banco S.A. S.A. Popular", "s s a a b", "S.p.A. a S.A. p"}) {
        std::string once = norm.normalize(in);
        EXPECT_EQ(norm.normalize(once), once) << in;
    }
}

TEST(TextNormalizer, Idempotent) {
    TextNormalizer norm;
    const std::vector<std::string> inputs = {
        "Tech-Savvy Homeowners Inc.",
        "  --leading and trailing//  ",
        "R&D labs / universities",
        "M\xC3\xBCnchen-based B\xC3\xA4" "ckereien",
        "a - b -- c",
        "'quoted' `ticks` \"double\"",
        "\xFF\xFE broken utf8 \xC3",
        "Limited-edition sneakers corp",
    };
    for (const auto& in : inputs) {
        std::string once = norm.normalize(in);
        EXPECT_EQ(norm.normalize(once), once) << "input: " << in;
    }

    // Random printable ASCII plus a few multi-byte sequences.
    std::mt19937 rng(7);
    const std::string alphabet =
        "abcXYZ019 &+-/.,;:'`\"()[]!?_\t\n";
    const std::vector<std::string> multibyte = {"\xC3\xA9", "\xE2\x80\x93", "\xE4\xB8\xAD"};
    std::uniform_int_distribution<size_t> len(0, 40);
    std::uniform_int_distribution<size_t> pick(0, alphabet.size() + multibyte.size() - 1);
    for (int trial = 0; trial < 500; ++trial) {
        std::string s;
        size_t L = len(rng);
        for (size_t j = 0; j < L; ++j) {
            size_t p = pick(rng);
            if (p < alphabet.size()) s.push_back(alphabet[p]);
            else s += multibyte[p - alphabet.size()];
        }
        std::string once = norm.normalize(s);
        ASSERT_EQ(norm.normalize(once), once) << "input: " << s;
    }
}

TEST(TextNormalizer, NormalizeAllPreservesRows) {
    TextNormalizer norm;
    std::vector<Company> companies = {
        {"a", "Homeowners", "Solar Panels Inc.", {}},
        {"b", "", "", {}},
        {"c", "  ", "Cloud CRM", {}},
    };
    auto out = norm.normalize_all(companies);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].row, 0u);
    EXPECT_EQ(out[0].product, "solar panels");
    EXPECT_FALSE(out[1].has_customers());
    EXPECT_FALSE(out[1].has_product());
    EXPECT_FALSE(out[2].has_customers());
    EXPECT_EQ(out[2].product, "cloud crm");
    EXPECT_EQ(out[2].row, 2u);
}

TEST(ParseTags, TrimsLowercasesAndDedups) {
    auto tags = parse_tags(" FinTech, Payments ,fintech,, ,B2B ");
    EXPECT_EQ(tags, (std::vector<std::string>{"b2b", "fintech", "payments"}));
    EXPECT_TRUE(parse_tags("").empty());
    EXPECT_EQ(parse_tags("a|b|a", '|'), (std::vector<std::string>{"a", "b"}));
}

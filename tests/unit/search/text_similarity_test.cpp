#include <gtest/gtest.h>

#include <mvsearch/search/text_similarity.h>

using namespace mvsearch::search;

// ===== Word Set Tests =====

TEST(TextSimilarityTest, WordSetLowercasesAndDeduplicates) {
    auto words = wordSet("Fast  fast JSON parser");
    EXPECT_EQ(words.size(), 3u);
    EXPECT_TRUE(words.count("json"));
}

TEST(TextSimilarityTest, JaccardEdgeCases) {
    EXPECT_DOUBLE_EQ(jaccardSimilarity("", ""), 1.0);
    EXPECT_DOUBLE_EQ(jaccardSimilarity("word", ""), 0.0);
    EXPECT_DOUBLE_EQ(jaccardSimilarity("a b", "b c"), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(jaccardSimilarity("Same Words", "same words"), 1.0);
}

// ===== String Similarity Tests =====

TEST(TextSimilarityTest, StringSimilarityIdenticalAndEmpty) {
    EXPECT_DOUBLE_EQ(stringSimilarity("abc", "abc"), 1.0);
    EXPECT_DOUBLE_EQ(stringSimilarity("", ""), 1.0);
    EXPECT_DOUBLE_EQ(stringSimilarity("abc", ""), 0.0);
}

TEST(TextSimilarityTest, SharedPrefixAddsBonus) {
    // No shared words, but a long common prefix
    const double withPrefix = stringSimilarity("tokenizer", "tokenization");
    EXPECT_GT(withPrefix, 0.0);
    EXPECT_LE(withPrefix, 1.0);

    // Short prefixes do not count
    EXPECT_DOUBLE_EQ(stringSimilarity("abcx", "abcy"), 0.0);
}

TEST(TextSimilarityTest, SimilarityIsCapped) {
    EXPECT_LE(stringSimilarity("fast json parser library", "fast json parser library!"), 1.0);
}

// ===== Edit Distance Tests =====

TEST(TextSimilarityTest, LevenshteinDistance) {
    EXPECT_EQ(levenshteinDistance("", ""), 0u);
    EXPECT_EQ(levenshteinDistance("abc", ""), 3u);
    EXPECT_EQ(levenshteinDistance("kitten", "sitting"), 3u);
    EXPECT_EQ(levenshteinDistance("flaw", "lawn"), 2u);
}

TEST(TextSimilarityTest, NormalizedLevenshtein) {
    EXPECT_DOUBLE_EQ(normalizedLevenshtein("", ""), 1.0);
    EXPECT_DOUBLE_EQ(normalizedLevenshtein("same", "same"), 1.0);
    EXPECT_NEAR(normalizedLevenshtein("kitten", "sitting"), 1.0 - 3.0 / 7.0, 1e-12);
}

// ===== Name Normalization Tests =====

TEST(TextSimilarityTest, StripVersionSuffix) {
    EXPECT_EQ(stripVersionSuffix("Tool v2"), "Tool");
    EXPECT_EQ(stripVersionSuffix("Library 1.4.3"), "Library");
    EXPECT_EQ(stripVersionSuffix("Framework 2.0-beta"), "Framework");
    EXPECT_EQ(stripVersionSuffix("Plain Name"), "Plain Name");
}

TEST(TextSimilarityTest, NormalizeNameUnifiesVersions) {
    EXPECT_EQ(normalizeName("Awesome Tool v2.1"), "awesome tool");
    EXPECT_EQ(normalizeName("awesome-tool 3"), "awesometool");
    EXPECT_EQ(normalizeName("  Awesome   Tool  "), "awesome tool");
    EXPECT_EQ(normalizeName("Awesome Tool v2.1"), normalizeName("AWESOME TOOL 1.0"));
}

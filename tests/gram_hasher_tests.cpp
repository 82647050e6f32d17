#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gram_hasher.hpp"
#include "test_util.hpp"

using namespace winnow;

namespace {

NormalizedContent normalized(const std::string& s) {
    return normalize(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

std::vector<Gram> allGrams(const NormalizedContent& content, size_t g) {
    std::vector<Gram> grams;
    GramHasher hasher(content, g);
    Gram gram;
    while (hasher.next(gram)) grams.push_back(gram);
    return grams;
}

}  // namespace

// ============================================================================
// Normalization
// ============================================================================

TEST(NormalizeTest, StripsWhitespaceAndTracksLines) {
    const NormalizedContent c = normalized("a b\nc\r\nd");
    EXPECT_EQ(c.bytes, (std::vector<uint8_t>{'a', 'b', 'c', 'd'}));
    EXPECT_EQ(c.lines, (std::vector<uint32_t>{1, 1, 2, 3}));
}

TEST(NormalizeTest, StripsEveryAsciiWhitespaceByte) {
    const NormalizedContent c = normalized(" \t\v\f\rx\n\ny");
    EXPECT_EQ(c.bytes, (std::vector<uint8_t>{'x', 'y'}));
    EXPECT_EQ(c.lines, (std::vector<uint32_t>{1, 3}));
}

TEST(NormalizeTest, CrlfAndLfNumberLinesAlike) {
    const NormalizedContent lf = normalized("one\ntwo\nthree\n");
    const NormalizedContent crlf = normalized("one\r\ntwo\r\nthree\r\n");
    EXPECT_EQ(lf.bytes, crlf.bytes);
    EXPECT_EQ(lf.lines, crlf.lines);
}

TEST(NormalizeTest, KeepsNonAsciiBytes) {
    const NormalizedContent c = normalized("\xc3\xa9 \xff");
    EXPECT_EQ(c.bytes, (std::vector<uint8_t>{0xc3, 0xa9, 0xff}));
}

// ============================================================================
// Gram hashing
// ============================================================================

TEST(GramHasherTest, HashIsPolynomialBase257) {
    const uint8_t abc[] = {'a', 'b', 'c'};
    EXPECT_EQ(hashGram(abc, 3), 0x00622526u);  // 97*257^2 + 98*257 + 99
    EXPECT_EQ(gramOutFactor(3), 257u * 257u);
    EXPECT_EQ(gramOutFactor(1), 1u);
}

TEST(GramHasherTest, RollIsPureFunctionOfPrevOutIn) {
    const uint8_t abcd[] = {'a', 'b', 'c', 'd'};
    const uint32_t factor = gramOutFactor(3);
    const uint32_t first = hashGram(abcd, 3);
    EXPECT_EQ(rollGramHash(first, 'a', 'd', factor), hashGram(abcd + 1, 3));
    EXPECT_EQ(rollGramHash(first, 'a', 'd', factor),
              rollGramHash(first, 'a', 'd', factor));
}

TEST(GramHasherTest, RollingMatchesFullRehashAtEveryPosition) {
    const NormalizedContent c = normalized(makeSource(40, 3));
    const size_t g = 30;
    const std::vector<Gram> grams = allGrams(c, g);

    ASSERT_EQ(grams.size(), c.bytes.size() - g + 1);
    for (size_t p = 0; p < grams.size(); p++) {
        ASSERT_EQ(grams[p].hash, hashGram(c.bytes.data() + p, g))
            << "position " << p;
        ASSERT_EQ(grams[p].line, c.lines[p + g - 1]) << "position " << p;
    }
}

TEST(GramHasherTest, ContentShorterThanGramYieldsNothing) {
    const NormalizedContent c = normalized(std::string(29, 'x'));
    GramHasher hasher(c, 30);
    Gram gram;
    EXPECT_EQ(hasher.remaining(), 0u);
    EXPECT_FALSE(hasher.next(gram));
}

TEST(GramHasherTest, ExactGramYieldsOne) {
    const NormalizedContent c = normalized(std::string(30, 'x'));
    GramHasher hasher(c, 30);
    Gram gram;
    EXPECT_EQ(hasher.remaining(), 1u);
    EXPECT_TRUE(hasher.next(gram));
    EXPECT_FALSE(hasher.next(gram));
}

TEST(GramHasherTest, WhitespaceDoesNotSplitGrams) {
    // "ab cd" and "abcd" produce the same 3-grams
    const auto spaced = allGrams(normalized("ab cd"), 3);
    const auto tight = allGrams(normalized("abcd"), 3);
    ASSERT_EQ(spaced.size(), 2u);
    ASSERT_EQ(tight.size(), 2u);
    EXPECT_EQ(spaced[0].hash, tight[0].hash);
    EXPECT_EQ(spaced[1].hash, tight[1].hash);
}

TEST(GramHasherTest, GramLineIsLineOfLastByte) {
    const auto grams = allGrams(normalized("aa\nbb\ncc"), 3);
    ASSERT_EQ(grams.size(), 4u);
    EXPECT_EQ(grams[0].line, 2u);  // "aab"
    EXPECT_EQ(grams[1].line, 2u);  // "abb"
    EXPECT_EQ(grams[2].line, 3u);  // "bbc"
    EXPECT_EQ(grams[3].line, 3u);  // "bcc"
}

TEST(GramHasherTest, ZeroGramSizeThrows) {
    const NormalizedContent c = normalized("abc");
    EXPECT_THROW(GramHasher(c, 0), std::invalid_argument);
}

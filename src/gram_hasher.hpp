#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace winnow {

// Polynomial gram hash: h = sum b[i] * 257^(G-1-i) mod 2^32.
constexpr uint32_t GRAM_HASH_BASE = 257;

// Content left after whitespace stripping. lines[i] is the 1-based source
// line of bytes[i].
struct NormalizedContent {
    std::vector<uint8_t> bytes;
    std::vector<uint32_t> lines;
};

struct Gram {
    uint32_t hash;
    uint32_t line;  // line of the last byte of the gram
};

// Space, \t, \n, \v, \f and \r. Only \n advances the line counter.
inline bool isStrippedWhitespace(uint8_t c) {
    return c == ' ' || (c >= '\t' && c <= '\r');
}

NormalizedContent normalize(const uint8_t* data, size_t size);

// 257^(gramSize-1) mod 2^32, the weight of the byte leaving the window.
uint32_t gramOutFactor(size_t gramSize);

uint32_t hashGram(const uint8_t* gram, size_t gramSize);

// Slides the gram one byte: drops `out`, appends `in`.
inline uint32_t rollGramHash(uint32_t prev, uint8_t out, uint8_t in,
                             uint32_t outFactor) {
    return (prev - uint32_t(out) * outFactor) * GRAM_HASH_BASE + uint32_t(in);
}

// Lazily yields one Gram per start position 0..size-G of the normalized
// content. Yields nothing when the content is shorter than one gram.
class GramHasher {
public:
    GramHasher(const NormalizedContent& content, size_t gramSize);

    bool next(Gram& gram);
    size_t remaining() const;

private:
    const NormalizedContent& content;
    size_t gramSize;
    uint32_t outFactor;
    uint32_t hash;
    size_t pos;
};

}  // namespace winnow

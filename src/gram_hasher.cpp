#include "gram_hasher.hpp"

#include <stdexcept>

namespace winnow {

NormalizedContent normalize(const uint8_t* data, size_t size) {
    NormalizedContent out;
    out.bytes.reserve(size);
    out.lines.reserve(size);

    uint32_t line = 1;
    for (size_t i = 0; i < size; i++) {
        const uint8_t c = data[i];
        if (c == '\n') {
            line++;
            continue;
        }
        if (isStrippedWhitespace(c)) continue;
        out.bytes.push_back(c);
        out.lines.push_back(line);
    }
    return out;
}

uint32_t gramOutFactor(size_t gramSize) {
    uint32_t factor = 1;
    for (size_t i = 1; i < gramSize; i++) factor *= GRAM_HASH_BASE;
    return factor;
}

uint32_t hashGram(const uint8_t* gram, size_t gramSize) {
    uint32_t h = 0;
    for (size_t i = 0; i < gramSize; i++) h = h * GRAM_HASH_BASE + gram[i];
    return h;
}

GramHasher::GramHasher(const NormalizedContent& content, size_t gramSize)
    : content(content),
      gramSize(gramSize),
      outFactor(gramOutFactor(gramSize)),
      hash(0),
      pos(0) {
    if (gramSize == 0) throw std::invalid_argument("gram size must be > 0");
}

bool GramHasher::next(Gram& gram) {
    const std::vector<uint8_t>& bytes = content.bytes;
    if (pos + gramSize > bytes.size()) return false;

    if (pos == 0)
        hash = hashGram(bytes.data(), gramSize);
    else
        hash = rollGramHash(hash, bytes[pos - 1], bytes[pos + gramSize - 1],
                            outFactor);

    gram.hash = hash;
    gram.line = content.lines[pos + gramSize - 1];
    pos++;
    return true;
}

size_t GramHasher::remaining() const {
    const size_t size = content.bytes.size();
    if (pos + gramSize > size) return 0;
    return size - gramSize + 1 - pos;
}

}  // namespace winnow

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "gram_hasher.hpp"

namespace winnow {

struct FingerprintEntry {
    uint32_t line;
    uint32_t hash;

    bool operator==(const FingerprintEntry& o) const {
        return line == o.line && hash == o.hash;
    }
    bool operator!=(const FingerprintEntry& o) const { return !(*this == o); }
};

// Ordered by position; lines never decrease.
using Fingerprint = std::vector<FingerprintEntry>;

/**
 * Sliding-window minimum selection over a stream of gram hashes.
 *
 * Every window of `windowSize` consecutive grams picks its minimum hash,
 * ties going to the rightmost gram. A pick is emitted only when its
 * position differs from the previous window's pick. A stream shorter than
 * one window is treated as a single window on finish().
 *
 * Feed grams with push(), then call finish() exactly once.
 */
class WinnowingSelector {
public:
    explicit WinnowingSelector(size_t windowSize);

    void push(const Gram& gram);
    void finish();

    const Fingerprint& fingerprint() const { return selected; }
    Fingerprint take() { return std::move(selected); }

private:
    enum class State { NoPrior, Prior };

    const Gram& at(uint64_t position) const {
        return ring[position % windowSize];
    }
    uint64_t rescan(uint64_t first, uint64_t last) const;
    void transition(uint64_t position);

    size_t windowSize;
    std::vector<Gram> ring;
    uint64_t count = 0;
    uint64_t minPos = 0;

    State state = State::NoPrior;
    uint64_t priorPos = 0;

    bool finished = false;
    Fingerprint selected;
};

// Runs hasher and selector over already normalized content.
Fingerprint winnow(const NormalizedContent& content, size_t gramSize,
                   size_t windowSize);

// Selection over a precomputed gram sequence.
Fingerprint winnowGrams(const std::vector<Gram>& grams, size_t windowSize);

}  // namespace winnow

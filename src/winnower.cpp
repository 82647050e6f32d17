#include "winnower.hpp"

#include <stdexcept>

namespace winnow {

WinnowingSelector::WinnowingSelector(size_t windowSize)
    : windowSize(windowSize) {
    if (windowSize == 0)
        throw std::invalid_argument("window size must be > 0");
    ring.resize(windowSize);
}

// Rightmost minimum over positions [first, last].
uint64_t WinnowingSelector::rescan(uint64_t first, uint64_t last) const {
    uint64_t best = first;
    for (uint64_t p = first + 1; p <= last; p++) {
        if (at(p).hash <= at(best).hash) best = p;
    }
    return best;
}

void WinnowingSelector::transition(uint64_t position) {
    if (state == State::Prior && position == priorPos) return;

    const Gram& gram = at(position);
    const FingerprintEntry entry{gram.line, gram.hash};
    if (selected.empty() || selected.back() != entry) selected.push_back(entry);

    state = State::Prior;
    priorPos = position;
}

void WinnowingSelector::push(const Gram& gram) {
    if (finished) throw std::logic_error("push() after finish()");

    const uint64_t position = count;
    // Compare before overwriting: the slot may hold the stale minimum.
    const bool newMin = position == 0 || gram.hash <= at(minPos).hash;
    ring[position % windowSize] = gram;
    count++;

    const uint64_t first = count > windowSize ? count - windowSize : 0;
    if (newMin)
        minPos = position;
    else if (minPos < first)
        minPos = rescan(first, position);

    if (count >= windowSize) transition(minPos);
}

void WinnowingSelector::finish() {
    if (finished) return;
    finished = true;
    if (count > 0 && count < windowSize) transition(minPos);
}

Fingerprint winnow(const NormalizedContent& content, size_t gramSize,
                   size_t windowSize) {
    GramHasher hasher(content, gramSize);
    WinnowingSelector selector(windowSize);
    Gram gram;
    while (hasher.next(gram)) selector.push(gram);
    selector.finish();
    return selector.take();
}

Fingerprint winnowGrams(const std::vector<Gram>& grams, size_t windowSize) {
    WinnowingSelector selector(windowSize);
    for (const Gram& gram : grams) selector.push(gram);
    selector.finish();
    return selector.take();
}

}  // namespace winnow

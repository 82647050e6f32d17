#pragma once

#include <cstddef>
#include <cstdint>

namespace winnow {

// Defaults shared with the remote matching engine. Changing any of the
// first four produces fingerprints the engine cannot match.
constexpr size_t DEFAULT_GRAM_SIZE = 30;
constexpr size_t DEFAULT_WINDOW_SIZE = 64;
constexpr uint64_t DEFAULT_MIN_FILE_SIZE = 256;
constexpr uint64_t DEFAULT_MAX_FILE_SIZE = 4 * 1024 * 1024;  // 4MB

constexpr size_t DEFAULT_BINARY_SAMPLE_SIZE = 8 * 1024;
constexpr size_t DEFAULT_MAX_BATCH_BYTES = 64 * 1024;  // 64KB post size
constexpr unsigned DEFAULT_THREADS = 10;
constexpr unsigned MAX_ALLOWED_THREADS = 30;

struct Config {
    size_t gramSize = DEFAULT_GRAM_SIZE;
    size_t windowSize = DEFAULT_WINDOW_SIZE;
    uint64_t minFileSize = DEFAULT_MIN_FILE_SIZE;
    uint64_t maxFileSize = DEFAULT_MAX_FILE_SIZE;
    size_t binarySampleSize = DEFAULT_BINARY_SAMPLE_SIZE;
    size_t maxBatchBytes = DEFAULT_MAX_BATCH_BYTES;
    unsigned threads = DEFAULT_THREADS;
    bool skipHidden = true;
    bool skipSnippets = false;

    // Throws std::invalid_argument on an unusable combination.
    void validate() const;

    // Worker count clamped to [1, MAX_ALLOWED_THREADS].
    unsigned effectiveThreads() const;
};

}  // namespace winnow

#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "config.hpp"
#include "winnower.hpp"

namespace winnow {

// Why a file did or did not get snippet fingerprints. Every outcome still
// carries the whole-file hash.
enum class FileClass : uint8_t {
    Snippets = 0,  // fingerprinted
    TooSmall,
    Binary,
    TooLarge,
    Skipped,  // snippet generation disabled by configuration
};

const char* fileClassName(FileClass cls);

struct FileRecord {
    std::string path;
    std::string md5;  // 32 lowercase hex digits over the raw bytes
    uint64_t size = 0;
    FileClass classification = FileClass::Snippets;
    Fingerprint fingerprint;

    bool excluded() const { return classification != FileClass::Snippets; }
};

std::string md5Hex(const uint8_t* data, size_t size);

// MD5 of everything left in `in`, read in fixed-size chunks. Throws
// std::runtime_error on a read error.
std::string md5Stream(std::istream& in);

// NUL byte or invalid UTF-8 within the first sampleSize bytes.
bool looksBinary(const uint8_t* data, size_t size, size_t sampleSize);

/**
 * Turns one in-memory file into a FileRecord.
 *
 * Classification, first match wins:
 *   size < minFileSize      -> TooSmall
 *   binary sample           -> Binary
 *   size > maxFileSize      -> TooLarge
 *   otherwise               -> Snippets (normalize, hash, winnow)
 *
 * Holds no mutable state; one instance may be shared by all workers.
 */
class FileFingerprinter {
public:
    explicit FileFingerprinter(const Config& config);

    FileClass classify(const uint8_t* data, size_t size) const {
        return classify(data, size, size);
    }
    // Classifies a file of `size` bytes from its first `headSize` bytes.
    FileClass classify(const uint8_t* head, size_t headSize,
                       uint64_t size) const;

    FileRecord fingerprint(const std::string& path, const uint8_t* data,
                           size_t size) const;
    FileRecord fingerprint(const std::string& path,
                           const std::vector<uint8_t>& data) const {
        return fingerprint(path, data.data(), data.size());
    }

    // Record for a file known only by its head and a precomputed md5, as
    // for files above maxFileSize. Throws std::invalid_argument if the
    // file would need snippets, which require the whole content.
    FileRecord describe(const std::string& path, const uint8_t* head,
                        size_t headSize, uint64_t size,
                        std::string md5) const;

private:
    Config config;
};

}  // namespace winnow

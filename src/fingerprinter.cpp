#include "fingerprinter.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "gram_hasher.hpp"

namespace winnow {

const char* fileClassName(FileClass cls) {
    switch (cls) {
        case FileClass::Snippets:
            return "snippets";
        case FileClass::TooSmall:
            return "too-small";
        case FileClass::Binary:
            return "binary";
        case FileClass::TooLarge:
            return "too-large";
        case FileClass::Skipped:
            return "skipped";
    }
    return "unknown";
}

namespace {

constexpr size_t MD5_READ_CHUNK = 64 * 1024;

std::string toHex(const unsigned char* digest, unsigned int digestLen) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; i++) {
        hex.push_back(digits[digest[i] >> 4]);
        hex.push_back(digits[digest[i] & 0x0F]);
    }
    return hex;
}

// UTF-8/NUL check over data[0, n). atEof says whether n is the real end of
// the file, making a truncated trailing sequence invalid.
bool binarySample(const uint8_t* data, size_t n, bool atEof) {
    size_t i = 0;

    while (i < n) {
        const uint8_t c = data[i];
        if (c == 0) return true;
        if (c < 0x80) {
            i++;
            continue;
        }

        size_t len;
        uint8_t lo = 0x80, hi = 0xBF;  // bounds of the second byte
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;  // overlong
            if (c == 0xED) hi = 0x9F;  // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;  // overlong
            if (c == 0xF4) hi = 0x8F;  // above U+10FFFF
        } else {
            return true;
        }

        for (size_t k = 1; k < len; k++) {
            if (i + k >= n) return atEof;
            const uint8_t cc = data[i + k];
            if (k == 1 ? (cc < lo || cc > hi) : (cc & 0xC0) != 0x80)
                return true;
        }
        i += len;
    }
    return false;
}

}  // anonymous namespace

std::string md5Hex(const uint8_t* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(data, size, digest, &digestLen, EVP_md5(), nullptr) != 1)
        throw std::runtime_error("MD5 digest failed");
    return toHex(digest, digestLen);
}

std::string md5Stream(std::istream& in) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
        EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
        throw std::runtime_error("MD5 digest init failed");

    std::vector<char> chunk(MD5_READ_CHUNK);
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const std::streamsize n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), chunk.data(),
                                      static_cast<size_t>(n)) != 1)
            throw std::runtime_error("MD5 digest update failed");
    }
    if (in.bad()) throw std::runtime_error("read error while hashing");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1)
        throw std::runtime_error("MD5 digest failed");
    return toHex(digest, digestLen);
}

bool looksBinary(const uint8_t* data, size_t size, size_t sampleSize) {
    const size_t n = std::min(size, sampleSize);
    return binarySample(data, n, n == size);
}

FileFingerprinter::FileFingerprinter(const Config& config) : config(config) {
    config.validate();
}

FileClass FileFingerprinter::classify(const uint8_t* head, size_t headSize,
                                      uint64_t size) const {
    if (config.skipSnippets) return FileClass::Skipped;
    if (size < config.minFileSize) return FileClass::TooSmall;
    const size_t n = std::min(headSize, config.binarySampleSize);
    if (binarySample(head, n, n == size)) return FileClass::Binary;
    if (size > config.maxFileSize) return FileClass::TooLarge;
    return FileClass::Snippets;
}

FileRecord FileFingerprinter::fingerprint(const std::string& path,
                                          const uint8_t* data,
                                          size_t size) const {
    if (data == nullptr && size != 0)
        throw std::invalid_argument("null buffer for " + path);

    FileRecord record;
    record.path = path;
    record.size = size;
    record.md5 = md5Hex(data, size);
    record.classification = classify(data, size);

    if (record.classification == FileClass::Snippets)
        record.fingerprint = winnow(normalize(data, size), config.gramSize,
                                    config.windowSize);
    return record;
}

FileRecord FileFingerprinter::describe(const std::string& path,
                                       const uint8_t* head, size_t headSize,
                                       uint64_t size, std::string md5) const {
    FileRecord record;
    record.path = path;
    record.size = size;
    record.md5 = std::move(md5);
    record.classification = classify(head, headSize, size);
    if (record.classification == FileClass::Snippets)
        throw std::invalid_argument("snippets need the whole file: " + path);
    return record;
}

}  // namespace winnow

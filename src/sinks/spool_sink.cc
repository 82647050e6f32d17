#include "spool_sink.h"

#include <lz4.h>

#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

#define XXH_INLINE_ALL
#include "xxhash.h"

#include "log.hpp"

namespace winnow {

namespace {

constexpr size_t SIZE_HEADER_BYTES = 8;

void writeU64LE(char* p, uint64_t v) {
    for (size_t i = 0; i < SIZE_HEADER_BYTES; i++) {
        p[i] = static_cast<char>(v & 0xFF);
        v >>= 8;
    }
}

uint64_t readU64LE(const char* p) {
    uint64_t v = 0;
    for (size_t i = SIZE_HEADER_BYTES; i-- > 0;)
        v = (v << 8) | static_cast<uint8_t>(p[i]);
    return v;
}

void writeFile(const fs::path& path, const char* data, size_t size) {
    std::ofstream outFile(path, std::ios::binary | std::ios::trunc);
    if (!outFile) throw std::runtime_error("Cannot create " + path.string());
    outFile.write(data, static_cast<std::streamsize>(size));
    if (!outFile) throw std::runtime_error("Failed writing " + path.string());
}

}  // anonymous namespace

SpoolSink::SpoolSink(const fs::path& dir, bool compress)
    : dir(dir), compress(compress) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        throw std::runtime_error("Cannot create spool directory " +
                                 dir.string() + ": " + ec.message());
}

std::string SpoolSink::batchId(const std::string& payload) {
    static const char digits[] = "0123456789abcdef";
    uint64_t h = XXH3_64bits(payload.data(), payload.size());
    std::string id(16, '0');
    for (size_t i = id.size(); i-- > 0;) {
        id[i] = digits[h & 0x0F];
        h >>= 4;
    }
    return id;
}

void SpoolSink::write(const ScanRequestBatch& batch) {
    const std::string& payload = batch.payload;
    const std::string id = batchId(payload);

    fs::path path = dir / (id + (compress ? ".wfp.lz4" : ".wfp"));
    size_t stored = payload.size();

    if (!compress) {
        writeFile(path, payload.data(), payload.size());
    } else {
        if (payload.size() > static_cast<size_t>(LZ4_MAX_INPUT_SIZE))
            throw std::runtime_error("batch " + id + " too large for LZ4");

        const int srcSize = static_cast<int>(payload.size());
        const int bound = LZ4_compressBound(srcSize);
        std::vector<char> buf(SIZE_HEADER_BYTES + static_cast<size_t>(bound));
        writeU64LE(buf.data(), payload.size());

        const int n = LZ4_compress_default(payload.data(),
                                           buf.data() + SIZE_HEADER_BYTES,
                                           srcSize, bound);
        if (n <= 0)
            throw std::runtime_error("LZ4 compression failed for batch " + id);

        stored = SIZE_HEADER_BYTES + static_cast<size_t>(n);
        writeFile(path, buf.data(), stored);
    }

    logTrace("Spooled batch ", batch.sequence, " to ", path.string(), " (",
             stored, " of ", payload.size(), " bytes)");

    written.push_back(std::move(path));
    batches++;
    bytes += stored;
}

std::string SpoolSink::readSpooled(const fs::path& path) {
    std::ifstream inFile(path, std::ios::binary);
    if (!inFile) throw std::runtime_error("Cannot open " + path.string());
    std::string raw((std::istreambuf_iterator<char>(inFile)),
                    std::istreambuf_iterator<char>());

    if (path.extension() != ".lz4") return raw;

    if (raw.size() < SIZE_HEADER_BYTES)
        throw std::runtime_error("truncated spool header in " + path.string());

    const uint64_t size = readU64LE(raw.data());
    if (size > static_cast<uint64_t>(LZ4_MAX_INPUT_SIZE))
        throw std::runtime_error("bad payload size in " + path.string());

    std::string out(static_cast<size_t>(size), '\0');
    const int compressed = static_cast<int>(raw.size() - SIZE_HEADER_BYTES);
    const int r = LZ4_decompress_safe(raw.data() + SIZE_HEADER_BYTES,
                                      out.data(), compressed,
                                      static_cast<int>(size));
    if (r < 0 || static_cast<uint64_t>(r) != size)
        throw std::runtime_error("corrupt LZ4 block in " + path.string());
    return out;
}

}  // namespace winnow

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "batch_sink.h"

namespace winnow {

namespace fs = std::filesystem;

/**
 * Stores each batch as its own file under a spool directory, named after
 * the XXH3-64 of its payload: <id>.wfp, or <id>.wfp.lz4 when compressed.
 *
 * Compressed layout:
 *   u64 LE   uncompressed payload size
 *   bytes    one LZ4 block
 */
class SpoolSink final : public BatchSink {
public:
    SpoolSink(const fs::path& dir, bool compress);

    void write(const ScanRequestBatch& batch) override;

    const std::vector<fs::path>& writtenFiles() const { return written; }

    // 16 lowercase hex digits.
    static std::string batchId(const std::string& payload);

    // Returns the original payload of a spooled file. Throws
    // std::runtime_error on unreadable or corrupt input.
    static std::string readSpooled(const fs::path& path);

private:
    fs::path dir;
    bool compress;
    std::vector<fs::path> written;
};

}  // namespace winnow

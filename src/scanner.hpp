#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "config.hpp"
#include "fingerprinter.hpp"
#include "request_assembler.hpp"

namespace winnow {

namespace fs = std::filesystem;

struct ScanSummary {
    uint64_t filesQueued = 0;
    uint64_t fingerprinted = 0;  // FileClass::Snippets
    uint64_t tooSmall = 0;
    uint64_t binary = 0;
    uint64_t tooLarge = 0;
    uint64_t skipped = 0;
    std::vector<std::string> failed;  // unreadable or failed paths
    uint64_t batches = 0;
    uint64_t oversizedBatches = 0;
    // Batches the handler threw on; their records reached no one.
    uint64_t failedBatches = 0;
    std::vector<std::string> undelivered;
    bool stopped = false;

    // Files that got a record, delivered or not.
    uint64_t processed() const {
        return fingerprinted + tooSmall + binary + tooLarge + skipped;
    }
};

/**
 * Fingerprints a set of files on a pool of worker threads and feeds the
 * records to one shared RequestAssembler.
 *
 * A file that cannot be read or fingerprinted is logged and listed in
 * ScanSummary::failed; the rest of the scan carries on. A batch the handler
 * throws on lists its files in ScanSummary::undelivered instead.
 *
 * stop() lets every worker finish its current file and then flushes what
 * has been assembled. It is sticky: a stop() that lands before or during
 * run() makes that run, and any later one, claim no further files.
 *
 * Files above maxFileSize are never loaded whole; only their first
 * binarySampleSize bytes are read and the MD5 is streamed.
 */
class Scanner {
public:
    Scanner(const Config& config, BatchHandler handler);

    // Regular files under root (or root itself), sorted.
    std::vector<fs::path> collect(const fs::path& root) const;

    ScanSummary run(const std::vector<fs::path>& files);
    ScanSummary scan(const fs::path& root) { return run(collect(root)); }

    // Safe to call from any thread, including a batch handler.
    void stop() { stopFlag.store(true); }
    bool stopRequested() const { return stopFlag.load(); }

    static bool readFile(const fs::path& path, std::vector<uint8_t>& buffer);

private:
    FileRecord describeLargeFile(const fs::path& path, const std::string& name,
                                 uint64_t size) const;
    void worker(const std::vector<fs::path>& files, std::atomic<size_t>& next,
                ScanSummary& local);

    Config config;
    FileFingerprinter fingerprinter;
    RequestAssembler assembler;
    std::atomic<bool> stopFlag{false};
};

}  // namespace winnow

#include "scanner.hpp"

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include "log.hpp"
#include "wfp_format.hpp"

namespace winnow {

namespace {

bool isHidden(const fs::path& p) {
    const std::string name = p.filename().string();
    return name.size() > 1 && name[0] == '.' && name != "..";
}

void tally(ScanSummary& summary, FileClass cls) {
    switch (cls) {
        case FileClass::Snippets:
            summary.fingerprinted++;
            break;
        case FileClass::TooSmall:
            summary.tooSmall++;
            break;
        case FileClass::Binary:
            summary.binary++;
            break;
        case FileClass::TooLarge:
            summary.tooLarge++;
            break;
        case FileClass::Skipped:
            summary.skipped++;
            break;
    }
}

}  // anonymous namespace

Scanner::Scanner(const Config& config, BatchHandler handler)
    : config(config),
      fingerprinter(config),
      assembler(config.maxBatchBytes, std::move(handler)) {}

std::vector<fs::path> Scanner::collect(const fs::path& root) const {
    std::error_code ec;
    if (fs::is_regular_file(root, ec)) return {root};
    if (!fs::is_directory(root, ec))
        throw std::invalid_argument("Not a file or directory: " +
                                    root.string());

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec)
        throw std::runtime_error("Cannot read " + root.string() + ": " +
                                 ec.message());

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const fs::directory_entry& entry = *it;
        std::error_code entryEc;
        if (config.skipHidden && isHidden(entry.path())) {
            if (entry.is_directory(entryEc)) it.disable_recursion_pending();
            logTrace("Skipping hidden ", entry.path().string());
            continue;
        }
        if (entry.is_regular_file(entryEc)) files.push_back(entry.path());
    }
    if (ec)
        logWarn("Stopped walking ", root.string(), " early: ", ec.message());

    std::sort(files.begin(), files.end());
    return files;
}

bool Scanner::readFile(const fs::path& path, std::vector<uint8_t>& buffer) {
    std::ifstream inFile(path, std::ios::binary | std::ios::ate);
    if (!inFile) {
        logWarn("Failed to open input file: ", path.string());
        return false;
    }
    const std::streamoff size = inFile.tellg();
    if (size < 0) {
        logWarn("Failed to size input file: ", path.string());
        return false;
    }
    buffer.resize(static_cast<size_t>(size));
    inFile.seekg(0, std::ios::beg);
    inFile.read(reinterpret_cast<char*>(buffer.data()), size);
    if (inFile.gcount() != size) {
        logWarn("Short read on input file: ", path.string());
        return false;
    }
    return true;
}

FileRecord Scanner::describeLargeFile(const fs::path& path,
                                     const std::string& name,
                                     uint64_t size) const {
    std::ifstream inFile(path, std::ios::binary);
    if (!inFile) throw std::runtime_error("Failed to open input file");

    std::vector<uint8_t> head(static_cast<size_t>(
        std::min<uint64_t>(size, config.binarySampleSize)));
    inFile.read(reinterpret_cast<char*>(head.data()),
                static_cast<std::streamsize>(head.size()));
    if (static_cast<size_t>(inFile.gcount()) != head.size())
        throw std::runtime_error("Short read on input file");

    inFile.clear();
    inFile.seekg(0, std::ios::beg);
    std::string md5 = md5Stream(inFile);
    return fingerprinter.describe(name, head.data(), head.size(), size,
                                  std::move(md5));
}

void Scanner::worker(const std::vector<fs::path>& files,
                     std::atomic<size_t>& next, ScanSummary& local) {
    std::vector<uint8_t> buffer;
    logTrace("Starting worker ", std::this_thread::get_id());

    size_t i;
    while (!stopFlag.load(std::memory_order_relaxed) &&
           (i = next.fetch_add(1, std::memory_order_relaxed)) < files.size()) {
        const fs::path& path = files[i];
        const std::string name = path.generic_string();

        if (!isWfpPath(name)) {
            logWarn("Line break in file name, skipping: ", name);
            local.failed.push_back(name);
            continue;
        }

        try {
            std::error_code ec;
            const uint64_t size = fs::file_size(path, ec);
            if (ec) {
                logWarn("Failed to stat input file: ", name, ": ",
                        ec.message());
                local.failed.push_back(name);
                continue;
            }

            FileRecord record;
            if (size > config.maxFileSize) {
                // Only the head and a streamed digest, never the whole file.
                record = describeLargeFile(path, name, size);
            } else {
                if (!readFile(path, buffer)) {
                    local.failed.push_back(name);
                    continue;
                }
                record = fingerprinter.fingerprint(name, buffer);
            }

            const FileClass cls = record.classification;
            logDebug("Fingerprinted ", name, " [", fileClassName(cls), ", ",
                     record.fingerprint.size(), " snippets]");
            assembler.add(std::move(record));
            tally(local, cls);
        } catch (const std::exception& e) {
            logError("Problem fingerprinting ", name, ": ", e.what());
            local.failed.push_back(name);
        }
    }
    logTrace("Worker complete ", std::this_thread::get_id());
}

ScanSummary Scanner::run(const std::vector<fs::path>& files) {
    if (stopFlag.load()) logInfo("Scan stopped before it started");

    unsigned threads = config.effectiveThreads();
    if (files.size() < threads) {
        logDebug("Input (", files.size(), ") smaller than requested threads: ",
                 threads, ". Reducing to input size.");
        threads = std::max<unsigned>(1, static_cast<unsigned>(files.size()));
    }
    logDebug("Starting ", threads, " threads to process ", files.size(),
             " files...");

    const uint64_t batchesBefore = assembler.batchesEmitted();
    const uint64_t oversizedBefore = assembler.oversizedBatches();
    const uint64_t failedBefore = assembler.failedBatches();
    const size_t undeliveredBefore = assembler.undeliveredPaths().size();

    std::atomic<size_t> next{0};
    std::vector<ScanSummary> locals(threads);
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (unsigned t = 0; t < threads; t++)
        pool.emplace_back(&Scanner::worker, this, std::cref(files),
                          std::ref(next), std::ref(locals[t]));
    for (auto& th : pool) th.join();

    // Stopped or not, whatever was assembled goes out as a final batch.
    assembler.flush();

    ScanSummary summary;
    summary.filesQueued = files.size();
    for (ScanSummary& local : locals) {
        summary.fingerprinted += local.fingerprinted;
        summary.tooSmall += local.tooSmall;
        summary.binary += local.binary;
        summary.tooLarge += local.tooLarge;
        summary.skipped += local.skipped;
        summary.failed.insert(summary.failed.end(),
                              std::make_move_iterator(local.failed.begin()),
                              std::make_move_iterator(local.failed.end()));
    }
    std::sort(summary.failed.begin(), summary.failed.end());
    summary.batches = assembler.batchesEmitted() - batchesBefore;
    summary.oversizedBatches = assembler.oversizedBatches() - oversizedBefore;
    summary.failedBatches = assembler.failedBatches() - failedBefore;
    const std::vector<std::string> undelivered = assembler.undeliveredPaths();
    summary.undelivered.assign(
        undelivered.begin() +
            static_cast<std::ptrdiff_t>(undeliveredBefore),
        undelivered.end());
    summary.stopped = stopFlag.load();
    return summary;
}

}  // namespace winnow

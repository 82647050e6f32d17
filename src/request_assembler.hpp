#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "fingerprinter.hpp"

namespace winnow {

struct ScanRequestBatch {
    uint64_t sequence = 0;  // emission order, starting at 0
    std::string payload;    // concatenated WFP records
    std::vector<std::string> paths;  // in record order
    bool oversized = false;  // a single record above the size limit

    size_t fileCount() const { return paths.size(); }
};

using BatchHandler = std::function<void(ScanRequestBatch&&)>;

/**
 * Packs serialized FileRecords into payloads of at most maxBatchBytes.
 *
 * A record that does not fit closes the current batch and opens the next.
 * A record larger than the limit by itself is emitted alone, flagged
 * oversized, and never truncated. Records keep their arrival order across
 * batch boundaries.
 *
 * add() and flush() may be called from any thread. The handler runs under
 * the assembler's lock, so batches reach it one at a time and in order.
 *
 * A handler that throws loses only its own batch: the error is logged, the
 * batch's paths are kept in undeliveredPaths(), and assembly carries on.
 */
class RequestAssembler {
public:
    RequestAssembler(size_t maxBatchBytes, BatchHandler handler);
    ~RequestAssembler() = default;

    RequestAssembler(const RequestAssembler&) = delete;
    RequestAssembler& operator=(const RequestAssembler&) = delete;

    void add(FileRecord record);

    // Emits the partially filled batch, if any.
    void flush();

    uint64_t recordsAdded() const;
    uint64_t batchesEmitted() const;
    uint64_t oversizedBatches() const;
    uint64_t failedBatches() const;

    // Paths of every record whose batch the handler rejected, in
    // emission order.
    std::vector<std::string> undeliveredPaths() const;

private:
    void emitLocked();

    size_t maxBatchBytes;
    BatchHandler handler;

    mutable std::mutex mutex;
    ScanRequestBatch current;
    uint64_t records = 0;
    uint64_t emitted = 0;
    uint64_t oversized = 0;
    uint64_t failed = 0;
    std::vector<std::string> undelivered;
};

}  // namespace winnow

#include "request_assembler.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

#include "log.hpp"
#include "wfp_format.hpp"

namespace winnow {

RequestAssembler::RequestAssembler(size_t maxBatchBytes, BatchHandler handler)
    : maxBatchBytes(maxBatchBytes), handler(std::move(handler)) {
    if (maxBatchBytes == 0)
        throw std::invalid_argument("max batch size must be > 0");
    if (!this->handler) throw std::invalid_argument("batch handler is empty");
}

void RequestAssembler::emitLocked() {
    if (current.paths.empty()) return;

    ScanRequestBatch batch = std::move(current);
    current = ScanRequestBatch{};
    batch.sequence = emitted++;
    if (batch.oversized) oversized++;

    logDebug("Emitting batch ", batch.sequence, ": ", batch.fileCount(),
             " file(s), ", batch.payload.size(), " bytes");

    // Kept for reporting; the handler takes the batch.
    std::vector<std::string> paths = batch.paths;
    const uint64_t sequence = batch.sequence;
    try {
        handler(std::move(batch));
    } catch (const std::exception& e) {
        logError("Batch ", sequence, " (", paths.size(),
                 " file(s)) was not delivered: ", e.what());
        failed++;
        undelivered.insert(undelivered.end(),
                           std::make_move_iterator(paths.begin()),
                           std::make_move_iterator(paths.end()));
    }
}

void RequestAssembler::add(FileRecord record) {
    std::string text = serializeRecord(record);

    std::lock_guard<std::mutex> lock(mutex);
    records++;

    if (text.size() > maxBatchBytes) {
        logWarn("WFP for ", record.path, " is ", text.size(),
                " bytes, above the ", maxBatchBytes,
                " byte request limit. Sending it on its own.");
        emitLocked();
        current.payload = std::move(text);
        current.paths.push_back(std::move(record.path));
        current.oversized = true;
        emitLocked();
        return;
    }

    if (!current.paths.empty() &&
        current.payload.size() + text.size() > maxBatchBytes)
        emitLocked();

    current.payload += text;
    current.paths.push_back(std::move(record.path));
}

void RequestAssembler::flush() {
    std::lock_guard<std::mutex> lock(mutex);
    emitLocked();
}

uint64_t RequestAssembler::recordsAdded() const {
    std::lock_guard<std::mutex> lock(mutex);
    return records;
}

uint64_t RequestAssembler::batchesEmitted() const {
    std::lock_guard<std::mutex> lock(mutex);
    return emitted;
}

uint64_t RequestAssembler::oversizedBatches() const {
    std::lock_guard<std::mutex> lock(mutex);
    return oversized;
}

uint64_t RequestAssembler::failedBatches() const {
    std::lock_guard<std::mutex> lock(mutex);
    return failed;
}

std::vector<std::string> RequestAssembler::undeliveredPaths() const {
    std::lock_guard<std::mutex> lock(mutex);
    return undelivered;
}

}  // namespace winnow

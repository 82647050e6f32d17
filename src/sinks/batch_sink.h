#pragma once

#include <cstdint>

#include "request_assembler.hpp"

namespace winnow {

// Hand-off point to the transport layer. RequestAssembler delivers
// batches one at a time, so implementations need no locking of their own
// when used as its handler.
class BatchSink {
public:
    virtual ~BatchSink() = default;

    virtual void write(const ScanRequestBatch& batch) = 0;

    uint64_t batchesWritten() const { return batches; }
    uint64_t bytesWritten() const { return bytes; }

protected:
    uint64_t batches = 0;
    uint64_t bytes = 0;
};

}  // namespace winnow

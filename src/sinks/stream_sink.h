#pragma once

#include <ostream>

#include "batch_sink.h"

namespace winnow {

// Writes payloads back to back, producing one plain .wfp stream.
class StreamSink final : public BatchSink {
public:
    explicit StreamSink(std::ostream& out) : out(out) {}

    void write(const ScanRequestBatch& batch) override;

private:
    std::ostream& out;
};

}  // namespace winnow

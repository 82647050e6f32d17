#include "stream_sink.h"

#include <stdexcept>

namespace winnow {

void StreamSink::write(const ScanRequestBatch& batch) {
    out.write(batch.payload.data(),
              static_cast<std::streamsize>(batch.payload.size()));
    out.flush();
    if (!out) throw std::runtime_error("failed writing WFP stream");
    batches++;
    bytes += batch.payload.size();
}

}  // namespace winnow

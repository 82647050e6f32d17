#include "config.hpp"

#include <stdexcept>
#include <string>

#include "log.hpp"

namespace winnow {

void Config::validate() const {
    if (gramSize == 0) throw std::invalid_argument("gram size must be > 0");
    if (windowSize == 0)
        throw std::invalid_argument("window size must be > 0");
    if (minFileSize > maxFileSize)
        throw std::invalid_argument(
            "min file size (" + std::to_string(minFileSize) +
            ") exceeds max file size (" + std::to_string(maxFileSize) + ")");
    if (maxBatchBytes == 0)
        throw std::invalid_argument("max batch size must be > 0");
}

unsigned Config::effectiveThreads() const {
    if (threads == 0) return 1;
    if (threads > MAX_ALLOWED_THREADS) {
        logWarn("Requested threads too large: ", threads, ". Reducing to ",
                MAX_ALLOWED_THREADS);
        return MAX_ALLOWED_THREADS;
    }
    return threads;
}

}  // namespace winnow

#include "include/results.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace sigmaxfer {

TransferRecord::TransferRecord(std::string filename,
                               std::string remote_path,
                               std::uint64_t size_bytes,
                               double duration_seconds,
                               std::string digest_hex,
                               std::chrono::system_clock::time_point timestamp,
                               int attempts)
    : filename_(std::move(filename)),
      remote_path_(std::move(remote_path)),
      size_bytes_(size_bytes),
      duration_seconds_(duration_seconds),
      digest_hex_(std::move(digest_hex)),
      timestamp_(timestamp),
      attempts_(attempts) {
    if (filename_.empty()) {
        throw std::invalid_argument("TransferRecord: filename must not be empty");
    }
    if (!(duration_seconds_ > 0.0) || !std::isfinite(duration_seconds_)) {
        throw std::invalid_argument("TransferRecord: duration must be positive");
    }
    if (attempts_ < 1) {
        throw std::invalid_argument("TransferRecord: attempts must be >= 1");
    }
}

}  // namespace sigmaxfer

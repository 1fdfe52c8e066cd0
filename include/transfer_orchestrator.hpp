#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "results.hpp"
#include "secure_channel.hpp"

namespace sigmaxfer {

enum class TransferState { Attempting, Succeeded, Failed };

// Time sources used by the retry loop; replaced in tests.
struct TransferClock {
    std::function<std::chrono::steady_clock::time_point()> now;
    std::function<std::chrono::system_clock::time_point()> wall_now;
    std::function<void(std::chrono::milliseconds)> sleep;

    static TransferClock system();
};

// Transfers one file at a time with verification and exponential backoff:
// after failed attempt n the loop sleeps unit * 2^n before attempt n + 1.
class TransferOrchestrator {
   public:
    TransferOrchestrator(SecureChannel& channel,
                         Logger& logger,
                         TransferClock clock = TransferClock::system(),
                         std::chrono::milliseconds backoff_unit = Config::BACKOFF_UNIT);

    // Returns true when the file arrived (and verified, if requested); exactly one
    // record is appended in that case and none otherwise. Throws
    // std::invalid_argument when max_attempts < 1.
    bool transfer(const std::filesystem::path& local_path,
                  const std::string& remote_path,
                  bool verify = true,
                  int max_attempts = Config::DEFAULT_RETRIES);

    [[nodiscard]] const std::vector<TransferRecord>& records() const noexcept { return records_; }
    [[nodiscard]] std::vector<double> throughputs() const;

    [[nodiscard]] static std::chrono::milliseconds backoff_delay(int attempt,
                                                                 std::chrono::milliseconds unit);

   private:
    std::expected<TransferRecord, TransferError> run_attempt(const std::filesystem::path& local_path,
                                                             const std::string& remote_path,
                                                             bool verify,
                                                             int attempt);

    std::expected<void, TransferError> verify_remote(const std::string& remote_path,
                                                     const std::string& local_digest);

    std::chrono::system_clock::time_point next_timestamp();

    SecureChannel& channel_;
    Logger& logger_;
    TransferClock clock_;
    std::chrono::milliseconds backoff_unit_;
    std::vector<TransferRecord> records_;
};

}  // namespace sigmaxfer

#include "include/transfer_orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <stdexcept>
#include <thread>
#include <utility>

#include "include/hasher.hpp"
#include "include/utils.hpp"

namespace sigmaxfer {

TransferClock TransferClock::system() {
    return TransferClock{
        [] { return std::chrono::steady_clock::now(); },
        [] { return std::chrono::system_clock::now(); },
        [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); },
    };
}

TransferOrchestrator::TransferOrchestrator(SecureChannel& channel,
                                           Logger& logger,
                                           TransferClock clock,
                                           std::chrono::milliseconds backoff_unit)
    : channel_(channel), logger_(logger), clock_(std::move(clock)), backoff_unit_(backoff_unit) {}

std::chrono::milliseconds TransferOrchestrator::backoff_delay(int attempt,
                                                              std::chrono::milliseconds unit) {
    std::chrono::milliseconds::rep factor = 1;
    for (int i = 0; i < std::min(attempt, 30); ++i) {
        factor *= Config::BACKOFF_BASE;
    }
    return unit * factor;
}

std::vector<double> TransferOrchestrator::throughputs() const {
    std::vector<double> values;
    values.reserve(records_.size());
    for (const auto& r : records_) {
        values.push_back(r.throughput_mbps());
    }
    return values;
}

bool TransferOrchestrator::transfer(const std::filesystem::path& local_path,
                                    const std::string& remote_path,
                                    bool verify,
                                    int max_attempts) {
    if (max_attempts < 1) {
        throw std::invalid_argument("max_attempts must be >= 1");
    }

    TransferState state = TransferState::Attempting;
    int attempt = 1;

    while (state == TransferState::Attempting) {
        auto result = run_attempt(local_path, remote_path, verify, attempt);

        if (result) {
            records_.push_back(std::move(*result));
            logger_.info("Transfer successful: {} -> {}", local_path.string(), remote_path);
            state = TransferState::Succeeded;
            continue;
        }

        logger_.error("Attempt {}/{} failed: {}", attempt, max_attempts, to_string(result.error()));

        if (attempt >= max_attempts) {
            logger_.critical("Max retries exceeded: {}", local_path.string());
            state = TransferState::Failed;
            continue;
        }

        auto delay = backoff_delay(attempt, backoff_unit_);
        logger_.debug("Retrying {} in {} ms", local_path.string(), delay.count());
        clock_.sleep(delay);
        ++attempt;
    }

    return state == TransferState::Succeeded;
}

std::expected<TransferRecord, TransferError> TransferOrchestrator::run_attempt(
    const std::filesystem::path& local_path,
    const std::string& remote_path,
    bool verify,
    int attempt) {
    try {
        auto digest = Hasher::digest_file(local_path);
        if (!digest) {
            return std::unexpected(TransferError{TransferErrorKind::LocalIo, digest.error()});
        }

        auto start = clock_.now();
        if (auto put = channel_.put(local_path, remote_path); !put) {
            return std::unexpected(put.error());
        }
        auto elapsed = clock_.now() - start;
        if (elapsed <= std::chrono::steady_clock::duration::zero()) {
            elapsed = std::chrono::steady_clock::duration(1);
        }

        if (verify) {
            if (auto check = verify_remote(remote_path, digest->hex); !check) {
                return std::unexpected(check.error());
            }
        }

        return TransferRecord(local_path.string(),
                              remote_path,
                              digest->size_bytes,
                              std::chrono::duration<double>(elapsed).count(),
                              digest->hex,
                              next_timestamp(),
                              attempt);
    } catch (const std::exception& e) {
        return std::unexpected(TransferError{TransferErrorKind::Transport,
                                             std::format("unexpected error: {}", e.what())});
    }
}

std::expected<void, TransferError> TransferOrchestrator::verify_remote(
    const std::string& remote_path, const std::string& local_digest) {
    auto output = channel_.run_command(
        std::format("{} {}", Config::REMOTE_DIGEST_COMMAND, shell_quote_path(remote_path)));
    if (!output) {
        return std::unexpected(output.error());
    }

    auto remote_digest = Hasher::parse_remote_digest(*output);
    if (!remote_digest) {
        return std::unexpected(TransferError{TransferErrorKind::Integrity, remote_digest.error()});
    }

    if (*remote_digest != local_digest) {
        return std::unexpected(TransferError{
            TransferErrorKind::Integrity,
            std::format("Checksum mismatch (local {}, remote {})", local_digest, *remote_digest)});
    }
    return {};
}

std::chrono::system_clock::time_point TransferOrchestrator::next_timestamp() {
    auto ts = clock_.wall_now();
    if (!records_.empty() && ts < records_.back().timestamp()) {
        ts = records_.back().timestamp();
    }
    return ts;
}

}  // namespace sigmaxfer

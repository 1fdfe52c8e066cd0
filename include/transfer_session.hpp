#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

#include "config.hpp"
#include "logger.hpp"
#include "quality_report.hpp"
#include "results.hpp"
#include "secure_channel.hpp"
#include "transfer_orchestrator.hpp"

namespace sigmaxfer {

// Owns one secure channel for its whole lifetime. The channel is opened in the
// constructor and closed exactly once: by close() or, at the latest, by the
// destructor, whichever comes first.
class TransferSession {
   public:
    using ChannelFactory = std::function<std::unique_ptr<SecureChannel>()>;
    using ResultCallback = std::function<void(const TransferOutcome&)>;
    using StopPredicate = std::function<bool()>;

    // Propagates ConnectionError from the factory; no retry happens at this level.
    TransferSession(const ChannelFactory& factory,
                    Logger& logger,
                    TransferClock clock = TransferClock::system(),
                    std::chrono::milliseconds backoff_unit = Config::BACKOFF_UNIT);
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    bool transfer(const TransferJob& job,
                  bool verify = true,
                  int max_attempts = Config::DEFAULT_RETRIES);

    // Transfers jobs one after another. Stops early (between jobs) when
    // should_stop returns true.
    std::vector<TransferOutcome> run(const std::vector<TransferJob>& jobs,
                                     bool verify = true,
                                     int max_attempts = Config::DEFAULT_RETRIES,
                                     const ResultCallback& on_result = {},
                                     const StopPredicate& should_stop = {});

    [[nodiscard]] QualityReport report(const SpecLimits& limits = {}) const;

    [[nodiscard]] const std::vector<TransferRecord>& records() const noexcept {
        return orchestrator_.records();
    }

    [[nodiscard]] bool is_open() const noexcept { return open_; }

    void close() noexcept;

   private:
    Logger& logger_;
    std::unique_ptr<SecureChannel> channel_;
    TransferOrchestrator orchestrator_;
    bool open_ = true;
};

}  // namespace sigmaxfer

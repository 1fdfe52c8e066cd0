#include "include/transfer_session.hpp"

#include <stdexcept>
#include <utility>

#include "include/errors.hpp"

namespace sigmaxfer {

namespace {

std::unique_ptr<SecureChannel> open_channel(const TransferSession::ChannelFactory& factory) {
    if (!factory) {
        throw std::invalid_argument("TransferSession: no channel factory");
    }
    auto channel = factory();
    if (!channel) {
        throw ConnectionError("Channel factory returned no channel");
    }
    return channel;
}

}  // namespace

TransferSession::TransferSession(const ChannelFactory& factory,
                                 Logger& logger,
                                 TransferClock clock,
                                 std::chrono::milliseconds backoff_unit)
    : logger_(logger),
      channel_(open_channel(factory)),
      orchestrator_(*channel_, logger, std::move(clock), backoff_unit) {
    logger_.debug("Secure channel opened");
}

TransferSession::~TransferSession() {
    close();
}

void TransferSession::close() noexcept {
    if (!open_) return;
    open_ = false;
    channel_->close();
}

bool TransferSession::transfer(const TransferJob& job, bool verify, int max_attempts) {
    if (!open_) {
        throw std::logic_error("TransferSession: transfer on a closed session");
    }
    return orchestrator_.transfer(job.local, job.remote, verify, max_attempts);
}

std::vector<TransferOutcome> TransferSession::run(const std::vector<TransferJob>& jobs,
                                                  bool verify,
                                                  int max_attempts,
                                                  const ResultCallback& on_result,
                                                  const StopPredicate& should_stop) {
    std::vector<TransferOutcome> outcomes;
    outcomes.reserve(jobs.size());

    for (const auto& job : jobs) {
        if (should_stop && should_stop()) {
            logger_.warning("Run stopped before {}", job.local.string());
            break;
        }

        TransferOutcome outcome{job, transfer(job, verify, max_attempts)};
        if (on_result) on_result(outcome);
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

QualityReport TransferSession::report(const SpecLimits& limits) const {
    return QualityReportBuilder(limits).build(orchestrator_.records());
}

}  // namespace sigmaxfer

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "include/errors.hpp"
#include "include/transfer_session.hpp"
#include "tests/test_support.hpp"

using namespace sigmaxfer;
using namespace sigmaxfer::test_support;
using namespace std::chrono_literals;

namespace {

class TransferSessionTest : public ::testing::Test {
   protected:
    TempDir dir;
    FakeClock fake;
    CapturingLogger log;
    std::shared_ptr<ChannelLog> channel_log = std::make_shared<ChannelLog>();
    int put_failures = 0;

    TransferSession::ChannelFactory factory() {
        return [this]() -> std::unique_ptr<SecureChannel> {
            auto channel = std::make_unique<FakeChannel>(channel_log);
            for (int i = 0; i < put_failures; ++i) {
                channel->put_results.push_back(transport_failure());
            }
            return channel;
        };
    }

    std::unique_ptr<TransferSession> open() {
        return std::make_unique<TransferSession>(factory(), log.logger, fake.clock(), 1s);
    }
};

}  // namespace

TEST_F(TransferSessionTest, ClosesChannelOnceAfterNormalRun) {
    auto file = dir.write("a.bin", "alpha");
    {
        auto session = open();
        EXPECT_TRUE(session->transfer(TransferJob{file, "/srv/a.bin"}));
        EXPECT_EQ(channel_log->close_calls, 0);
    }
    EXPECT_EQ(channel_log->close_calls, 1);
}

TEST_F(TransferSessionTest, ClosesChannelOnceAfterFailedTransfer) {
    auto file = dir.write("b.bin", "beta");
    put_failures = 2;
    {
        auto session = open();
        EXPECT_FALSE(session->transfer(TransferJob{file, "/srv/b.bin"}, true, 2));
    }
    EXPECT_EQ(channel_log->close_calls, 1);
}

TEST_F(TransferSessionTest, ClosesChannelWhenExceptionLeavesScope) {
    auto file = dir.write("c.bin", "gamma");
    EXPECT_THROW(
        {
            TransferSession session(factory(), log.logger, fake.clock(), 1s);
            session.transfer(TransferJob{file, "/srv/c.bin"});
            throw std::runtime_error("caller gave up");
        },
        std::runtime_error);
    EXPECT_EQ(channel_log->close_calls, 1);
}

TEST_F(TransferSessionTest, ExplicitCloseIsIdempotent) {
    auto session = open();
    session->close();
    session->close();
    EXPECT_FALSE(session->is_open());
    session.reset();
    EXPECT_EQ(channel_log->close_calls, 1);
}

TEST_F(TransferSessionTest, TransferAfterCloseIsRejected) {
    auto file = dir.write("d.bin", "delta");
    auto session = open();
    session->close();
    EXPECT_THROW(session->transfer(TransferJob{file, "/srv/d.bin"}), std::logic_error);
}

TEST_F(TransferSessionTest, ConnectionErrorPropagatesWithoutClose) {
    TransferSession::ChannelFactory failing = []() -> std::unique_ptr<SecureChannel> {
        throw ConnectionError("Authentication failed");
    };
    EXPECT_THROW(TransferSession(failing, log.logger, fake.clock(), 1s), ConnectionError);
    EXPECT_EQ(channel_log->close_calls, 0);
}

TEST_F(TransferSessionTest, NullChannelIsAConnectionError) {
    TransferSession::ChannelFactory empty = []() -> std::unique_ptr<SecureChannel> { return nullptr; };
    EXPECT_THROW(TransferSession(empty, log.logger, fake.clock(), 1s), ConnectionError);
}

TEST_F(TransferSessionTest, MissingFactoryIsRejected) {
    EXPECT_THROW(TransferSession({}, log.logger, fake.clock(), 1s), std::invalid_argument);
}

TEST_F(TransferSessionTest, RunReportsEachOutcomeInOrder) {
    std::vector<TransferJob> jobs = {
        {dir.write("e1.bin", "one"), "/srv/e1.bin"},
        {dir.path() / "missing.bin", "/srv/missing.bin"},
        {dir.write("e3.bin", "three"), "/srv/e3.bin"},
    };

    auto session = open();
    std::vector<std::string> seen;
    auto outcomes = session->run(jobs, true, 2, [&](const TransferOutcome& o) {
        seen.push_back(o.job.remote);
    });

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_TRUE(outcomes[0].success);
    EXPECT_FALSE(outcomes[1].success);
    EXPECT_TRUE(outcomes[2].success);
    EXPECT_EQ(seen, (std::vector<std::string>{"/srv/e1.bin", "/srv/missing.bin", "/srv/e3.bin"}));
    EXPECT_EQ(session->records().size(), 2u);
}

TEST_F(TransferSessionTest, RunStopsBetweenFiles) {
    std::vector<TransferJob> jobs = {
        {dir.write("f1.bin", "one"), "/srv/f1.bin"},
        {dir.write("f2.bin", "two"), "/srv/f2.bin"},
        {dir.write("f3.bin", "three"), "/srv/f3.bin"},
    };

    auto session = open();
    int done = 0;
    auto outcomes = session->run(
        jobs, true, 3, [&](const TransferOutcome&) { ++done; }, [&] { return done >= 1; });

    EXPECT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(channel_log->puts.size(), 1u);
    EXPECT_EQ(log.count(LogLevel::Warning, "Run stopped"), 1u);
}

TEST_F(TransferSessionTest, ReportCoversSuccessfulTransfers) {
    auto session = open();
    ASSERT_TRUE(session->transfer(TransferJob{dir.write("g1.bin", "one"), "/srv/g1.bin"}));
    ASSERT_TRUE(session->transfer(TransferJob{dir.write("g2.bin", "two"), "/srv/g2.bin"}));

    auto report = session->report(SpecLimits{50.0, 5.0, 5.0});
    EXPECT_EQ(report.throughput_stats.sample_count, 2u);
    EXPECT_EQ(report.transfer_records.size(), 2u);
    EXPECT_DOUBLE_EQ(report.spec_limits.usl, 50.0);
}

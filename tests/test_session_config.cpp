#include <chrono>
#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "include/session_config.hpp"
#include "tests/test_support.hpp"

using namespace sigmaxfer;
using sigmaxfer::test_support::TempDir;

namespace {

SessionConfig valid_config() {
    SessionConfig cfg;
    cfg.host = "backup.example.org";
    cfg.username = "deploy";
    cfg.key_path = "/home/deploy/.ssh/id_ed25519";
    cfg.files.push_back(TransferJob{"data.bin", "/srv/data.bin"});
    return cfg;
}

}  // namespace

TEST(SessionConfig, ParsesEveryKey) {
    auto cfg = parse_config(R"({
        "host": "backup.example.org",
        "port": 2222,
        "username": "deploy",
        "key_path": "/keys/id_ed25519",
        "bandwidth_limit": 512,
        "socket_timeout": 30,
        "known_hosts": "/tmp/known_hosts",
        "retries": 5,
        "verify": false,
        "usl": 80.0,
        "lsl": 20.0,
        "defect_threshold": 15.0,
        "report_path": "report.json.gz",
        "chart": false,
        "log_file": "run.log",
        "log_level": "debug",
        "files": [{"local": "a.bin", "remote": "/srv/a.bin"},
                  {"local": "b.bin", "remote": "/srv/b.bin"}]
    })");

    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->host, "backup.example.org");
    EXPECT_EQ(cfg->port, 2222);
    EXPECT_EQ(cfg->username, "deploy");
    EXPECT_EQ(cfg->key_path.string(), "/keys/id_ed25519");
    ASSERT_TRUE(cfg->bandwidth_limit_kbps.has_value());
    EXPECT_EQ(*cfg->bandwidth_limit_kbps, 512);
    EXPECT_EQ(cfg->socket_timeout_sec, 30);
    EXPECT_EQ(cfg->known_hosts.string(), "/tmp/known_hosts");
    EXPECT_EQ(cfg->retries, 5);
    EXPECT_FALSE(cfg->verify);
    EXPECT_DOUBLE_EQ(cfg->limits.usl, 80.0);
    EXPECT_DOUBLE_EQ(cfg->limits.lsl, 20.0);
    EXPECT_DOUBLE_EQ(cfg->limits.defect_threshold, 15.0);
    EXPECT_EQ(cfg->report_path.string(), "report.json.gz");
    EXPECT_FALSE(cfg->chart);
    EXPECT_EQ(cfg->log_file.string(), "run.log");
    EXPECT_EQ(cfg->log_level, LogLevel::Debug);
    ASSERT_EQ(cfg->files.size(), 2u);
    EXPECT_EQ(cfg->files[1].local.string(), "b.bin");
    EXPECT_EQ(cfg->files[1].remote, "/srv/b.bin");
}

TEST(SessionConfig, MissingKeysKeepDefaults) {
    auto cfg = parse_config(R"({"host": "h", "comment": "ignored"})");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->port, Config::SSH_DEFAULT_PORT);
    EXPECT_EQ(cfg->retries, Config::DEFAULT_RETRIES);
    EXPECT_TRUE(cfg->verify);
    EXPECT_FALSE(cfg->bandwidth_limit_kbps.has_value());
    EXPECT_DOUBLE_EQ(cfg->limits.usl, Config::DEFAULT_USL_MBPS);
    EXPECT_DOUBLE_EQ(cfg->limits.lsl, Config::DEFAULT_LSL_MBPS);
    EXPECT_EQ(cfg->log_file.string(), Config::LOG_FILENAME);
    EXPECT_EQ(cfg->log_level, LogLevel::Info);
}

TEST(SessionConfig, RejectsMalformedJson) {
    auto cfg = parse_config("{ \"host\": ");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("Malformed"), std::string::npos);
}

TEST(SessionConfig, RejectsNonObjectDocument) {
    EXPECT_FALSE(parse_config("[1, 2, 3]").has_value());
}

TEST(SessionConfig, RejectsWrongTypes) {
    EXPECT_FALSE(parse_config(R"({"port": "twenty-two"})").has_value());
    EXPECT_FALSE(parse_config(R"({"verify": "yes"})").has_value());
    EXPECT_FALSE(parse_config(R"({"files": {"local": "a"}})").has_value());
    EXPECT_FALSE(parse_config(R"({"files": [{"local": "a"}]})").has_value());
}

TEST(SessionConfig, RejectsUnknownLogLevel) {
    auto cfg = parse_config(R"({"log_level": "chatty"})");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("chatty"), std::string::npos);
}

TEST(SessionConfig, NullBandwidthClearsLimit) {
    SessionConfig base;
    base.bandwidth_limit_kbps = 100;
    auto cfg = parse_config(R"({"bandwidth_limit": null})", base);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_FALSE(cfg->bandwidth_limit_kbps.has_value());
}

TEST(SessionConfig, LoadsFromFile) {
    TempDir dir;
    auto path = dir.write("sigmaxfer.json", R"({"host": "files.example.org", "retries": 2})");
    auto cfg = load_config(path);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->host, "files.example.org");
    EXPECT_EQ(cfg->retries, 2);
}

TEST(SessionConfig, MissingFileIsAnError) {
    TempDir dir;
    EXPECT_FALSE(load_config(dir.path() / "absent.json").has_value());
}

TEST(SessionConfig, ValidConfigPasses) {
    EXPECT_TRUE(validate(valid_config()).has_value());
}

TEST(SessionConfig, ValidateRejectsBadValues) {
    auto cfg = valid_config();
    cfg.host = "  ";
    EXPECT_FALSE(validate(cfg).has_value());

    cfg = valid_config();
    cfg.username.clear();
    EXPECT_FALSE(validate(cfg).has_value());

    cfg = valid_config();
    cfg.key_path.clear();
    EXPECT_FALSE(validate(cfg).has_value());

    cfg = valid_config();
    cfg.port = 0;
    EXPECT_FALSE(validate(cfg).has_value());
    cfg.port = 70000;
    EXPECT_FALSE(validate(cfg).has_value());

    cfg = valid_config();
    cfg.retries = 0;
    EXPECT_FALSE(validate(cfg).has_value());

    cfg = valid_config();
    cfg.bandwidth_limit_kbps = 0;
    EXPECT_FALSE(validate(cfg).has_value());

    cfg = valid_config();
    cfg.limits.usl = 10.0;
    cfg.limits.lsl = 10.0;
    EXPECT_FALSE(validate(cfg).has_value());

    cfg = valid_config();
    cfg.files.push_back(TransferJob{"", "/srv/x"});
    EXPECT_FALSE(validate(cfg).has_value());
}

TEST(SessionConfig, ChannelOptionsMirrorConnectionSettings) {
    auto cfg = valid_config();
    cfg.port = 2200;
    cfg.bandwidth_limit_kbps = 256;
    cfg.socket_timeout_sec = 5;

    auto options = cfg.channel_options();
    EXPECT_EQ(options.host, cfg.host);
    EXPECT_EQ(options.port, 2200);
    EXPECT_EQ(options.username, cfg.username);
    EXPECT_EQ(options.key_path.string(), cfg.key_path.string());
    EXPECT_EQ(options.bandwidth_limit_kbps, std::optional<long>(256));
    EXPECT_EQ(options.socket_timeout, std::chrono::seconds(5));
}

TEST(ParseJob, SplitsAtFirstColon) {
    auto job = parse_job("data.bin:/srv/backup:2024/data.bin");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->local.string(), "data.bin");
    EXPECT_EQ(job->remote, "/srv/backup:2024/data.bin");
}

TEST(ParseJob, RejectsIncompletePairs) {
    EXPECT_FALSE(parse_job("data.bin").has_value());
    EXPECT_FALSE(parse_job(":/srv/data.bin").has_value());
    EXPECT_FALSE(parse_job("data.bin:").has_value());
}

#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string_view>
#include <string>
#include <vector>

#include "config.hpp"
#include "logger.hpp"
#include "results.hpp"
#include "scp_channel.hpp"

namespace sigmaxfer {

struct SessionConfig {
    std::string host;
    int port = Config::SSH_DEFAULT_PORT;
    std::string username;
    std::filesystem::path key_path;
    std::optional<long> bandwidth_limit_kbps;
    long socket_timeout_sec = Config::SOCKET_TIMEOUT_SEC;
    std::filesystem::path known_hosts;

    int retries = Config::DEFAULT_RETRIES;
    bool verify = true;
    SpecLimits limits;

    std::filesystem::path report_path;
    bool chart = true;
    std::filesystem::path log_file{Config::LOG_FILENAME};
    LogLevel log_level = LogLevel::Info;

    std::vector<TransferJob> files;

    [[nodiscard]] ChannelOptions channel_options() const;
};

// Reads a JSON configuration file. Keys absent from the file keep their defaults.
std::expected<SessionConfig, std::string> load_config(const std::filesystem::path& path);
std::expected<SessionConfig, std::string> parse_config(const std::string& text,
                                                       SessionConfig base = {});

std::expected<void, std::string> validate(const SessionConfig& cfg);

// Splits "LOCAL:REMOTE" at the first colon.
std::expected<TransferJob, std::string> parse_job(std::string_view spec);

}  // namespace sigmaxfer

#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace Config {
    constexpr std::string_view APP_NAME = "sigmaxfer";
    constexpr std::string_view APP_VERSION = "1.2.0";
    constexpr std::string_view LOGGER_NAME = "sigmaxfer";
    constexpr std::string_view LOG_FILENAME = "sigmaxfer.log";

    constexpr std::size_t HASH_BLOCK_SIZE = 8192;
    constexpr std::size_t SHA256_HEX_LENGTH = 64;
    constexpr std::size_t MAX_COMMAND_OUTPUT = 1024 * 1024;
    constexpr std::string_view REMOTE_DIGEST_COMMAND = "sha256sum";

    constexpr int SSH_DEFAULT_PORT = 22;
    constexpr long SOCKET_TIMEOUT_SEC = 15;
    constexpr long CONNECT_TIMEOUT_SEC = 10;

    constexpr int DEFAULT_RETRIES = 3;
    constexpr unsigned BACKOFF_BASE = 2;
    constexpr std::chrono::seconds BACKOFF_UNIT{1};

    constexpr double DEFAULT_USL_MBPS = 100.0;
    constexpr double DEFAULT_LSL_MBPS = 10.0;
    constexpr double DEFAULT_DEFECT_THRESHOLD_MBPS = 10.0;
    constexpr double SIGMA_LONG_TERM_SHIFT = 1.5;
    constexpr double CONTROL_LIMIT_SIGMAS = 3.0;
    constexpr std::size_t MIN_SPC_SAMPLES = 2;

    constexpr std::size_t TERM_WIDTH = 78;
    constexpr int APP_INFO_LABEL_WIDTH = 20;
    constexpr int CHART_BAR_WIDTH = 40;
    constexpr int REPORT_JSON_INDENT = 2;
}

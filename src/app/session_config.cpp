#include "include/session_config.hpp"

#include <format>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "include/utils.hpp"

using json = nlohmann::json;

namespace sigmaxfer {

ChannelOptions SessionConfig::channel_options() const {
    ChannelOptions options;
    options.host = host;
    options.port = port;
    options.username = username;
    options.key_path = key_path;
    options.bandwidth_limit_kbps = bandwidth_limit_kbps;
    options.socket_timeout = std::chrono::seconds(socket_timeout_sec);
    options.known_hosts = known_hosts;
    return options;
}

std::expected<SessionConfig, std::string> parse_config(const std::string& text, SessionConfig base) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return std::unexpected(std::format("Malformed configuration: {}", e.what()));
    }

    if (!j.is_object()) {
        return std::unexpected("Configuration must be a JSON object");
    }

    SessionConfig cfg = std::move(base);
    try {
        cfg.host = j.value("host", cfg.host);
        cfg.port = j.value("port", cfg.port);
        cfg.username = j.value("username", cfg.username);
        cfg.key_path = j.value("key_path", cfg.key_path.string());
        cfg.known_hosts = j.value("known_hosts", cfg.known_hosts.string());
        cfg.socket_timeout_sec = j.value("socket_timeout", cfg.socket_timeout_sec);

        if (j.contains("bandwidth_limit")) {
            if (j["bandwidth_limit"].is_null()) {
                cfg.bandwidth_limit_kbps.reset();
            } else {
                cfg.bandwidth_limit_kbps = j["bandwidth_limit"].get<long>();
            }
        }

        cfg.retries = j.value("retries", cfg.retries);
        cfg.verify = j.value("verify", cfg.verify);
        cfg.limits.usl = j.value("usl", cfg.limits.usl);
        cfg.limits.lsl = j.value("lsl", cfg.limits.lsl);
        cfg.limits.defect_threshold = j.value("defect_threshold", cfg.limits.defect_threshold);

        cfg.report_path = j.value("report_path", cfg.report_path.string());
        cfg.chart = j.value("chart", cfg.chart);
        cfg.log_file = j.value("log_file", cfg.log_file.string());

        if (j.contains("log_level")) {
            std::string level_text = j["log_level"].get<std::string>();
            auto level = parse_level(level_text);
            if (!level) {
                return std::unexpected(std::format("Unknown log level '{}'", level_text));
            }
            cfg.log_level = *level;
        }

        if (j.contains("files")) {
            const auto& files = j["files"];
            if (!files.is_array()) {
                return std::unexpected("'files' must be an array");
            }
            for (const auto& f : files) {
                cfg.files.push_back(TransferJob{f.at("local").get<std::string>(),
                                                f.at("remote").get<std::string>()});
            }
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::format("Invalid configuration value: {}", e.what()));
    }

    return cfg;
}

std::expected<SessionConfig, std::string> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(std::format("Cannot read configuration '{}'", path.string()));
    }

    std::stringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str());
}

std::expected<void, std::string> validate(const SessionConfig& cfg) {
    if (trim_sv(cfg.host).empty()) return std::unexpected("host is required");
    if (trim_sv(cfg.username).empty()) return std::unexpected("username is required");
    if (cfg.key_path.empty()) return std::unexpected("key_path is required");
    if (cfg.port < 1 || cfg.port > 65535) {
        return std::unexpected(std::format("port {} is out of range", cfg.port));
    }
    if (cfg.retries < 1) {
        return std::unexpected(std::format("retries must be >= 1 (got {})", cfg.retries));
    }
    if (cfg.socket_timeout_sec < 1) {
        return std::unexpected("socket_timeout must be >= 1 second");
    }
    if (cfg.bandwidth_limit_kbps && *cfg.bandwidth_limit_kbps <= 0) {
        return std::unexpected("bandwidth_limit must be positive");
    }
    if (!(cfg.limits.usl > cfg.limits.lsl)) {
        return std::unexpected(
            std::format("usl ({}) must be greater than lsl ({})", cfg.limits.usl, cfg.limits.lsl));
    }
    for (const auto& job : cfg.files) {
        if (job.local.empty() || job.remote.empty()) {
            return std::unexpected("every file needs a local and a remote path");
        }
    }
    return {};
}

std::expected<TransferJob, std::string> parse_job(std::string_view spec) {
    auto colon = spec.find(':');
    if (colon == std::string_view::npos) {
        return std::unexpected(std::format("Expected LOCAL:REMOTE, got '{}'", spec));
    }

    std::string_view local = spec.substr(0, colon);
    std::string_view remote = spec.substr(colon + 1);
    if (local.empty() || remote.empty()) {
        return std::unexpected(std::format("Expected LOCAL:REMOTE, got '{}'", spec));
    }
    return TransferJob{std::filesystem::path(local), std::string(remote)};
}

}  // namespace sigmaxfer

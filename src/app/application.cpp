/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/application.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <memory>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "include/cli_renderer.hpp"
#include "include/color.hpp"
#include "include/config.hpp"
#include "include/interrupts.hpp"
#include "include/logger.hpp"
#include "include/report_writer.hpp"
#include "include/scp_channel.hpp"
#include "include/session_config.hpp"
#include "include/transfer_session.hpp"
#include "include/utils.hpp"

namespace fs = std::filesystem;
using namespace std::chrono;

namespace sigmaxfer {

namespace {

constexpr int EXIT_ALL_OK = 0;
constexpr int EXIT_FATAL = 1;
constexpr int EXIT_PARTIAL = 2;

template <typename T>
std::expected<T, std::string> parse_option_number(std::string_view option, std::string_view value) {
    auto parsed = parse_number<T>(value);
    if (!parsed) {
        return std::unexpected(std::format("Invalid value '{}' for {}", value, option));
    }
    return *parsed;
}

}  // namespace

std::expected<CommandLine, std::string> parse_command_line(const std::vector<std::string>& args) {
    CommandLine cli;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto next_value = [&]() -> std::expected<std::string, std::string> {
            if (i + 1 >= args.size()) {
                return std::unexpected(std::format("Option '{}' requires a value", arg));
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            cli.help = true;
        } else if (arg == "-v" || arg == "--version") {
            cli.version = true;
        } else if (arg == "--no-verify") {
            cli.no_verify = true;
        } else if (arg == "--no-chart") {
            cli.no_chart = true;
        } else if (arg == "--verbose") {
            cli.verbose = true;
        } else if (arg == "-c" || arg == "--config" || arg == "--host" || arg == "--user" ||
                   arg == "--key" || arg == "--report" || arg == "--log-file") {
            auto value = next_value();
            if (!value) return std::unexpected(value.error());

            if (arg == "-c" || arg == "--config") {
                cli.config_path = *value;
            } else if (arg == "--host") {
                cli.host = *value;
            } else if (arg == "--user") {
                cli.username = *value;
            } else if (arg == "--key") {
                cli.key_path = *value;
            } else if (arg == "--report") {
                cli.report_path = *value;
            } else {
                cli.log_file = *value;
            }
        } else if (arg == "--port" || arg == "--retries") {
            auto value = next_value();
            if (!value) return std::unexpected(value.error());
            auto number = parse_option_number<int>(arg, *value);
            if (!number) return std::unexpected(number.error());
            (arg == "--port" ? cli.port : cli.retries) = *number;
        } else if (arg == "--bwlimit") {
            auto value = next_value();
            if (!value) return std::unexpected(value.error());
            auto number = parse_option_number<long>(arg, *value);
            if (!number) return std::unexpected(number.error());
            cli.bandwidth_limit_kbps = *number;
        } else if (arg.starts_with("-")) {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        } else {
            auto job = parse_job(arg);
            if (!job) return std::unexpected(job.error());
            cli.jobs.push_back(std::move(*job));
        }
    }
    return cli;
}

void apply_overrides(const CommandLine& cli, SessionConfig& cfg) {
    if (cli.host) cfg.host = *cli.host;
    if (cli.port) cfg.port = *cli.port;
    if (cli.username) cfg.username = *cli.username;
    if (cli.key_path) cfg.key_path = *cli.key_path;
    if (cli.bandwidth_limit_kbps) cfg.bandwidth_limit_kbps = cli.bandwidth_limit_kbps;
    if (cli.retries) cfg.retries = *cli.retries;
    if (cli.report_path) cfg.report_path = *cli.report_path;
    if (cli.log_file) cfg.log_file = *cli.log_file;
    if (cli.no_verify) cfg.verify = false;
    if (cli.no_chart) cfg.chart = false;
    if (cli.verbose) cfg.log_level = LogLevel::Debug;

    cfg.files.insert(cfg.files.end(), cli.jobs.begin(), cli.jobs.end());
}

}  // namespace sigmaxfer

using namespace sigmaxfer;

void Application::show_help(const std::string& app_name) const {
    std::println("Usage: {} [options] [LOCAL:REMOTE ...]", app_name);
    std::println("");
    std::println("Options:");
    std::println("  -c, --config FILE       Read settings from a JSON file");
    std::println("      --host HOST         Remote host");
    std::println("      --port PORT         SSH port (default {})", Config::SSH_DEFAULT_PORT);
    std::println("      --user NAME         Remote user");
    std::println("      --key FILE          Private key for public key authentication");
    std::println("      --bwlimit KBPS      Upload rate ceiling in KiB/s");
    std::println("      --retries N         Attempts per file (default {})", Config::DEFAULT_RETRIES);
    std::println("      --no-verify         Skip the remote checksum comparison");
    std::println("      --report FILE       Write the quality report (.gz for gzip)");
    std::println("      --no-chart          Do not print the control chart");
    std::println("      --log-file FILE     Log file (default {})", Config::LOG_FILENAME);
    std::println("      --verbose           Log debug messages");
    std::println("  -h, --help              Show this help message");
    std::println("  -v, --version           Show version information");
    std::println("");
    std::println("Examples:");
    std::println("  {} -c transfer.json", app_name);
    std::println("  {} --host example.org --user deploy --key ~/.ssh/id_ed25519 data.bin:/srv/data.bin",
                 app_name);
}

void Application::show_version() const {
    std::println("{} v{}", Config::APP_NAME, Config::APP_VERSION);
    std::println("Copyright (c) 2025 Alfie Ardinata");
    std::println("Licensed under the Mozilla Public License 2.0");
}

int Application::run(int argc, char* argv[]) {
    std::string app_name{Config::APP_NAME};
    if (argc > 0) {
        app_name = fs::path(argv[0]).filename().string();
        if (app_name.empty())
            app_name = Config::APP_NAME;
    }

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    auto cli = parse_command_line(args);
    if (!cli) {
        std::println(stderr, "{}Error: {}{}", Color::RED, cli.error(), Color::RESET);
        show_help(app_name);
        return EXIT_FATAL;
    }
    if (cli->help) {
        show_help(app_name);
        return EXIT_ALL_OK;
    }
    if (cli->version) {
        show_version();
        return EXIT_ALL_OK;
    }

    try {
        SignalGuard signal_guard;

        SessionConfig cfg;
        if (cli->config_path) {
            auto loaded = load_config(*cli->config_path);
            if (!loaded) {
                throw std::runtime_error(loaded.error());
            }
            cfg = std::move(*loaded);
        }
        apply_overrides(*cli, cfg);

        if (auto valid = validate(cfg); !valid) {
            throw std::runtime_error(std::format("Invalid configuration: {}", valid.error()));
        }
        if (cfg.files.empty()) {
            throw std::runtime_error("No files to transfer");
        }

        Logger logger(std::string(Config::LOGGER_NAME), cfg.log_level);
        logger.add_console_sink(Color::enabled(stderr));
        if (!cfg.log_file.empty()) {
            if (auto sink = logger.add_file_sink(cfg.log_file); !sink) {
                logger.warning("Logging to console only: {}", sink.error());
            }
        }

        auto start_time = steady_clock::now();

        print_centered_header(
            std::format("SigmaXfer - Verified Transfers with SPC (v{})", Config::APP_VERSION));
        std::println(" {:<{}} : {}",
                     "Remote",
                     Config::APP_INFO_LABEL_WIDTH,
                     Color::colorize(std::format("{}@{}:{}", cfg.username, cfg.host, cfg.port),
                                     Color::CYAN,
                                     Color::enabled()));
        std::println(" {:<{}} : {}", "Files", Config::APP_INFO_LABEL_WIDTH, cfg.files.size());
        std::println(" {:<{}} : {} per file, checksum {}",
                     "Attempts",
                     Config::APP_INFO_LABEL_WIDTH,
                     cfg.retries,
                     cfg.verify ? "on" : "off");
        if (cfg.bandwidth_limit_kbps) {
            std::println(" {:<{}} : {} KiB/s",
                         "Rate Ceiling",
                         Config::APP_INFO_LABEL_WIDTH,
                         *cfg.bandwidth_limit_kbps);
        }
        print_line();

        const ChannelOptions options = cfg.channel_options();
        TransferSession session(
            [&options]() -> std::unique_ptr<SecureChannel> { return ScpChannel::open(options); },
            logger);

        auto outcomes = session.run(
            cfg.files,
            cfg.verify,
            cfg.retries,
            [&session](const TransferOutcome& outcome) {
                const TransferRecord* record =
                    outcome.success && !session.records().empty() ? &session.records().back()
                                                                  : nullptr;
                CliRenderer::render_transfer_result(outcome, record);
            },
            [] { return g_interrupted.load(); });
        session.close();

        print_line();

        auto report = session.report(cfg.limits);
        CliRenderer::render_quality_stats(report);
        if (cfg.chart && report.control_chart) {
            std::println("");
            CliRenderer::render_control_chart(*report.control_chart);
        }

        if (!cfg.report_path.empty()) {
            if (auto written = ReportWriter::write(report, cfg.report_path); !written) {
                throw std::runtime_error(written.error());
            }
            logger.info("Report written to {}", cfg.report_path.string());
        }

        print_line();
        double elapsed_sec = duration<double>(steady_clock::now() - start_time).count();
        std::println(" Finished in        : {:.0f} sec", elapsed_sec);

        auto failed = static_cast<std::size_t>(
            std::ranges::count_if(outcomes, [](const auto& o) { return !o.success; }));
        auto skipped = cfg.files.size() - outcomes.size();
        if (failed == 0 && skipped == 0) {
            return EXIT_ALL_OK;
        }
        logger.warning("{} failed, {} skipped of {} files", failed, skipped, cfg.files.size());
        return EXIT_PARTIAL;

    } catch (const std::exception& e) {
        std::println(stderr, "\n{}Fatal Error: {}{}", Color::RED, e.what(), Color::RESET);
        return EXIT_FATAL;
    }
}

#include "include/logger.hpp"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <memory>
#include <print>
#include <system_error>

#include "include/color.hpp"
#include "include/utils.hpp"

namespace sigmaxfer {

std::string_view level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Critical:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_level(std::string_view text) {
    const std::string lower = to_lower(trim_sv(text));
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    return std::nullopt;
}

Logger::Logger(std::string name, LogLevel min_level)
    : name_(std::move(name)), min_level_(min_level) {}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

bool Logger::enabled(LogLevel level) const {
    return level >= this->level();
}

void Logger::add_console_sink(bool use_color) {
    add_sink([use_color](LogLevel level, std::string_view line) {
        std::string_view color;
        if (level >= LogLevel::Error) {
            color = Color::RED;
        } else if (level == LogLevel::Warning) {
            color = Color::YELLOW;
        }

        if (use_color && !color.empty()) {
            std::println(stderr, "{}", Color::colorize(line, color));
        } else {
            std::println(stderr, "{}", line);
        }
    });
}

std::expected<void, std::string> Logger::add_file_sink(const std::filesystem::path& path) {
    auto out = std::make_shared<std::ofstream>(path, std::ios::app);
    if (!*out) {
        return std::unexpected(std::format("Cannot open log file '{}': {}",
                                           path.string(),
                                           std::system_category().message(errno)));
    }

    add_sink([out](LogLevel, std::string_view line) {
        *out << line << '\n';
        out->flush();
    });
    return {};
}

void Logger::add_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

std::string Logger::format_line(LogLevel level, std::string_view message) const {
    return std::format("{} - {} - {} - {}",
                       format_timestamp(std::chrono::system_clock::now()),
                       name_,
                       level_name(level),
                       message);
}

void Logger::log(LogLevel level, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) return;

    const std::string line = format_line(level, message);
    for (const auto& sink : sinks_) {
        sink(level, line);
    }
}

}  // namespace sigmaxfer

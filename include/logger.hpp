#pragma once

#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sigmaxfer {

enum class LogLevel { Debug, Info, Warning, Error, Critical };

std::string_view level_name(LogLevel level) noexcept;
std::optional<LogLevel> parse_level(std::string_view text);

// Leveled logger handed to components explicitly. Each line reads
// "YYYY-mm-dd HH:MM:SS - <name> - <LEVEL> - <message>".
class Logger {
   public:
    using Sink = std::function<void(LogLevel, std::string_view)>;

    explicit Logger(std::string name, LogLevel min_level = LogLevel::Info);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    void add_console_sink(bool use_color);
    std::expected<void, std::string> add_file_sink(const std::filesystem::path& path);
    void add_sink(Sink sink);

    void log(LogLevel level, std::string_view message);

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        write(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        write(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warning(std::format_string<Args...> fmt, Args&&... args) {
        write(LogLevel::Warning, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        write(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(std::format_string<Args...> fmt, Args&&... args) {
        write(LogLevel::Critical, fmt, std::forward<Args>(args)...);
    }

   private:
    template <typename... Args>
    void write(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (!enabled(level)) return;
        log(level, std::format(fmt, std::forward<Args>(args)...));
    }

    bool enabled(LogLevel level) const;
    std::string format_line(LogLevel level, std::string_view message) const;

    std::string name_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
    std::vector<Sink> sinks_;
};

}  // namespace sigmaxfer

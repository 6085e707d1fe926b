#ifndef LANFLOW_BASE_LOGGER_H
#define LANFLOW_BASE_LOGGER_H

#include <elio/log/logger.hpp>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace lanflow {

// Alias for Elio's log level
using LogLevel = elio::log::level;

enum class LogOutput {
    Stdout,
    Stderr,
    File
};

// Parse "debug" / "info" / "warning" / "error" (case-insensitive), info otherwise
LogLevel parse_log_level(const std::string& level);

class Logger {
public:
    ~Logger();

    static Logger& instance();

    // Level control
    void set_level(LogLevel level);
    LogLevel get_level() const;

    // Output configuration
    void set_output(LogOutput output);
    bool set_file_output(const std::string& path);
    void close_file_output();

    void log(LogLevel level, const std::string& message);

    template<typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(level)) return;
        write(level, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::debug, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::info, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warning(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::warning, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::error, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::error, fmt_str, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool enabled(LogLevel level) const;
    void write(LogLevel level, const std::string& message);
    void close_file_output_locked();

    elio::log::logger& logger_ = elio::log::logger::instance();
    LogLevel level_ = elio::log::level::info;
    LogOutput output_ = LogOutput::Stdout;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;
};

} // namespace lanflow

#endif // LANFLOW_BASE_LOGGER_H

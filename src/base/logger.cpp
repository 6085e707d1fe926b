#include "lanflow/base/logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace lanflow {

namespace {

const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info: return "INFO";
        case LogLevel::warning: return "WARN";
        case LogLevel::error: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return elio::log::level::debug;
    if (lower == "info") return elio::log::level::info;
    if (lower == "warning" || lower == "warn") return elio::log::level::warning;
    if (lower == "error") return elio::log::level::error;
    return elio::log::level::info;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_file_output_locked();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_output(LogOutput output) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_ = output;
}

bool Logger::set_file_output(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    close_file_output_locked();
    file_stream_ = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::fprintf(stderr, "Failed to open log file: %s\n", path.c_str());
        file_stream_.reset();
        return false;
    }
    output_ = LogOutput::File;
    return true;
}

void Logger::close_file_output() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_file_output_locked();
    if (output_ == LogOutput::File) {
        output_ = LogOutput::Stdout;
    }
}

void Logger::close_file_output_locked() {
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;
    write(level, message);
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (output_) {
        case LogOutput::Stdout:
            logger_.log(level, "", 0, "{}", message);
            break;
        case LogOutput::Stderr:
            fmt::print(stderr, "[{}] [{}] {}\n", get_timestamp(), level_to_string(level), message);
            break;
        case LogOutput::File:
            if (file_stream_ && file_stream_->is_open()) {
                *file_stream_ << fmt::format("[{}] [{}] {}", get_timestamp(), level_to_string(level), message)
                              << std::endl;
            }
            break;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::debug, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::info, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::warning, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::error, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::error, message);
}

} // namespace lanflow

#include "lanflow/base/config.h"
#include "lanflow/base/logger.h"
#include "CLI/CLI.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace lanflow {

namespace {

using Section = std::map<std::string, std::string>;
using Sections = std::map<std::string, Section>;

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// Simple INI-style parser for config files
bool parse_ini_file(const std::string& path, Sections& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section];
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
    return true;
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

void set_if(const Section& s, const char* key, std::string& out) {
    auto it = s.find(key);
    if (it != s.end()) out = it->second;
}

void set_if(const Section& s, const char* key, uint32_t& out) {
    auto it = s.find(key);
    if (it != s.end()) out = static_cast<uint32_t>(std::stoul(it->second));
}

void set_if(const Section& s, const char* key, uint64_t& out) {
    auto it = s.find(key);
    if (it != s.end()) out = std::stoull(it->second);
}

void set_if(const Section& s, const char* key, double& out) {
    auto it = s.find(key);
    if (it != s.end()) out = std::stod(it->second);
}

void set_if(const Section& s, const char* key, bool& out) {
    auto it = s.find(key);
    if (it != s.end()) out = parse_bool(it->second);
}

} // anonymous namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    config_ = GlobalConfig{};
    config_file_.clear();
    exit_code_ = 0;
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    Sections sections;
    if (!parse_ini_file(path, sections)) {
        Logger::instance().error("Failed to read config file: " + path);
        return false;
    }

    try {
        apply_sections(sections);
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in config file {}: {}", path, e.what());
        return false;
    }

    config_file_ = path;
    Logger::instance().info("Config loaded successfully from: " + path);
    return true;
}

void Config::apply_sections(const Sections& sections) {
    if (auto it = sections.find("log"); it != sections.end()) {
        const auto& s = it->second;
        set_if(s, "level", config_.log.level);
        set_if(s, "output", config_.log.output);
        set_if(s, "file_path", config_.log.file_path);
        Logger::instance().set_level(parse_log_level(config_.log.level));
    }

    if (auto it = sections.find("sampler"); it != sections.end()) {
        const auto& s = it->second;
        set_if(s, "sample_size", config_.sampler.sample_size);
        set_if(s, "default_estimate_mbps", config_.sampler.default_estimate_mbps);
    }

    if (auto it = sections.find("concurrency"); it != sections.end()) {
        const auto& s = it->second;
        set_if(s, "fast_threshold_mbps", config_.concurrency.fast_threshold_mbps);
        set_if(s, "medium_threshold_mbps", config_.concurrency.medium_threshold_mbps);
        set_if(s, "fast_concurrency", config_.concurrency.fast_concurrency);
        set_if(s, "medium_concurrency", config_.concurrency.medium_concurrency);
        set_if(s, "slow_concurrency", config_.concurrency.slow_concurrency);
        set_if(s, "low_end_cap", config_.concurrency.low_end_cap);
        set_if(s, "low_memory_mb", config_.concurrency.low_memory_mb);
        set_if(s, "max_concurrency", config_.concurrency.max_concurrency);
    }

    if (auto it = sections.find("device"); it != sections.end()) {
        const auto& s = it->second;
        set_if(s, "probe", config_.device.probe);
        set_if(s, "low_end", config_.device.low_end);
        set_if(s, "memory_mb", config_.device.memory_mb);
    }

    if (auto it = sections.find("scheduler"); it != sections.end()) {
        const auto& s = it->second;
        set_if(s, "max_retries", config_.scheduler.max_retries);
        set_if(s, "adaptation_interval", config_.scheduler.adaptation_interval);
    }

    if (auto it = sections.find("watchdog"); it != sections.end()) {
        const auto& s = it->second;
        set_if(s, "interval_ms", config_.watchdog.interval_ms);
        set_if(s, "stall_threshold_ms", config_.watchdog.stall_threshold_ms);
        set_if(s, "max_stall_polls", config_.watchdog.max_stall_polls);
    }

    if (auto it = sections.find("chunk"); it != sections.end()) {
        const auto& s = it->second;
        set_if(s, "small_item_bytes", config_.chunk.small_item_bytes);
        set_if(s, "large_item_bytes", config_.chunk.large_item_bytes);
        set_if(s, "small_chunk_bytes", config_.chunk.small_chunk_bytes);
        set_if(s, "medium_chunk_bytes", config_.chunk.medium_chunk_bytes);
        set_if(s, "large_chunk_bytes", config_.chunk.large_chunk_bytes);
        set_if(s, "max_inflight_per_source", config_.chunk.max_inflight_per_source);
        set_if(s, "endgame_threshold", config_.chunk.endgame_threshold);
        set_if(s, "endgame_max_sources", config_.chunk.endgame_max_sources);
    }

    if (auto it = sections.find("source"); it != sections.end()) {
        const auto& s = it->second;
        set_if(s, "reliability_alpha", config_.source.reliability_alpha);
        set_if(s, "bandwidth_alpha", config_.source.bandwidth_alpha);
        set_if(s, "initial_reliability", config_.source.initial_reliability);
        set_if(s, "stale_timeout_sec", config_.source.stale_timeout_sec);
        set_if(s, "max_consecutive_failures", config_.source.max_consecutive_failures);
    }

    if (auto it = sections.find("simulation"); it != sections.end()) {
        const auto& s = it->second;
        set_if(s, "link_mbps", config_.simulation.link_mbps);
        set_if(s, "per_transfer_mbps", config_.simulation.per_transfer_mbps);
        set_if(s, "failure_rate", config_.simulation.failure_rate);
        set_if(s, "stall_rate", config_.simulation.stall_rate);
        set_if(s, "tick_ms", config_.simulation.tick_ms);
        set_if(s, "peers", config_.simulation.peers);
        set_if(s, "demo_count", config_.simulation.demo_count);
        set_if(s, "demo_size_mb", config_.simulation.demo_size_mb);
        set_if(s, "state_file", config_.simulation.state_file);
    }
}

bool Config::load_from_env() {
    Logger::instance().debug("Loading config from environment variables");

    try {
        override_from_env();
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in environment: {}", e.what());
        return false;
    }
    return true;
}

void Config::override_from_env() {
    if (const char* val = std::getenv("LANFLOW_LOG_LEVEL")) {
        config_.log.level = val;
        Logger::instance().set_level(parse_log_level(config_.log.level));
    }
    if (const char* val = std::getenv("LANFLOW_LOG_FILE")) {
        config_.log.file_path = val;
        config_.log.output = "file";
    }

    if (const char* val = std::getenv("LANFLOW_MAX_CONCURRENCY")) {
        config_.concurrency.max_concurrency = static_cast<uint32_t>(std::stoul(val));
    }
    if (const char* val = std::getenv("LANFLOW_MAX_RETRIES")) {
        config_.scheduler.max_retries = static_cast<uint32_t>(std::stoul(val));
    }

    if (const char* val = std::getenv("LANFLOW_DEVICE_PROBE")) {
        config_.device.probe = val;
    }
    if (const char* val = std::getenv("LANFLOW_LOW_END_DEVICE")) {
        config_.device.low_end = parse_bool(val);
    }

    if (const char* val = std::getenv("LANFLOW_STALL_THRESHOLD_MS")) {
        config_.watchdog.stall_threshold_ms = static_cast<uint32_t>(std::stoul(val));
    }
    if (const char* val = std::getenv("LANFLOW_STATE_FILE")) {
        config_.simulation.state_file = val;
    }
}

bool Config::parse_command_line(int argc, char* argv[]) {
    CLI::App app{"lanflow - adaptive concurrent transfer scheduler"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Sampler / concurrency options
    app.add_option("--sample-size", config_.sampler.sample_size, "Speed samples kept in the rolling window");
    app.add_option("--fast-threshold", config_.concurrency.fast_threshold_mbps, "Fast tier threshold (MB/s)");
    app.add_option("--medium-threshold", config_.concurrency.medium_threshold_mbps, "Medium tier threshold (MB/s)");
    app.add_option("--fast-concurrency", config_.concurrency.fast_concurrency, "Parallel transfers on a fast network");
    app.add_option("--medium-concurrency", config_.concurrency.medium_concurrency, "Parallel transfers on a medium network");
    app.add_option("--slow-concurrency", config_.concurrency.slow_concurrency, "Parallel transfers on a slow network");
    app.add_option("--max-concurrency", config_.concurrency.max_concurrency, "Global cap on parallel transfers");

    // Device options
    app.add_option("--device-probe", config_.device.probe, "Device probe (system, static)");
    app.add_flag("--low-end", config_.device.low_end, "Treat the device as low-end (static probe)");
    app.add_option("--device-memory", config_.device.memory_mb, "Available memory in MB (static probe)");

    // Scheduler / watchdog options
    app.add_option("--max-retries", config_.scheduler.max_retries, "Attempts before an item fails for good");
    app.add_option("--adaptation-interval", config_.scheduler.adaptation_interval, "Completed transfers between concurrency re-evaluations");
    app.add_option("--watchdog-interval", config_.watchdog.interval_ms, "Watchdog scan interval (ms)");
    app.add_option("--stall-threshold", config_.watchdog.stall_threshold_ms, "No-progress time before a transfer is stalled (ms)");
    app.add_option("--max-stall-polls", config_.watchdog.max_stall_polls, "Forced re-polls before a stalled transfer fails");

    // Chunk / source options
    app.add_option("--endgame-threshold", config_.chunk.endgame_threshold, "Remaining chunks that trigger endgame (0 disables)");
    app.add_option("--max-inflight-per-source", config_.chunk.max_inflight_per_source, "Chunks checked out to one source at a time");
    app.add_option("--reliability-alpha", config_.source.reliability_alpha, "Reliability decay factor (0-1]");
    app.add_option("--source-timeout", config_.source.stale_timeout_sec, "Seconds without updates before a source is evicted");

    // Simulation options
    app.add_option("--link-mbps", config_.simulation.link_mbps, "Simulated link bandwidth (MB/s)");
    app.add_option("--per-transfer-mbps", config_.simulation.per_transfer_mbps, "Simulated per-transfer cap (MB/s)");
    app.add_option("--failure-rate", config_.simulation.failure_rate, "Simulated failure probability per tick");
    app.add_option("--stall-rate", config_.simulation.stall_rate, "Simulated stall probability per tick");
    app.add_option("--peers", config_.simulation.peers, "Simulated peers (enables multi-source mode)");
    app.add_option("--demo-count", config_.simulation.demo_count, "Queue N synthetic items");
    app.add_option("--demo-size", config_.simulation.demo_size_mb, "Size of synthetic items (MB)");
    app.add_option("--state-file", config_.simulation.state_file, "Save/restore scheduler state here");
    app.add_option("files", config_.simulation.files, "Files to queue");

    app.set_version_flag("-v,--version", "0.1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help and version requests print here and exit with code 0
        exit_code_ = app.exit(e);
        return false;
    }

    if (!config_file.empty() && !load_from_file(config_file)) {
        std::cerr << "Failed to load config file: " << config_file << std::endl;
        exit_code_ = 1;
        return false;
    }

    if (!config_.log.level.empty()) {
        Logger::instance().set_level(parse_log_level(config_.log.level));
    }
    if (config_.log.output == "stderr") {
        Logger::instance().set_output(LogOutput::Stderr);
    } else if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        Logger::instance().set_file_output(config_.log.file_path);
    }

    return true;
}

bool Config::validate() const {
    bool ok = true;
    const auto& c = config_;

    if (c.sampler.sample_size == 0) {
        Logger::instance().error("sampler.sample_size must be > 0");
        ok = false;
    }
    if (c.concurrency.medium_threshold_mbps > c.concurrency.fast_threshold_mbps) {
        Logger::instance().error("concurrency.medium_threshold_mbps must not exceed fast_threshold_mbps");
        ok = false;
    }
    if (c.concurrency.max_concurrency == 0 || c.concurrency.low_end_cap == 0) {
        Logger::instance().error("concurrency.max_concurrency and low_end_cap must be > 0");
        ok = false;
    }
    if (c.device.probe != "system" && c.device.probe != "static") {
        Logger::instance().error("device.probe must be 'system' or 'static'");
        ok = false;
    }
    if (c.watchdog.stall_threshold_ms == 0) {
        Logger::instance().error("watchdog.stall_threshold_ms must be > 0");
        ok = false;
    }
    if (c.chunk.small_chunk_bytes == 0 ||
        c.chunk.small_chunk_bytes > c.chunk.medium_chunk_bytes ||
        c.chunk.medium_chunk_bytes > c.chunk.large_chunk_bytes ||
        c.chunk.small_item_bytes > c.chunk.large_item_bytes) {
        Logger::instance().error("chunk size tiers must be non-zero and non-decreasing");
        ok = false;
    }
    if (c.chunk.max_inflight_per_source == 0 || c.chunk.endgame_max_sources == 0) {
        Logger::instance().error("chunk.max_inflight_per_source and endgame_max_sources must be > 0");
        ok = false;
    }
    if (c.source.reliability_alpha <= 0.0 || c.source.reliability_alpha > 1.0 ||
        c.source.bandwidth_alpha <= 0.0 || c.source.bandwidth_alpha > 1.0) {
        Logger::instance().error("source alphas must be in (0, 1]");
        ok = false;
    }
    if (c.source.initial_reliability < 0.0 || c.source.initial_reliability > 1.0) {
        Logger::instance().error("source.initial_reliability must be in [0, 1]");
        ok = false;
    }
    return ok;
}

void Config::print() const {
    const auto& c = config_;
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Log Level: " + c.log.level);
    Logger::instance().info("Speed tiers: fast > {} MB/s -> {}, medium > {} MB/s -> {}, slow -> {}",
                            c.concurrency.fast_threshold_mbps, c.concurrency.fast_concurrency,
                            c.concurrency.medium_threshold_mbps, c.concurrency.medium_concurrency,
                            c.concurrency.slow_concurrency);
    Logger::instance().info("Max concurrency: {} (low-end cap {})", c.concurrency.max_concurrency,
                            c.concurrency.low_end_cap);
    Logger::instance().info("Device probe: " + c.device.probe);
    Logger::instance().info("Retries: {}, adaptation every {} transfers", c.scheduler.max_retries,
                            c.scheduler.adaptation_interval);
    Logger::instance().info("Watchdog: every {} ms, stall after {} ms, fail after {} polls",
                            c.watchdog.interval_ms, c.watchdog.stall_threshold_ms, c.watchdog.max_stall_polls);
    Logger::instance().info("Endgame threshold: {} chunks", c.chunk.endgame_threshold);
}

} // namespace lanflow

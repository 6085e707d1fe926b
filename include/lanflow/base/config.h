#ifndef LANFLOW_BASE_CONFIG_H
#define LANFLOW_BASE_CONFIG_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace lanflow {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, stderr, file
    std::string file_path = "";
};

// Rolling speed window
struct SamplerConfig {
    uint32_t sample_size = 10;
    double default_estimate_mbps = 7.5;  // lands in the medium tier
};

// Speed tiers -> number of parallel transfers
struct ConcurrencyConfig {
    double fast_threshold_mbps = 10.0;    // > fast threshold: fast tier
    double medium_threshold_mbps = 5.0;   // > medium threshold: medium tier, else slow
    uint32_t fast_concurrency = 6;
    uint32_t medium_concurrency = 4;
    uint32_t slow_concurrency = 2;
    uint32_t low_end_cap = 2;
    uint64_t low_memory_mb = 4096;
    uint32_t max_concurrency = 8;
};

// Device capability source
struct DeviceConfig {
    std::string probe = "system";  // system, static
    bool low_end = false;          // static probe only
    uint64_t memory_mb = 8192;     // static probe only
};

struct SchedulerConfig {
    uint32_t max_retries = 3;
    uint32_t adaptation_interval = 3;  // completed transfers between controller polls
};

struct WatchdogConfig {
    uint32_t interval_ms = 300;         // 0 = manual ticks
    uint32_t stall_threshold_ms = 800;
    uint32_t max_stall_polls = 100;
};

// Multi-source chunking
struct ChunkConfig {
    uint64_t small_item_bytes = 10ULL * 1024 * 1024;
    uint64_t large_item_bytes = 100ULL * 1024 * 1024;
    uint64_t small_chunk_bytes = 1ULL * 1024 * 1024;
    uint64_t medium_chunk_bytes = 8ULL * 1024 * 1024;
    uint64_t large_chunk_bytes = 32ULL * 1024 * 1024;
    uint32_t max_inflight_per_source = 2;
    uint32_t endgame_threshold = 3;     // remaining chunks that trigger endgame, 0 disables
    uint32_t endgame_max_sources = 2;   // concurrent sources per chunk during endgame
};

struct SourceConfig {
    double reliability_alpha = 0.3;
    double bandwidth_alpha = 0.3;
    double initial_reliability = 1.0;
    uint32_t stale_timeout_sec = 30;
    uint32_t max_consecutive_failures = 5;
};

// Demo driver (lanflow executable)
struct SimulationConfig {
    double link_mbps = 40.0;
    double per_transfer_mbps = 12.0;
    double failure_rate = 0.0;   // per tick probability
    double stall_rate = 0.0;     // per tick probability
    uint32_t tick_ms = 50;
    uint32_t peers = 0;          // > 0 enables multi-source mode
    uint32_t demo_count = 0;
    uint64_t demo_size_mb = 16;
    std::string state_file;
    std::vector<std::string> files;
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    SamplerConfig sampler;
    ConcurrencyConfig concurrency;
    DeviceConfig device;
    SchedulerConfig scheduler;
    WatchdogConfig watchdog;
    ChunkConfig chunk;
    SourceConfig source;
    SimulationConfig simulation;
};

class Config {
public:
    static Config& instance();

    // Load configuration from an INI file
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Parse command line arguments and override config.
    // Returns false for --help/--version or parse errors; exit_code() tells which.
    bool parse_command_line(int argc, char* argv[]);
    int exit_code() const { return exit_code_; }

    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    const std::string& get_config_file() const { return config_file_; }

    // Check value ranges; logs every problem found
    bool validate() const;

    void print() const;

    // Restore defaults (tests)
    void reset();

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void apply_sections(const std::map<std::string, std::map<std::string, std::string>>& sections);
    void override_from_env();

    GlobalConfig config_;
    std::string config_file_;
    int exit_code_ = 0;
};

} // namespace lanflow

#endif // LANFLOW_BASE_CONFIG_H

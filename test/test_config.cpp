#include <catch2/catch_test_macros.hpp>
#include "lanflow/base/config.h"
#include "lanflow/base/error_code.h"
#include "lanflow/base/logger.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace lanflow;

namespace {

// Writes an INI file into the temp directory, removed on destruction
class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& content) {
        path_ = (std::filesystem::temp_directory_path() /
                 ("lanflow_test_" + std::to_string(std::rand()) + ".ini")).string();
        std::ofstream out(path_);
        out << content;
    }
    ~TempConfigFile() { std::filesystem::remove(path_); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// argv for CLI11 from string literals
struct Args {
    explicit Args(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& arg : storage) {
            argv.push_back(arg.data());
        }
    }
    int argc() const { return static_cast<int>(argv.size()); }

    std::vector<std::string> storage;
    std::vector<char*> argv;
};

} // namespace

TEST_CASE("Config - Defaults", "[config]") {
    Config::instance().reset();
    const auto& config = Config::instance().get();

    REQUIRE(config.sampler.sample_size == 10);
    REQUIRE(config.concurrency.fast_concurrency == 6);
    REQUIRE(config.concurrency.medium_concurrency == 4);
    REQUIRE(config.concurrency.slow_concurrency == 2);
    REQUIRE(config.scheduler.max_retries == 3);
    REQUIRE(config.watchdog.interval_ms == 300);
    REQUIRE(config.watchdog.stall_threshold_ms == 800);
    REQUIRE(config.chunk.endgame_threshold == 3);
    REQUIRE(config.source.reliability_alpha == 0.3);
    REQUIRE(Config::instance().validate());
}

TEST_CASE("Config - Load from INI file", "[config][file]") {
    Config::instance().reset();

    TempConfigFile file(R"(
# lanflow test config
[log]
level = error

[concurrency]
fast_concurrency = 8
max_concurrency = 10

[device]
probe = "static"
low_end = yes

[watchdog]
interval_ms = 100
stall_threshold_ms = 1500

[chunk]
endgame_threshold = 0

[source]
reliability_alpha = 0.5

[simulation]
state_file = '/tmp/lanflow.json'
)");

    REQUIRE(Config::instance().load_from_file(file.path()));
    const auto& config = Config::instance().get();

    REQUIRE(config.concurrency.fast_concurrency == 8);
    REQUIRE(config.concurrency.max_concurrency == 10);
    REQUIRE(config.device.probe == "static");
    REQUIRE(config.device.low_end);
    REQUIRE(config.watchdog.interval_ms == 100);
    REQUIRE(config.watchdog.stall_threshold_ms == 1500);
    REQUIRE(config.chunk.endgame_threshold == 0);
    REQUIRE(config.source.reliability_alpha == 0.5);
    REQUIRE(config.simulation.state_file == "/tmp/lanflow.json");
    REQUIRE(Config::instance().get_config_file() == file.path());

    // Untouched sections keep defaults
    REQUIRE(config.scheduler.max_retries == 3);
}

TEST_CASE("Config - Bad file input", "[config][file]") {
    Config::instance().reset();
    Logger::instance().set_level(LogLevel::error);

    REQUIRE_FALSE(Config::instance().load_from_file("/nonexistent/lanflow.ini"));

    TempConfigFile file("[scheduler]\nmax_retries = lots\n");
    REQUIRE_FALSE(Config::instance().load_from_file(file.path()));
}

TEST_CASE("Config - Environment overrides", "[config][env]") {
    Config::instance().reset();

    setenv("LANFLOW_MAX_CONCURRENCY", "5", 1);
    setenv("LANFLOW_LOW_END_DEVICE", "true", 1);
    setenv("LANFLOW_STALL_THRESHOLD_MS", "2000", 1);

    REQUIRE(Config::instance().load_from_env());
    const auto& config = Config::instance().get();
    REQUIRE(config.concurrency.max_concurrency == 5);
    REQUIRE(config.device.low_end);
    REQUIRE(config.watchdog.stall_threshold_ms == 2000);

    setenv("LANFLOW_MAX_RETRIES", "many", 1);
    REQUIRE_FALSE(Config::instance().load_from_env());

    unsetenv("LANFLOW_MAX_CONCURRENCY");
    unsetenv("LANFLOW_LOW_END_DEVICE");
    unsetenv("LANFLOW_STALL_THRESHOLD_MS");
    unsetenv("LANFLOW_MAX_RETRIES");
}

TEST_CASE("Config - Command line", "[config][cli]") {
    Config::instance().reset();

    Args args({"lanflow", "--max-concurrency", "3", "--watchdog-interval", "0", "--peers", "4",
               "--demo-count", "12", "--log-level", "error", "a.iso", "b.iso"});
    REQUIRE(Config::instance().parse_command_line(args.argc(), args.argv.data()));

    const auto& config = Config::instance().get();
    REQUIRE(config.concurrency.max_concurrency == 3);
    REQUIRE(config.watchdog.interval_ms == 0);
    REQUIRE(config.simulation.peers == 4);
    REQUIRE(config.simulation.demo_count == 12);
    REQUIRE(config.simulation.files == std::vector<std::string>{"a.iso", "b.iso"});
}

TEST_CASE("Config - Command line errors set an exit code", "[config][cli]") {
    Config::instance().reset();

    Args bad({"lanflow", "--max-concurrency", "not-a-number"});
    REQUIRE_FALSE(Config::instance().parse_command_line(bad.argc(), bad.argv.data()));
    REQUIRE(Config::instance().exit_code() != 0);

    Config::instance().reset();
    Args help({"lanflow", "--help"});
    REQUIRE_FALSE(Config::instance().parse_command_line(help.argc(), help.argv.data()));
    REQUIRE(Config::instance().exit_code() == 0);
}

TEST_CASE("Config - Validation catches inconsistent values", "[config][validate]") {
    Logger::instance().set_level(LogLevel::error);

    SECTION("zero sample window") {
        Config::instance().reset();
        Config::instance().get().sampler.sample_size = 0;
        REQUIRE_FALSE(Config::instance().validate());
    }
    SECTION("thresholds out of order") {
        Config::instance().reset();
        Config::instance().get().concurrency.medium_threshold_mbps = 20.0;
        REQUIRE_FALSE(Config::instance().validate());
    }
    SECTION("unknown device probe") {
        Config::instance().reset();
        Config::instance().get().device.probe = "magic";
        REQUIRE_FALSE(Config::instance().validate());
    }
    SECTION("chunk tiers shrink") {
        Config::instance().reset();
        Config::instance().get().chunk.small_chunk_bytes = 64ULL * 1024 * 1024;
        REQUIRE_FALSE(Config::instance().validate());
    }
    SECTION("alpha outside (0, 1]") {
        Config::instance().reset();
        Config::instance().get().source.reliability_alpha = 0.0;
        REQUIRE_FALSE(Config::instance().validate());
    }
}

TEST_CASE("ErrorCode - Messages and categories", "[config][errors]") {
    LanflowError error(ErrorCode::StallTimeout, "no progress");
    REQUIRE(error.code() == ErrorCode::StallTimeout);
    REQUIRE(std::string(error.what()).find("no progress") != std::string::npos);

    std::error_code ec = ErrorCode::InvalidState;
    REQUIRE(ec.value() == 4001);
    REQUIRE_FALSE(to_string(ErrorCode::RetriesExhausted).empty());
}

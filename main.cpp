#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "lanflow/base/config.h"
#include "lanflow/base/error_code.h"
#include "lanflow/base/logger.h"
#include "lanflow/transfer/scheduler.h"
#include "lanflow/transfer/simulated_transport.h"

using namespace lanflow;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

class LanflowApplication {
public:
    LanflowApplication() = default;
    ~LanflowApplication() {
        if (scheduler_) {
            scheduler_->stop();
        }
        if (transport_) {
            transport_->stop();
        }
    }

    // Returns false when the process should exit with exit_code()
    bool initialize(int argc, char* argv[]) {
        Config::instance().load_from_env();

        if (!Config::instance().parse_command_line(argc, argv)) {
            exit_code_ = Config::instance().exit_code();
            return false;
        }
        if (!Config::instance().validate()) {
            exit_code_ = 1;
            return false;
        }
        Config::instance().print();

        const auto& config = Config::instance().get();
        transport_ = std::make_shared<SimulatedTransport>(config.simulation);
        scheduler_ = std::make_unique<TransferScheduler>(config, transport_);
        return true;
    }

    bool start() {
        const auto& sim = Config::instance().get().simulation;

        transport_->start();
        scheduler_->start();

        add_peers();

        if (!sim.state_file.empty() && std::filesystem::exists(sim.state_file)) {
            if (!restore(sim.state_file)) {
                return false;
            }
        }

        queue_files();
        queue_demo_items();

        if (scheduler_->idle()) {
            Logger::instance().warning("Nothing to transfer; pass files or --demo-count");
        }
        return true;
    }

    void run() {
        auto last_report = std::chrono::steady_clock::now();
        while (g_running && !scheduler_->idle()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            auto now = std::chrono::steady_clock::now();
            if (now - last_report >= std::chrono::seconds(1)) {
                for (const auto& peer : peers_) {
                    scheduler_->record_source_heartbeat(peer);
                }
                report();
                last_report = now;
            }
        }
        report();
        summarize();
    }

    void stop() {
        scheduler_->stop();
        transport_->stop();

        const auto& state_file = Config::instance().get().simulation.state_file;
        if (!state_file.empty()) {
            save(state_file);
        }
    }

    int exit_code() const { return exit_code_; }

private:
    void add_peers() {
        const auto& sim = Config::instance().get().simulation;
        for (uint32_t i = 1; i <= sim.peers; ++i) {
            SourceDescriptor peer;
            peer.source_id = "peer-" + std::to_string(i);
            peer.address = "10.0.0." + std::to_string(i);
            scheduler_->add_source(peer);

            // Spread peer speeds between half and full per-transfer cap
            const double speed = sim.per_transfer_mbps * (0.5 + 0.5 * i / sim.peers);
            transport_->set_source_speed(peer.source_id, speed);
            peers_.push_back(peer.source_id);
        }
    }

    // Every peer serves the whole item except peer-1, which only has the first half
    void announce(const std::string& content_id, uint64_t size) {
        for (const auto& peer : peers_) {
            ByteRangeSet ranges = peer == "peer-1" && peers_.size() > 1 ? ByteRangeSet{{0, size / 2}}
                                                                        : ByteRangeSet::full(size);
            scheduler_->update_source_availability(peer, content_id, ranges);
        }
    }

    void submit(const std::string& name, uint64_t size, bool encrypted) {
        TransferSpec spec;
        spec.display_name = name;
        spec.total_bytes = size;
        spec.encrypted = encrypted;
        spec.sources = peers_;
        if (!peers_.empty()) {
            announce(name, size);
        }
        try {
            scheduler_->submit(spec);
        } catch (const LanflowError& e) {
            Logger::instance().warning("Skipping {}: {}", name, e.what());
        }
    }

    void queue_files() {
        for (const auto& path : Config::instance().get().simulation.files) {
            std::error_code ec;
            const auto size = std::filesystem::file_size(path, ec);
            if (ec) {
                Logger::instance().warning("Cannot queue {}: {}", path, ec.message());
                continue;
            }
            submit(std::filesystem::path(path).filename().string(), size, false);
        }
    }

    void queue_demo_items() {
        const auto& sim = Config::instance().get().simulation;
        for (uint32_t i = 0; i < sim.demo_count; ++i) {
            // Vary sizes so the small-first ordering is visible
            const uint64_t size = std::max<uint64_t>(sim.demo_size_mb, 1) * 1024 * 1024 * (1 + i % 4) / 2;
            submit("demo-" + std::to_string(i + 1) + ".bin", size, i % 3 == 0);
        }
    }

    bool restore(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            Logger::instance().error("Cannot open state file {}", path);
            return false;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        try {
            scheduler_->restore_state(buffer.str());
        } catch (const LanflowError& e) {
            Logger::instance().error("Cannot restore {}: {}", path, e.what());
            return false;
        }
        for (const auto& item : scheduler_->list_items()) {
            if (!is_terminal(item.status) && item.multi_source()) {
                announce(item.content_id, item.total_bytes);
            }
        }
        return true;
    }

    void save(const std::string& path) {
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            Logger::instance().error("Cannot write state file {}", path);
            return;
        }
        out << scheduler_->serialize_state();
        Logger::instance().info("Saved scheduler state to {}", path);
    }

    void report() {
        const auto stats = scheduler_->stats();
        Logger::instance().info("active {} | stalled {} | queued {} | done {} | failed {} | cancelled {} | "
                                "limit {} | {:.1f} MB/s",
                                stats.active_count, stats.stalled_count, stats.queued_count,
                                stats.completed_count, stats.failed_count, stats.cancelled_count,
                                stats.concurrency_limit, stats.avg_throughput_mbps);
    }

    void summarize() {
        for (const auto& item : scheduler_->list_items()) {
            if (item.status == TransferStatus::Failed) {
                std::cout << "  FAILED  " << item.display_name << ": " << to_string(item.last_error)
                          << " (" << item.error_message << ")" << std::endl;
            } else {
                std::cout << "  " << to_string(item.status) << "  " << item.display_name << " "
                          << item.bytes_transferred << "/" << item.total_bytes << std::endl;
            }
        }
    }

    std::shared_ptr<SimulatedTransport> transport_;
    std::unique_ptr<TransferScheduler> scheduler_;
    std::vector<std::string> peers_;
    int exit_code_ = 0;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    LanflowApplication app;
    if (!app.initialize(argc, argv)) {
        return app.exit_code();
    }

    std::cout << "lanflow - adaptive concurrent transfer scheduler" << std::endl;

    if (!app.start()) {
        Logger::instance().error("Failed to start lanflow");
        app.stop();
        return 1;
    }

    app.run();
    app.stop();
    return 0;
}

#include "lanflow/p2p/source_registry.h"
#include "lanflow/base/logger.h"
#include <algorithm>
#include <map>

namespace lanflow {

bool SourceDescriptor::has_range(const std::string& content_id, const ByteRange& range) const {
    auto it = available.find(content_id);
    return it != available.end() && it->second.covers(range);
}

struct SourceRegistry::Impl {
    SourceConfig config;
    std::map<std::string, SourceDescriptor> sources;

    explicit Impl(const SourceConfig& cfg) : config(cfg) {}

    SourceDescriptor* find(const std::string& source_id) {
        auto it = sources.find(source_id);
        return it == sources.end() ? nullptr : &it->second;
    }

    const SourceDescriptor* find(const std::string& source_id) const {
        auto it = sources.find(source_id);
        return it == sources.end() ? nullptr : &it->second;
    }
};

SourceRegistry::SourceRegistry(const SourceConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

SourceRegistry::~SourceRegistry() = default;
SourceRegistry::SourceRegistry(SourceRegistry&&) noexcept = default;
SourceRegistry& SourceRegistry::operator=(SourceRegistry&&) noexcept = default;

bool SourceRegistry::register_source(const SourceDescriptor& desc, TimePoint now) {
    if (auto* existing = impl_->find(desc.source_id)) {
        existing->address = desc.address;
        if (desc.measured_bandwidth_mbps > 0.0) {
            existing->measured_bandwidth_mbps = desc.measured_bandwidth_mbps;
        }
        for (const auto& [content, ranges] : desc.available) {
            existing->available[content] = ranges;
        }
        existing->last_seen = now;
        return false;
    }

    SourceDescriptor fresh = desc;
    fresh.reliability_score = std::clamp(impl_->config.initial_reliability, 0.0, 1.0);
    fresh.attempts = 0;
    fresh.successes = 0;
    fresh.consecutive_failures = 0;
    fresh.in_flight = 0;
    fresh.last_seen = now;
    impl_->sources.emplace(desc.source_id, std::move(fresh));

    Logger::instance().info("Source registered: {} ({})", desc.source_id,
                            desc.address.empty() ? "no address" : desc.address);
    return true;
}

bool SourceRegistry::remove_source(const std::string& source_id) {
    if (impl_->sources.erase(source_id) == 0) {
        return false;
    }
    Logger::instance().info("Source removed: {}", source_id);
    return true;
}

bool SourceRegistry::update_availability(const std::string& source_id, const std::string& content_id,
                                         const ByteRangeSet& ranges, TimePoint now) {
    auto* source = impl_->find(source_id);
    if (!source) {
        return false;
    }
    if (ranges.empty()) {
        source->available.erase(content_id);
    } else {
        source->available[content_id] = ranges;
    }
    source->last_seen = now;
    Logger::instance().debug("Source {} serves {} {}", source_id, content_id, ranges.to_string());
    return true;
}

SourceVerdict SourceRegistry::record_outcome(const std::string& source_id, bool success) {
    auto* source = impl_->find(source_id);
    if (!source) {
        return SourceVerdict::Unknown;
    }

    const double alpha = impl_->config.reliability_alpha;
    const double outcome = success ? 1.0 : 0.0;
    source->reliability_score = std::clamp(alpha * outcome + (1.0 - alpha) * source->reliability_score, 0.0, 1.0);
    source->attempts++;

    if (success) {
        source->successes++;
        source->consecutive_failures = 0;
        return SourceVerdict::Kept;
    }

    source->consecutive_failures++;
    if (impl_->config.max_consecutive_failures > 0 &&
        source->consecutive_failures >= impl_->config.max_consecutive_failures) {
        Logger::instance().warning("Source {} failed {} times in a row, removing it",
                                   source_id, source->consecutive_failures);
        impl_->sources.erase(source_id);
        return SourceVerdict::Removed;
    }
    return SourceVerdict::Kept;
}

bool SourceRegistry::record_bandwidth(const std::string& source_id, double mbps) {
    auto* source = impl_->find(source_id);
    if (!source || !(mbps >= 0.0)) {
        return false;
    }
    if (source->measured_bandwidth_mbps <= 0.0) {
        source->measured_bandwidth_mbps = mbps;
    } else {
        const double beta = impl_->config.bandwidth_alpha;
        source->measured_bandwidth_mbps = beta * mbps + (1.0 - beta) * source->measured_bandwidth_mbps;
    }
    return true;
}

bool SourceRegistry::touch(const std::string& source_id, TimePoint now) {
    auto* source = impl_->find(source_id);
    if (!source) {
        return false;
    }
    source->last_seen = now;
    return true;
}

std::vector<std::string> SourceRegistry::evict_stale(TimePoint now) {
    std::vector<std::string> evicted;
    const auto timeout = std::chrono::seconds(impl_->config.stale_timeout_sec);

    for (auto it = impl_->sources.begin(); it != impl_->sources.end();) {
        if (now - it->second.last_seen > timeout) {
            Logger::instance().info("Source {} not seen for {}s, evicting", it->first,
                                    impl_->config.stale_timeout_sec);
            evicted.push_back(it->first);
            it = impl_->sources.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

bool SourceRegistry::acquire(const std::string& source_id) {
    auto* source = impl_->find(source_id);
    if (!source) {
        return false;
    }
    source->in_flight++;
    return true;
}

void SourceRegistry::release(const std::string& source_id) {
    auto* source = impl_->find(source_id);
    if (source && source->in_flight > 0) {
        source->in_flight--;
    }
}

std::optional<SourceDescriptor> SourceRegistry::get(const std::string& source_id) const {
    if (const auto* source = impl_->find(source_id)) {
        return *source;
    }
    return std::nullopt;
}

bool SourceRegistry::contains(const std::string& source_id) const {
    return impl_->find(source_id) != nullptr;
}

std::vector<SourceDescriptor> SourceRegistry::snapshot() const {
    std::vector<SourceDescriptor> result;
    result.reserve(impl_->sources.size());
    for (const auto& [id, source] : impl_->sources) {
        result.push_back(source);
    }
    return result;
}

std::vector<std::string> SourceRegistry::holders_of(const std::string& content_id,
                                                    const ByteRange& range) const {
    std::vector<std::string> result;
    for (const auto& [id, source] : impl_->sources) {
        if (source.has_range(content_id, range)) {
            result.push_back(id);
        }
    }
    return result;
}

size_t SourceRegistry::size() const {
    return impl_->sources.size();
}

} // namespace lanflow

#include "lanflow/transfer/state_codec.h"
#include "lanflow/base/error_code.h"
#include <nlohmann/json.hpp>
#include <set>

namespace lanflow {

using json = nlohmann::json;

namespace {

json chunk_plan_to_json(const ChunkPlan& plan) {
    json chunks = json::array();
    for (const auto& chunk : plan.chunks) {
        // A chunk in flight has no owner after a restart
        const ChunkStatus status = chunk.status == ChunkStatus::InFlight ? ChunkStatus::Pending : chunk.status;
        chunks.push_back({
            {"index", chunk.index},
            {"offset", chunk.range.offset},
            {"length", chunk.range.length},
            {"status", to_string(status)},
            {"assigned_source", chunk.assigned_source},
            {"bytes_done", chunk.bytes_done},
            {"failures", chunk.failures},
            {"completed_by", chunk.completed_by},
            {"excluded", chunk.excluded}
        });
    }
    return {
        {"content_id", plan.content_id},
        {"total_bytes", plan.total_bytes},
        {"chunk_size", plan.chunk_size},
        {"chunks", chunks}
    };
}

ChunkPlan chunk_plan_from_json(const json& j, uint64_t item_bytes) {
    ChunkPlan plan;
    plan.content_id = j.at("content_id").get<std::string>();
    plan.total_bytes = j.at("total_bytes").get<uint64_t>();
    plan.chunk_size = j.at("chunk_size").get<uint64_t>();
    if (plan.total_bytes != item_bytes || plan.chunk_size == 0) {
        throw LanflowError(ErrorCode::InvalidState, "chunk plan does not match its item");
    }

    uint64_t expected_offset = 0;
    for (const auto& c : j.at("chunks")) {
        Chunk chunk;
        chunk.index = c.at("index").get<uint32_t>();
        chunk.range = {c.at("offset").get<uint64_t>(), c.at("length").get<uint64_t>()};
        auto status = chunk_status_from_string(c.at("status").get<std::string>());
        if (!status) {
            throw LanflowError(ErrorCode::InvalidState, "unknown chunk status " + c.at("status").dump());
        }
        chunk.status = *status == ChunkStatus::InFlight ? ChunkStatus::Pending : *status;
        chunk.assigned_source = c.value("assigned_source", "");
        chunk.bytes_done = c.value("bytes_done", uint64_t{0});
        chunk.failures = c.value("failures", 0u);
        chunk.completed_by = c.value("completed_by", "");
        if (c.contains("excluded")) {
            for (const auto& source : c["excluded"]) {
                chunk.excluded.insert(source.get<std::string>());
            }
        }

        if (chunk.index != plan.chunks.size() || chunk.range.offset != expected_offset ||
            chunk.range.length == 0 || chunk.bytes_done > chunk.range.length) {
            throw LanflowError(ErrorCode::InvalidState,
                               "chunk " + std::to_string(chunk.index) + " is inconsistent");
        }
        if (chunk.status == ChunkStatus::Completed) {
            chunk.bytes_done = chunk.range.length;
        }
        expected_offset = chunk.range.end();
        plan.chunks.push_back(std::move(chunk));
    }
    if (expected_offset != plan.total_bytes) {
        throw LanflowError(ErrorCode::InvalidState, "chunks do not cover the item");
    }
    return plan;
}

json item_to_json(const TransferItem& item) {
    json j = {
        {"id", item.id},
        {"display_name", item.display_name},
        {"content_id", item.content_id},
        {"total_bytes", item.total_bytes},
        {"encrypted", item.encrypted},
        {"status", to_string(item.status)},
        {"bytes_transferred", item.bytes_transferred},
        {"retry_priority", item.retry_priority},
        {"paused", item.paused},
        {"attempts", item.attempts},
        {"stall_polls", item.stall_polls},
        {"last_error", static_cast<int>(item.last_error)},
        {"error_message", item.error_message},
        {"sources", item.sources}
    };
    if (item.chunk_plan) {
        j["chunk_plan"] = chunk_plan_to_json(*item.chunk_plan);
    }
    return j;
}

TransferItem item_from_json(const json& j) {
    TransferItem item;
    item.id = j.at("id").get<TransferId>();
    item.display_name = j.at("display_name").get<std::string>();
    item.content_id = j.value("content_id", item.display_name);
    item.total_bytes = j.at("total_bytes").get<uint64_t>();
    item.encrypted = j.value("encrypted", false);

    auto status = transfer_status_from_string(j.at("status").get<std::string>());
    if (!status) {
        throw LanflowError(ErrorCode::InvalidState, "unknown transfer status " + j.at("status").dump());
    }
    item.status = *status;
    item.bytes_transferred = j.at("bytes_transferred").get<uint64_t>();
    item.retry_priority = j.value("retry_priority", false);
    item.paused = j.value("paused", false);
    item.attempts = j.value("attempts", 0u);
    item.stall_polls = j.value("stall_polls", 0u);
    item.last_error = static_cast<ErrorCode>(j.value("last_error", 0));
    item.error_message = j.value("error_message", "");
    if (j.contains("sources")) {
        for (const auto& source : j["sources"]) {
            item.sources.push_back(source.get<std::string>());
        }
    }

    if (item.id == 0 || item.total_bytes == 0 || item.bytes_transferred > item.total_bytes) {
        throw LanflowError(ErrorCode::InvalidState, "transfer " + std::to_string(item.id) + " is inconsistent");
    }
    if (item.status == TransferStatus::Completed && item.bytes_transferred != item.total_bytes) {
        throw LanflowError(ErrorCode::InvalidState,
                           "transfer " + std::to_string(item.id) + " completed with missing bytes");
    }
    if (item.paused && item.status != TransferStatus::Queued) {
        throw LanflowError(ErrorCode::InvalidState, "transfer " + std::to_string(item.id) + " paused but not queued");
    }

    if (j.contains("chunk_plan")) {
        item.chunk_plan = chunk_plan_from_json(j["chunk_plan"], item.total_bytes);
        if (item.status == TransferStatus::Completed && !item.chunk_plan->complete()) {
            throw LanflowError(ErrorCode::InvalidState,
                               "transfer " + std::to_string(item.id) + " completed with chunks outstanding");
        }
    }
    return item;
}

} // namespace

std::string encode_state(const SchedulerSnapshot& snapshot) {
    json items = json::array();
    for (const auto& item : snapshot.items) {
        items.push_back(item_to_json(item));
    }
    json doc = {
        {"version", STATE_FORMAT_VERSION},
        {"next_id", snapshot.next_id},
        {"concurrency_limit", snapshot.concurrency_limit},
        {"items", items},
        {"queue", snapshot.queue_order}
    };
    return doc.dump(2);
}

SchedulerSnapshot decode_state(const std::string& data) {
    SchedulerSnapshot snapshot;
    try {
        json doc = json::parse(data);
        if (!doc.is_object()) {
            throw LanflowError(ErrorCode::SerializationError, "state is not a JSON object");
        }
        const int version = doc.at("version").get<int>();
        if (version != STATE_FORMAT_VERSION) {
            throw LanflowError(ErrorCode::SerializationError,
                               "unsupported state version " + std::to_string(version));
        }

        snapshot.next_id = doc.at("next_id").get<TransferId>();
        snapshot.concurrency_limit = doc.value("concurrency_limit", 0u);
        for (const auto& j : doc.at("items")) {
            snapshot.items.push_back(item_from_json(j));
        }
        if (doc.contains("queue")) {
            for (const auto& id : doc["queue"]) {
                snapshot.queue_order.push_back(id.get<TransferId>());
            }
        }
    } catch (const json::exception& e) {
        throw LanflowError(ErrorCode::SerializationError, e.what());
    }

    std::set<TransferId> ids;
    std::set<TransferId> queued;
    for (const auto& item : snapshot.items) {
        if (!ids.insert(item.id).second) {
            throw LanflowError(ErrorCode::InvalidState, "duplicate transfer id " + std::to_string(item.id));
        }
        if (item.id >= snapshot.next_id) {
            throw LanflowError(ErrorCode::InvalidState, "transfer id " + std::to_string(item.id) +
                               " not below next_id");
        }
        if (item.status == TransferStatus::Queued) {
            queued.insert(item.id);
        }
    }
    std::set<TransferId> ordered(snapshot.queue_order.begin(), snapshot.queue_order.end());
    if (ordered.size() != snapshot.queue_order.size() || ordered != queued) {
        throw LanflowError(ErrorCode::InvalidState, "queue order does not match the queued transfers");
    }
    return snapshot;
}

} // namespace lanflow

#pragma once
#include "types.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

namespace docserve {

// JSON views of cache reports, shared by the HTTP API and the CLI.

inline nlohmann::json statistics_to_json(const CacheStatistics& s) {
    return {
        {"hits", s.hits},
        {"misses", s.misses},
        {"evictions", s.evictions},
        {"invalidations", s.invalidations},
        {"total_access", s.total_access},
        {"hit_rate", s.hit_rate},
        {"current_entry_count", s.current_entry_count},
        {"current_total_bytes", s.current_total_bytes},
        {"max_entries", s.max_entries},
        {"max_total_bytes", s.max_total_bytes},
        {"created_at", iso8601_from_millis(s.created_at)},
        {"last_updated_at", iso8601_from_millis(s.last_updated_at)}
    };
}

inline nlohmann::json health_to_json(const HealthStatus& h) {
    return {
        {"healthy", h.healthy},
        {"errors", h.errors},
        {"warnings", h.warnings},
        {"utilization", h.utilization},
        {"memory_utilization", h.memory_utilization},
        {"hit_rate", h.hit_rate}
    };
}

inline nlohmann::json item_to_json(const CacheItemMetadata& m) {
    nlohmann::json item = {
        {"key", m.key},
        {"file_path", m.file_path ? nlohmann::json(*m.file_path) : nlohmann::json(nullptr)},
        {"created_at", iso8601_from_millis(m.created_at)},
        {"last_accessed_at", iso8601_from_millis(m.last_accessed_at)},
        {"access_count", m.access_count},
        {"size", m.size},
        {"expired", m.expired}
    };
    if (m.remaining_ttl_ms) item["remaining_ttl_ms"] = *m.remaining_ttl_ms;
    return item;
}

inline nlohmann::json clear_result_to_json(const ClearResult& r) {
    return {
        {"before_size", r.before_size},
        {"before_byte_size", r.before_byte_size},
        {"after_size", r.after_size},
        {"after_byte_size", r.after_byte_size},
        {"cleared_count", r.cleared_count},
        {"reason", r.reason}
    };
}

inline nlohmann::json batch_result_to_json(const BatchOperationResult& r) {
    return {
        {"success_count", r.success_count},
        {"failure_count", r.failure_count},
        {"failed_keys", r.failed_keys},
        {"duration_ms", r.duration_ms}
    };
}

} // namespace docserve

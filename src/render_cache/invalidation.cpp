#include "invalidation.hpp"

#include <unordered_set>

namespace docserve {

const char* reason_name(InvalidationReason reason) {
    switch (reason) {
        case InvalidationReason::Manual:        return "manual";
        case InvalidationReason::FileChanged:   return "file_changed";
        case InvalidationReason::Expired:       return "expired";
        case InvalidationReason::CapacityLimit: return "capacity_limit";
        case InvalidationReason::Batch:         return "batch";
    }
    return "unknown";
}

bool is_stale_after(const CacheEntry& entry, const FileChangeEvent& change) {
    if (change.kind == FileChangeKind::Add) return false;
    if (change.kind == FileChangeKind::Unlink) return true;
    return entry.source_file_modified_at != change.new_modified_at;
}

InvalidationCoordinator::InvalidationCoordinator(CacheStore& store, bool file_based_invalidation)
    : store_(store), file_based_invalidation_(file_based_invalidation) {}

std::optional<InvalidationEvent> InvalidationCoordinator::invalidate(const CacheKey& key) {
    auto entry = store_.remove(key, InvalidationReason::Manual);
    if (!entry) return std::nullopt;

    InvalidationEvent ev;
    ev.key = key;
    ev.reason = InvalidationReason::Manual;
    ev.timestamp = store_.now();
    ev.entry = std::move(entry);
    return ev;
}

std::vector<InvalidationEvent> InvalidationCoordinator::invalidate_by_file_path(const std::string& path) {
    std::vector<InvalidationEvent> events;
    uint64_t now = store_.now();

    for (const auto& key : store_.keys_for_path(path)) {
        auto entry = store_.remove(key, InvalidationReason::FileChanged);
        if (!entry) continue;
        InvalidationEvent ev;
        ev.key = key;
        ev.reason = InvalidationReason::FileChanged;
        ev.timestamp = now;
        ev.entry = std::move(entry);
        events.push_back(std::move(ev));
    }
    return events;
}

std::vector<InvalidationEvent> InvalidationCoordinator::on_file_change(const FileChangeEvent& change) {
    std::vector<InvalidationEvent> events;
    if (!file_based_invalidation_ || change.kind == FileChangeKind::Add) return events;

    uint64_t now = store_.now();
    for (const auto& key : store_.keys_for_path(change.path)) {
        const CacheEntry* current = store_.find(key);
        if (!current || !is_stale_after(*current, change)) continue;

        auto entry = store_.remove(key, InvalidationReason::FileChanged);
        if (!entry) continue;
        InvalidationEvent ev;
        ev.key = key;
        ev.reason = InvalidationReason::FileChanged;
        ev.timestamp = now;
        ev.entry = std::move(entry);
        events.push_back(std::move(ev));
    }
    return events;
}

std::optional<InvalidationEvent> InvalidationCoordinator::invalidate_all(const std::vector<std::string>& paths) {
    InvalidationEvent batch;
    batch.reason = InvalidationReason::Batch;
    batch.timestamp = store_.now();

    std::unordered_set<std::string> seen;
    for (const auto& path : paths) {
        if (!seen.insert(path).second) continue;
        for (const auto& key : store_.keys_for_path(path)) {
            if (store_.remove(key, InvalidationReason::Batch)) {
                batch.keys.push_back(key);
            }
        }
    }

    if (batch.keys.empty()) return std::nullopt;
    return batch;
}

BatchOperationResult InvalidationCoordinator::invalidate_keys(const std::vector<CacheKey>& keys,
                                                              std::optional<InvalidationEvent>& batch_event) {
    BatchOperationResult result;
    uint64_t start = store_.now();

    InvalidationEvent batch;
    batch.reason = InvalidationReason::Batch;
    batch.timestamp = start;

    for (const auto& key : keys) {
        if (store_.remove(key, InvalidationReason::Batch)) {
            result.success_count++;
            batch.keys.push_back(key);
        } else {
            result.failure_count++;
            result.failed_keys.push_back(key);
        }
    }

    uint64_t end = store_.now();
    result.duration_ms = end > start ? end - start : 0;
    if (!batch.keys.empty()) batch_event = std::move(batch);
    return result;
}

} // namespace docserve

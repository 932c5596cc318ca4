#pragma once
#include "types.hpp"
#include "cache_store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace docserve {

// Turns manual requests and watcher notifications into store removals and
// returns the events to publish. Paths are resolved through the store's
// path index, never by inspecting keys. Shares the store's lock discipline.
class InvalidationCoordinator {
public:
    InvalidationCoordinator(CacheStore& store, bool file_based_invalidation);

    // Manual removal of one key.
    std::optional<InvalidationEvent> invalidate(const CacheKey& key);

    // Remove every entry rendered from `path`, one FileChanged event each.
    std::vector<InvalidationEvent> invalidate_by_file_path(const std::string& path);

    // Watcher entry point. Add is ignored; Change/Unlink remove the entries
    // for the path whose recorded mtime differs from new_modified_at. No-op
    // when file-based invalidation is disabled.
    std::vector<InvalidationEvent> on_file_change(const FileChangeEvent& change);

    // Remove every entry for any of `paths` and summarize them in a single
    // Batch event. Nothing is returned when nothing matched.
    std::optional<InvalidationEvent> invalidate_all(const std::vector<std::string>& paths);

    // Manual removal of several keys, summarized in one Batch event.
    // Keys that were not cached are reported in failed_keys.
    BatchOperationResult invalidate_keys(const std::vector<CacheKey>& keys,
                                         std::optional<InvalidationEvent>& batch_event);

    bool file_based_invalidation() const { return file_based_invalidation_; }

private:
    CacheStore& store_;
    bool file_based_invalidation_;
};

// True when a change notification makes `entry` stale.
bool is_stale_after(const CacheEntry& entry, const FileChangeEvent& change);

} // namespace docserve

#pragma once
#include "types.hpp"
#include "eviction_policy.hpp"
#include "cache_stats.hpp"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <cstdint>

namespace docserve {

// Owns every CacheEntry plus the LRU order, the file-path index and the
// statistics counters. Not thread-safe: RenderCache serializes all calls.
//
// Operations that remove entries as a side effect (TTL expiry on get,
// capacity eviction on put, sweeps) append one InvalidationEvent per removal
// to `events`; the caller publishes them after releasing its lock.
class CacheStore {
public:
    // Throws CapacityMisconfigured if max_entries or max_total_bytes is 0.
    CacheStore(const CacheLimits& limits, CacheClock clock);

    // Hit: touches the entry and returns a copy. Expired: removes it
    // (reason Expired) and reports a miss.
    QueryResult get(const CacheKey& key, std::vector<InvalidationEvent>& events);

    // Insert or overwrite, then evict until the limits hold. Overwriting is
    // not an eviction. The new entry may itself be evicted if it alone
    // exceeds max_total_bytes.
    void put(const CacheKey& key,
             std::string value,
             std::vector<InvalidationEvent>& events,
             std::optional<std::string> source_file_path = std::nullopt,
             std::optional<uint64_t> source_file_modified_at = std::nullopt);

    // Remove and return the entry. Emits nothing; Manual, FileChanged and
    // Batch count as invalidations, Expired and CapacityLimit as evictions.
    std::optional<CacheEntry> remove(const CacheKey& key, InvalidationReason reason);

    ClearResult clear(const std::string& reason, std::vector<CacheKey>& cleared_keys);

    // Eagerly remove every expired entry.
    size_t sweep_expired(std::vector<InvalidationEvent>& events);

    // Read-only lookup: no touch, no counters. Expired entries are not found.
    QueryResult peek(const CacheKey& key) const;

    // Raw entry regardless of TTL, or nullptr. Invalidated by any mutation.
    const CacheEntry* find(const CacheKey& key) const;

    bool has(const CacheKey& key) const;
    bool is_expired(const CacheEntry& entry, uint64_t now) const;

    // Keys whose entries came from source_file_path == path.
    std::vector<CacheKey> keys_for_path(const std::string& path) const;

    std::vector<CacheKey> keys() const;
    std::vector<CacheItemMetadata> items() const;

    CacheStatistics statistics() const;
    void reset_statistics();

    size_t size() const { return entries_.size(); }
    size_t total_bytes() const { return total_bytes_; }
    const CacheLimits& limits() const { return limits_; }
    uint64_t now() const { return clock_(); }

private:
    struct Slot {
        CacheEntry entry;
        uint64_t seq = 0;
    };

    LruRank rank_of(const Slot& slot) const;
    CacheEntry detach(std::unordered_map<CacheKey, Slot>::iterator it);

    CacheLimits limits_;
    CacheClock clock_;
    EvictionPolicy policy_;
    StatCounters counters_;

    std::unordered_map<CacheKey, Slot> entries_;
    LruIndex lru_;
    std::unordered_map<std::string, std::unordered_set<CacheKey>> by_path_;
    size_t total_bytes_ = 0;
    uint64_t next_seq_ = 1;
};

} // namespace docserve

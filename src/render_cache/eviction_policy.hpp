#pragma once
#include "types.hpp"
#include <set>
#include <string>
#include <vector>
#include <cstdint>

namespace docserve {

// Position of one entry in least-recently-used order. seq is a per-store
// insertion counter so the order is total even when timestamps tie.
struct LruRank {
    uint64_t last_accessed_at = 0;
    uint64_t created_at = 0;
    uint64_t seq = 0;
    CacheKey key;
    size_t byte_size = 0;

    bool operator<(const LruRank& other) const {
        if (last_accessed_at != other.last_accessed_at)
            return last_accessed_at < other.last_accessed_at;
        if (created_at != other.created_at)
            return created_at < other.created_at;
        return seq < other.seq;
    }
};

// Begins with the least recently used entry.
using LruIndex = std::set<LruRank>;

class EvictionPolicy {
public:
    explicit EvictionPolicy(const CacheLimits& limits);

    bool within_limits(size_t entry_count, size_t total_bytes) const;

    // Keys to evict, in eviction order, so that both limits hold afterwards:
    // first while the count is over max_entries, then while the byte total
    // is over max_total_bytes, always taking the LRU entry next.
    std::vector<CacheKey> select_victims(const LruIndex& order,
                                         size_t entry_count,
                                         size_t total_bytes) const;

private:
    size_t max_entries_;
    size_t max_total_bytes_;
};

} // namespace docserve

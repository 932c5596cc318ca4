#pragma once
#include "types.hpp"
#include <cstdint>

namespace docserve {

// Running counters owned by one CacheStore. Not synchronized; the store's
// owner serializes access. When statistics are disabled only
// last_updated_at moves.
class StatCounters {
public:
    StatCounters(bool enabled, uint64_t now);

    void record_hit(uint64_t now);
    void record_miss(uint64_t now);
    void record_eviction(uint64_t now);
    void record_invalidations(uint64_t count, uint64_t now);
    void touch(uint64_t now) { last_updated_at_ = now; }

    // Zero every counter; created_at is kept.
    void reset(uint64_t now);

    CacheStatistics snapshot(size_t entry_count, size_t total_bytes,
                             const CacheLimits& limits) const;

private:
    bool enabled_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t invalidations_ = 0;
    uint64_t total_access_ = 0;
    uint64_t created_at_;
    uint64_t last_updated_at_;
};

// hits / total_access, 0 when there has been no access.
double hit_rate(uint64_t hits, uint64_t total_access);

// Utilization ratios, errors for impossible states (over a limit,
// hits + misses != total_access) and warnings above 90% of either limit.
HealthStatus evaluate_health(const CacheStatistics& stats, const CacheLimits& limits);

} // namespace docserve

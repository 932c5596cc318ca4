#include "cache_stats.hpp"

#include <cstdio>
#include <string>

namespace docserve {

static constexpr double kWarnUtilization = 0.9;

StatCounters::StatCounters(bool enabled, uint64_t now)
    : enabled_(enabled), created_at_(now), last_updated_at_(now) {}

void StatCounters::record_hit(uint64_t now) {
    last_updated_at_ = now;
    if (!enabled_) return;
    ++hits_;
    ++total_access_;
}

void StatCounters::record_miss(uint64_t now) {
    last_updated_at_ = now;
    if (!enabled_) return;
    ++misses_;
    ++total_access_;
}

void StatCounters::record_eviction(uint64_t now) {
    last_updated_at_ = now;
    if (!enabled_) return;
    ++evictions_;
}

void StatCounters::record_invalidations(uint64_t count, uint64_t now) {
    last_updated_at_ = now;
    if (!enabled_) return;
    invalidations_ += count;
}

void StatCounters::reset(uint64_t now) {
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
    invalidations_ = 0;
    total_access_ = 0;
    last_updated_at_ = now;
}

CacheStatistics StatCounters::snapshot(size_t entry_count, size_t total_bytes,
                                       const CacheLimits& limits) const {
    CacheStatistics s;
    s.hits = hits_;
    s.misses = misses_;
    s.evictions = evictions_;
    s.invalidations = invalidations_;
    s.total_access = total_access_;
    s.hit_rate = hit_rate(hits_, total_access_);
    s.current_entry_count = entry_count;
    s.current_total_bytes = total_bytes;
    s.max_entries = limits.max_entries;
    s.max_total_bytes = limits.max_total_bytes;
    s.created_at = created_at_;
    s.last_updated_at = last_updated_at_;
    return s;
}

double hit_rate(uint64_t hits, uint64_t total_access) {
    if (total_access == 0) return 0.0;
    return static_cast<double>(hits) / static_cast<double>(total_access);
}

static std::string percent(double ratio) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", ratio * 100.0);
    return buf;
}

HealthStatus evaluate_health(const CacheStatistics& stats, const CacheLimits& limits) {
    HealthStatus h;
    h.utilization = limits.max_entries > 0
        ? static_cast<double>(stats.current_entry_count) / static_cast<double>(limits.max_entries)
        : 0.0;
    h.memory_utilization = limits.max_total_bytes > 0
        ? static_cast<double>(stats.current_total_bytes) / static_cast<double>(limits.max_total_bytes)
        : 0.0;
    h.hit_rate = stats.hit_rate;

    if (h.utilization > 1.0) {
        h.errors.push_back("entry count " + std::to_string(stats.current_entry_count) +
                           " exceeds max_entries " + std::to_string(limits.max_entries));
    }
    if (h.memory_utilization > 1.0) {
        h.errors.push_back("total bytes " + std::to_string(stats.current_total_bytes) +
                           " exceeds max_total_bytes " + std::to_string(limits.max_total_bytes));
    }
    if (limits.statistics && stats.hits + stats.misses != stats.total_access) {
        h.errors.push_back("statistics inconsistent: hits (" + std::to_string(stats.hits) +
                           ") + misses (" + std::to_string(stats.misses) +
                           ") != total_access (" + std::to_string(stats.total_access) + ")");
    }

    if (h.utilization > kWarnUtilization) {
        h.warnings.push_back("entry utilization at " + percent(h.utilization) +
                             ", heavy eviction imminent");
    }
    if (h.memory_utilization > kWarnUtilization) {
        h.warnings.push_back("memory utilization at " + percent(h.memory_utilization) +
                             ", heavy eviction imminent");
    }

    h.healthy = h.errors.empty();
    return h;
}

} // namespace docserve

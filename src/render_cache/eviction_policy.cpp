#include "eviction_policy.hpp"

namespace docserve {

EvictionPolicy::EvictionPolicy(const CacheLimits& limits)
    : max_entries_(limits.max_entries), max_total_bytes_(limits.max_total_bytes) {}

bool EvictionPolicy::within_limits(size_t entry_count, size_t total_bytes) const {
    return entry_count <= max_entries_ && total_bytes <= max_total_bytes_;
}

std::vector<CacheKey> EvictionPolicy::select_victims(const LruIndex& order,
                                                     size_t entry_count,
                                                     size_t total_bytes) const {
    std::vector<CacheKey> victims;
    auto it = order.begin();

    while (entry_count > max_entries_ && it != order.end()) {
        victims.push_back(it->key);
        --entry_count;
        total_bytes -= it->byte_size;
        ++it;
    }

    while (total_bytes > max_total_bytes_ && it != order.end()) {
        victims.push_back(it->key);
        --entry_count;
        total_bytes -= it->byte_size;
        ++it;
    }

    return victims;
}

} // namespace docserve

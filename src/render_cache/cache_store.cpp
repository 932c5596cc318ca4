#include "cache_store.hpp"
#include "errors.hpp"
#include "../util.hpp"

namespace docserve {

static const CacheLimits& validated(const CacheLimits& limits) {
    if (limits.max_entries == 0) {
        throw CapacityMisconfigured("CacheStore: max_entries must be greater than 0");
    }
    if (limits.max_total_bytes == 0) {
        throw CapacityMisconfigured("CacheStore: max_total_bytes must be greater than 0");
    }
    return limits;
}

CacheStore::CacheStore(const CacheLimits& limits, CacheClock clock)
    : limits_(validated(limits))
    , clock_(clock ? std::move(clock) : CacheClock(epoch_millis))
    , policy_(limits_)
    , counters_(limits_.statistics, clock_())
{}

bool CacheStore::is_expired(const CacheEntry& entry, uint64_t now) const {
    if (limits_.ttl_ms == 0) return false;
    return now > entry.created_at && now - entry.created_at > limits_.ttl_ms;
}

LruRank CacheStore::rank_of(const Slot& slot) const {
    return LruRank{slot.entry.last_accessed_at, slot.entry.created_at, slot.seq,
                   slot.entry.key, slot.entry.byte_size};
}

CacheEntry CacheStore::detach(std::unordered_map<CacheKey, Slot>::iterator it) {
    lru_.erase(rank_of(it->second));
    total_bytes_ -= it->second.entry.byte_size;

    if (it->second.entry.source_file_path) {
        auto path_it = by_path_.find(*it->second.entry.source_file_path);
        if (path_it != by_path_.end()) {
            path_it->second.erase(it->first);
            if (path_it->second.empty()) by_path_.erase(path_it);
        }
    }

    CacheEntry entry = std::move(it->second.entry);
    entries_.erase(it);
    return entry;
}

QueryResult CacheStore::get(const CacheKey& key, std::vector<InvalidationEvent>& events) {
    uint64_t now = clock_();
    QueryResult result;

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        counters_.record_miss(now);
        return result;
    }

    if (is_expired(it->second.entry, now)) {
        InvalidationEvent ev;
        ev.key = key;
        ev.reason = InvalidationReason::Expired;
        ev.timestamp = now;
        ev.entry = detach(it);
        events.push_back(std::move(ev));
        counters_.record_eviction(now);
        counters_.record_miss(now);
        return result;
    }

    // Re-rank: the LRU position depends on last_accessed_at.
    lru_.erase(rank_of(it->second));
    it->second.entry.last_accessed_at = now;
    it->second.entry.access_count++;
    lru_.insert(rank_of(it->second));
    counters_.record_hit(now);

    result.found = true;
    result.hit = true;
    result.value = it->second.entry.value;
    result.entry = it->second.entry;
    return result;
}

void CacheStore::put(const CacheKey& key,
                     std::string value,
                     std::vector<InvalidationEvent>& events,
                     std::optional<std::string> source_file_path,
                     std::optional<uint64_t> source_file_modified_at) {
    uint64_t now = clock_();

    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        detach(existing);
    }

    Slot slot;
    slot.seq = next_seq_++;
    slot.entry.key = key;
    slot.entry.byte_size = value.size();
    slot.entry.value = std::move(value);
    slot.entry.created_at = now;
    slot.entry.last_accessed_at = now;
    slot.entry.access_count = 0;
    slot.entry.source_file_path = std::move(source_file_path);
    slot.entry.source_file_modified_at = source_file_modified_at;

    lru_.insert(rank_of(slot));
    total_bytes_ += slot.entry.byte_size;
    if (slot.entry.source_file_path) {
        by_path_[*slot.entry.source_file_path].insert(key);
    }
    entries_.emplace(key, std::move(slot));
    counters_.touch(now);

    for (const auto& victim : policy_.select_victims(lru_, entries_.size(), total_bytes_)) {
        auto it = entries_.find(victim);
        if (it == entries_.end()) continue;
        InvalidationEvent ev;
        ev.key = victim;
        ev.reason = InvalidationReason::CapacityLimit;
        ev.timestamp = now;
        ev.entry = detach(it);
        events.push_back(std::move(ev));
        counters_.record_eviction(now);
    }
}

std::optional<CacheEntry> CacheStore::remove(const CacheKey& key, InvalidationReason reason) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;

    uint64_t now = clock_();
    CacheEntry entry = detach(it);
    if (reason == InvalidationReason::Expired || reason == InvalidationReason::CapacityLimit) {
        counters_.record_eviction(now);
    } else {
        counters_.record_invalidations(1, now);
    }
    return entry;
}

ClearResult CacheStore::clear(const std::string& reason, std::vector<CacheKey>& cleared_keys) {
    ClearResult result;
    result.reason = reason;
    result.before_size = entries_.size();
    result.before_byte_size = total_bytes_;

    cleared_keys.reserve(cleared_keys.size() + entries_.size());
    for (const auto& [key, slot] : entries_) {
        cleared_keys.push_back(key);
    }

    entries_.clear();
    lru_.clear();
    by_path_.clear();
    total_bytes_ = 0;

    result.cleared_count = result.before_size;
    result.after_size = 0;
    result.after_byte_size = 0;
    counters_.record_invalidations(result.cleared_count, clock_());
    return result;
}

size_t CacheStore::sweep_expired(std::vector<InvalidationEvent>& events) {
    if (limits_.ttl_ms == 0) return 0;
    uint64_t now = clock_();

    std::vector<CacheKey> expired;
    for (const auto& [key, slot] : entries_) {
        if (is_expired(slot.entry, now)) expired.push_back(key);
    }

    for (const auto& key : expired) {
        InvalidationEvent ev;
        ev.key = key;
        ev.reason = InvalidationReason::Expired;
        ev.timestamp = now;
        ev.entry = detach(entries_.find(key));
        events.push_back(std::move(ev));
        counters_.record_eviction(now);
    }
    return expired.size();
}

QueryResult CacheStore::peek(const CacheKey& key) const {
    QueryResult result;
    auto it = entries_.find(key);
    if (it == entries_.end() || is_expired(it->second.entry, clock_())) return result;

    result.found = true;
    result.value = it->second.entry.value;
    result.entry = it->second.entry;
    return result;
}

const CacheEntry* CacheStore::find(const CacheKey& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second.entry;
}

bool CacheStore::has(const CacheKey& key) const {
    auto it = entries_.find(key);
    return it != entries_.end() && !is_expired(it->second.entry, clock_());
}

std::vector<CacheKey> CacheStore::keys_for_path(const std::string& path) const {
    auto it = by_path_.find(path);
    if (it == by_path_.end()) return {};
    return std::vector<CacheKey>(it->second.begin(), it->second.end());
}

std::vector<CacheKey> CacheStore::keys() const {
    std::vector<CacheKey> out;
    out.reserve(lru_.size());
    // Most recently used first.
    for (auto it = lru_.rbegin(); it != lru_.rend(); ++it) {
        out.push_back(it->key);
    }
    return out;
}

std::vector<CacheItemMetadata> CacheStore::items() const {
    uint64_t now = clock_();
    std::vector<CacheItemMetadata> out;
    out.reserve(entries_.size());

    for (auto it = lru_.rbegin(); it != lru_.rend(); ++it) {
        const CacheEntry& e = entries_.at(it->key).entry;
        CacheItemMetadata m;
        m.key = e.key;
        m.file_path = e.source_file_path;
        m.created_at = e.created_at;
        m.last_accessed_at = e.last_accessed_at;
        m.access_count = e.access_count;
        m.size = e.byte_size;
        m.expired = is_expired(e, now);
        if (limits_.ttl_ms > 0) {
            uint64_t age = now > e.created_at ? now - e.created_at : 0;
            m.remaining_ttl_ms = age >= limits_.ttl_ms ? 0 : limits_.ttl_ms - age;
        }
        out.push_back(std::move(m));
    }
    return out;
}

CacheStatistics CacheStore::statistics() const {
    return counters_.snapshot(entries_.size(), total_bytes_, limits_);
}

void CacheStore::reset_statistics() {
    counters_.reset(clock_());
}

} // namespace docserve

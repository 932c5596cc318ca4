#include "render_cache.hpp"
#include "fingerprint.hpp"
#include "errors.hpp"
#include "cache_stats.hpp"
#include "../util.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace docserve {

RenderCache::RenderCache(const CacheLimits& limits, CacheClock clock)
    : limits_(limits)
    , clock_(clock ? std::move(clock) : CacheClock(epoch_millis))
    , store_(limits_, clock_)
    , coordinator_(store_, limits_.file_based_invalidation)
{
    std::cerr << "[cache] Render cache ready: max_entries=" << limits_.max_entries
              << " max_total_bytes=" << limits_.max_total_bytes
              << " ttl_ms=" << limits_.ttl_ms
              << " file_invalidation=" << (limits_.file_based_invalidation ? "on" : "off")
              << "\n";
}

void RenderCache::publish(const std::vector<InvalidationEvent>& events) {
    for (const auto& ev : events) {
        bus_.publish(ev);
    }
}

void RenderCache::discard_in_flight_for_path(const std::string& path) {
    for (auto& [key, flight] : in_flight_) {
        if (flight->file_path && *flight->file_path == path) flight->discard = true;
    }
}

void RenderCache::discard_in_flight_for_change(const FileChangeEvent& change) {
    if (change.kind == FileChangeKind::Add) return;
    for (auto& [key, flight] : in_flight_) {
        if (!flight->file_path || *flight->file_path != change.path) continue;
        if (change.kind == FileChangeKind::Unlink ||
            flight->file_modified_at != change.new_modified_at) {
            flight->discard = true;
        }
    }
}

// ── Coalescing lookup ───────────────────────────────────────────

std::string RenderCache::get_or_compute(const CacheKeyParams& params,
                                        const Compute& compute,
                                        std::optional<uint64_t> source_file_modified_at,
                                        bool* from_cache) {
    CacheKey key = fingerprint(params);
    return get_or_compute_key(key, compute, params.file_path, source_file_modified_at, from_cache);
}

std::string RenderCache::get_or_compute_key(const CacheKey& key,
                                            const Compute& compute,
                                            std::optional<std::string> source_file_path,
                                            std::optional<uint64_t> source_file_modified_at,
                                            bool* from_cache) {
    std::vector<InvalidationEvent> expired;
    std::shared_ptr<InFlight> flight;
    std::promise<std::string> promise;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = store_.get(key, expired);
        if (found.found) {
            if (from_cache) *from_cache = true;
            return std::move(*found.value);
        }

        auto it = in_flight_.find(key);
        if (it != in_flight_.end()) {
            flight = it->second;
        } else {
            flight = std::make_shared<InFlight>();
            flight->result = promise.get_future().share();
            flight->file_path = std::move(source_file_path);
            flight->file_modified_at = source_file_modified_at;
            in_flight_.emplace(key, flight);
            leader = true;
        }
    }
    publish(expired);
    if (from_cache) *from_cache = false;

    if (!leader) {
        return flight->result.get();
    }

    std::string value;
    std::optional<ComputeFailed> failure;
    try {
        value = compute();
    } catch (const std::exception& e) {
        failure.emplace("compute failed for key " + key + ": " + e.what());
    } catch (...) {
        failure.emplace("compute failed for key " + key + ": unknown exception");
    }

    if (failure) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(key);
        }
        promise.set_exception(std::make_exception_ptr(*failure));
        std::cerr << "[cache] " << failure->what() << "\n";
        throw *failure;
    }

    std::vector<InvalidationEvent> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(key);
        if (!flight->discard) {
            try {
                store_.put(key, value, evicted, flight->file_path, flight->file_modified_at);
            } catch (const std::exception& e) {
                std::cerr << "[cache] Returning uncached value for key " << key
                          << ": " << e.what() << "\n";
            }
        }
    }
    promise.set_value(value);
    publish(evicted);
    return value;
}

// ── Direct access ───────────────────────────────────────────────

QueryResult RenderCache::peek(const CacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.peek(key);
}

QueryResult RenderCache::get(const CacheKey& key) {
    std::vector<InvalidationEvent> expired;
    QueryResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = store_.get(key, expired);
    }
    publish(expired);
    return result;
}

CacheKey RenderCache::put(const CacheKeyParams& params,
                          std::string value,
                          std::optional<uint64_t> source_file_modified_at) {
    CacheKey key = fingerprint(params);
    put_key(key, std::move(value), params.file_path, source_file_modified_at);
    return key;
}

void RenderCache::put_key(const CacheKey& key,
                          std::string value,
                          std::optional<std::string> source_file_path,
                          std::optional<uint64_t> source_file_modified_at) {
    std::vector<InvalidationEvent> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store_.put(key, std::move(value), evicted,
                   std::move(source_file_path), source_file_modified_at);
    }
    publish(evicted);
}

// ── Invalidation ────────────────────────────────────────────────

bool RenderCache::invalidate(const CacheKey& key) {
    std::optional<InvalidationEvent> ev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ev = coordinator_.invalidate(key);
        auto it = in_flight_.find(key);
        if (it != in_flight_.end()) it->second->discard = true;
    }
    if (!ev) return false;
    bus_.publish(*ev);
    return true;
}

size_t RenderCache::invalidate_by_file_path(const std::string& path) {
    std::vector<InvalidationEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events = coordinator_.invalidate_by_file_path(path);
        discard_in_flight_for_path(path);
    }
    publish(events);
    return events.size();
}

size_t RenderCache::invalidate_all(const std::vector<std::string>& paths) {
    std::optional<InvalidationEvent> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch = coordinator_.invalidate_all(paths);
        for (const auto& path : paths) discard_in_flight_for_path(path);
    }
    if (!batch) return 0;
    bus_.publish(*batch);
    return batch->keys.size();
}

size_t RenderCache::on_file_change(const FileChangeEvent& change) {
    std::vector<InvalidationEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events = coordinator_.on_file_change(change);
        if (coordinator_.file_based_invalidation()) discard_in_flight_for_change(change);
    }
    publish(events);
    return events.size();
}

BatchOperationResult RenderCache::invalidate_keys(const std::vector<CacheKey>& keys) {
    std::optional<InvalidationEvent> batch;
    BatchOperationResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = coordinator_.invalidate_keys(keys, batch);
        for (const auto& key : keys) {
            auto it = in_flight_.find(key);
            if (it != in_flight_.end()) it->second->discard = true;
        }
    }
    if (batch) bus_.publish(*batch);
    return result;
}

ClearResult RenderCache::clear(const std::string& reason) {
    InvalidationEvent batch;
    ClearResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = store_.clear(reason, batch.keys);
        for (auto& [key, flight] : in_flight_) flight->discard = true;
        batch.timestamp = store_.now();
    }
    if (!batch.keys.empty()) {
        std::cerr << "[cache] Cleared " << result.cleared_count << " entries ("
                  << reason << ")\n";
        batch.reason = InvalidationReason::Batch;
        bus_.publish(batch);
    }
    return result;
}

size_t RenderCache::sweep_expired() {
    std::vector<InvalidationEvent> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store_.sweep_expired(expired);
    }
    publish(expired);
    return expired.size();
}

// ── Warmup ──────────────────────────────────────────────────────

WarmupResult RenderCache::warmup(const std::vector<WarmupItem>& items) {
    auto start = std::chrono::steady_clock::now();
    WarmupResult result;
    result.keys_count = items.size();

    for (const auto& item : items) {
        try {
            get_or_compute(item.params, item.compute, item.source_file_modified_at);
            result.success_count++;
        } catch (const std::exception& e) {
            result.failure_count++;
            std::cerr << "[cache] Warmup item failed ("
                      << item.params.file_path.value_or("<no path>") << "): "
                      << e.what() << "\n";
        }
    }

    result.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
    return result;
}

// ── Statistics and inspection ───────────────────────────────────

CacheStatistics RenderCache::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.statistics();
}

HealthStatus RenderCache::health_status() const {
    CacheStatistics stats = statistics();
    return evaluate_health(stats, limits_);
}

void RenderCache::reset_statistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.reset_statistics();
}

std::vector<CacheItemMetadata> RenderCache::items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.items();
}

std::vector<CacheKey> RenderCache::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.keys();
}

bool RenderCache::has(const CacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.has(key);
}

size_t RenderCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.size();
}

uint64_t RenderCache::subscribe(CacheEventListener listener) {
    return bus_.subscribe(std::move(listener));
}

bool RenderCache::unsubscribe(uint64_t id) {
    return bus_.unsubscribe(id);
}

} // namespace docserve

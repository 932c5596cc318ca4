#pragma once
#include "types.hpp"
#include "cache_store.hpp"
#include "cache_events.hpp"
#include "invalidation.hpp"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <cstdint>

namespace docserve {

// Thread-safe front door over CacheStore. All store mutation happens under
// one mutex; listeners are called after it is released.
//
// get_or_compute guarantees at most one concurrent compute per key: callers
// that miss while a computation for the same key is running wait for it and
// receive its result (or its ComputeFailed). Failures are never cached.
class RenderCache {
public:
    using Compute = std::function<std::string()>;

    struct WarmupItem {
        CacheKeyParams params;
        Compute compute;
        std::optional<uint64_t> source_file_modified_at;
    };

    // Throws CapacityMisconfigured on a zero limit.
    explicit RenderCache(const CacheLimits& limits = CacheLimits{}, CacheClock clock = nullptr);

    // Fingerprint `params`, then get or compute. The entry is associated with
    // params.file_path. from_cache (optional) reports whether the value came
    // from the store. Throws InvalidKeyParams or ComputeFailed.
    std::string get_or_compute(const CacheKeyParams& params,
                               const Compute& compute,
                               std::optional<uint64_t> source_file_modified_at = std::nullopt,
                               bool* from_cache = nullptr);

    std::string get_or_compute_key(const CacheKey& key,
                                   const Compute& compute,
                                   std::optional<std::string> source_file_path = std::nullopt,
                                   std::optional<uint64_t> source_file_modified_at = std::nullopt,
                                   bool* from_cache = nullptr);

    // Never computes, never waits, never counts as an access.
    QueryResult peek(const CacheKey& key) const;

    QueryResult get(const CacheKey& key);

    // Returns the key the value was stored under.
    CacheKey put(const CacheKeyParams& params,
                 std::string value,
                 std::optional<uint64_t> source_file_modified_at = std::nullopt);

    void put_key(const CacheKey& key,
                 std::string value,
                 std::optional<std::string> source_file_path = std::nullopt,
                 std::optional<uint64_t> source_file_modified_at = std::nullopt);

    // Returns true if the key was present.
    bool invalidate(const CacheKey& key);
    // These return the number of entries removed. An in-flight compute for
    // an affected key still answers its waiters but is not stored.
    size_t invalidate_by_file_path(const std::string& path);
    size_t invalidate_all(const std::vector<std::string>& paths);
    size_t on_file_change(const FileChangeEvent& change);
    BatchOperationResult invalidate_keys(const std::vector<CacheKey>& keys);

    ClearResult clear(const std::string& reason = "manual");
    size_t sweep_expired();

    // Pre-populate entries one by one. A failing item is logged and counted;
    // the batch carries on.
    WarmupResult warmup(const std::vector<WarmupItem>& items);

    CacheStatistics statistics() const;
    HealthStatus health_status() const;
    void reset_statistics();

    std::vector<CacheItemMetadata> items() const;
    std::vector<CacheKey> keys() const;
    bool has(const CacheKey& key) const;
    size_t size() const;

    uint64_t subscribe(CacheEventListener listener);
    bool unsubscribe(uint64_t id);

    const CacheLimits& limits() const { return limits_; }

private:
    struct InFlight {
        std::shared_future<std::string> result;
        std::optional<std::string> file_path;
        std::optional<uint64_t> file_modified_at;
        bool discard = false;  // invalidated while computing; do not insert
    };

    // Callers hold mutex_.
    void discard_in_flight_for_path(const std::string& path);
    void discard_in_flight_for_change(const FileChangeEvent& change);

    void publish(const std::vector<InvalidationEvent>& events);

    CacheLimits limits_;
    CacheClock clock_;
    mutable std::mutex mutex_;
    CacheStore store_;
    InvalidationCoordinator coordinator_;
    CacheEventBus bus_;
    std::unordered_map<CacheKey, std::shared_ptr<InFlight>> in_flight_;
};

} // namespace docserve

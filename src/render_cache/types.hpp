#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <cstdint>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace docserve {

using CacheKey = std::string;

// Milliseconds since the epoch. Injected so tests can drive time by hand.
using CacheClock = std::function<uint64_t()>;

// Fixed for the lifetime of a cache instance.
struct CacheLimits {
    size_t max_entries = 1000;
    size_t max_total_bytes = 10 * 1024 * 1024;  // 10 MB
    uint64_t ttl_ms = 30 * 60 * 1000;           // 30 minutes, 0 = never expire
    bool file_based_invalidation = true;
    bool statistics = true;
};

struct CacheEntry {
    std::string value;
    CacheKey key;
    uint64_t created_at = 0;
    uint64_t last_accessed_at = 0;
    uint64_t access_count = 0;
    std::optional<std::string> source_file_path;
    std::optional<uint64_t> source_file_modified_at;
    size_t byte_size = 0;  // set once from value at insertion
};

enum class InvalidationReason { Manual, FileChanged, Expired, CapacityLimit, Batch };

// Stable lowercase name ("manual", "file_changed", ...)
const char* reason_name(InvalidationReason reason);

struct InvalidationEvent {
    CacheKey key;  // empty for Batch events
    InvalidationReason reason = InvalidationReason::Manual;
    uint64_t timestamp = 0;
    std::optional<CacheEntry> entry;  // snapshot of the removed entry
    std::vector<CacheKey> keys;       // every removed key (Batch only)
};

using CacheEventListener = std::function<void(const InvalidationEvent&)>;

struct QueryResult {
    bool found = false;
    std::optional<std::string> value;
    std::optional<CacheEntry> entry;
    bool hit = false;
};

struct ClearResult {
    size_t before_size = 0;
    size_t before_byte_size = 0;
    size_t after_size = 0;
    size_t after_byte_size = 0;
    size_t cleared_count = 0;
    std::string reason;
};

struct WarmupResult {
    size_t keys_count = 0;
    size_t success_count = 0;
    size_t failure_count = 0;
    uint64_t duration_ms = 0;
};

struct BatchOperationResult {
    size_t success_count = 0;
    size_t failure_count = 0;
    std::vector<CacheKey> failed_keys;
    uint64_t duration_ms = 0;
};

struct CacheStatistics {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t invalidations = 0;
    uint64_t total_access = 0;
    double hit_rate = 0.0;
    size_t current_entry_count = 0;
    size_t current_total_bytes = 0;
    size_t max_entries = 0;
    size_t max_total_bytes = 0;
    uint64_t created_at = 0;
    uint64_t last_updated_at = 0;
};

struct HealthStatus {
    bool healthy = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    double utilization = 0.0;
    double memory_utilization = 0.0;
    double hit_rate = 0.0;
};

// Everything that influences a rendered artifact. options and metadata must be
// JSON objects or null.
struct CacheKeyParams {
    std::string source;
    std::optional<std::string> file_path;
    nlohmann::json options;
    std::optional<std::string> theme;
    nlohmann::json metadata;
};

struct CacheItemMetadata {
    CacheKey key;
    std::optional<std::string> file_path;
    uint64_t created_at = 0;
    uint64_t last_accessed_at = 0;
    uint64_t access_count = 0;
    size_t size = 0;
    bool expired = false;
    std::optional<uint64_t> remaining_ttl_ms;  // absent when TTL is disabled
};

enum class FileChangeKind { Add, Change, Unlink };

// Pushed by the filesystem watcher. new_modified_at is absent for Unlink.
struct FileChangeEvent {
    std::string path;
    FileChangeKind kind = FileChangeKind::Change;
    std::optional<uint64_t> new_modified_at;
};

} // namespace docserve

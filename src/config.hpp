#pragma once
#include "render_cache/types.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace docserve {

struct CacheConfig {
    bool enabled = true;
    uint64_t max_entries = 1000;
    uint64_t max_total_bytes = 10 * 1024 * 1024;
    uint64_t ttl_ms = 30 * 60 * 1000;    // 0 = never expire
    bool file_based_invalidation = true;
    bool statistics = true;
    uint64_t sweep_interval_ms = 60000;  // 0 = no periodic sweep

    CacheLimits limits() const;
};

struct WatcherConfig {
    bool enabled = true;
    uint32_t poll_interval_ms = 500;
    std::vector<std::string> extensions = {".md", ".mmd", ".txt", ".json", ".yml", ".yaml"};
    std::vector<std::string> exclude_dirs = {
        "node_modules", ".git", "dist", "build", "coverage", ".cache", ".next", "out"};
};

struct Config {
    std::string root = ".";
    std::string listen = "127.0.0.1:3000";
    uint32_t workers = 4;

    CacheConfig cache;
    WatcherConfig watcher;

    // Load from ~/.docserve/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Populate from an already merged JSON document. Wrongly typed keys
    // keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // Apply DOCSERVE_* environment overrides.
    void apply_env();
};

} // namespace docserve

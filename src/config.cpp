#include "config.hpp"
#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace docserve {

CacheLimits CacheConfig::limits() const {
    CacheLimits l;
    l.max_entries = static_cast<size_t>(max_entries);
    l.max_total_bytes = static_cast<size_t>(max_total_bytes);
    l.ttl_ms = ttl_ms;
    l.file_based_invalidation = file_based_invalidation;
    l.statistics = statistics;
    return l;
}

nlohmann::json Config::defaults_json() {
    WatcherConfig w;
    return {
        {"root", "."},
        {"listen", "127.0.0.1:3000"},
        {"workers", 4},
        {"cache", {
            {"enabled", true},
            {"max_entries", 1000},
            {"max_total_bytes", 10 * 1024 * 1024},
            {"ttl_ms", 30 * 60 * 1000},
            {"file_based_invalidation", true},
            {"statistics", true},
            {"sweep_interval_ms", 60000}
        }},
        {"watcher", {
            {"enabled", true},
            {"poll_interval_ms", 500},
            {"extensions", w.extensions},
            {"exclude_dirs", w.exclude_dirs}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static std::vector<std::string> string_list(const nlohmann::json& arr) {
    std::vector<std::string> out;
    for (const auto& v : arr) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("root") && j["root"].is_string())
        cfg.root = j["root"].get<std::string>();
    if (j.contains("listen") && j["listen"].is_string())
        cfg.listen = j["listen"].get<std::string>();
    if (j.contains("workers") && j["workers"].is_number_unsigned())
        cfg.workers = j["workers"].get<uint32_t>();

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.cache.enabled = c["enabled"].get<bool>();
        if (c.contains("max_entries") && c["max_entries"].is_number_unsigned())
            cfg.cache.max_entries = c["max_entries"].get<uint64_t>();
        if (c.contains("max_total_bytes") && c["max_total_bytes"].is_number_unsigned())
            cfg.cache.max_total_bytes = c["max_total_bytes"].get<uint64_t>();
        if (c.contains("ttl_ms") && c["ttl_ms"].is_number_unsigned())
            cfg.cache.ttl_ms = c["ttl_ms"].get<uint64_t>();
        if (c.contains("file_based_invalidation") && c["file_based_invalidation"].is_boolean())
            cfg.cache.file_based_invalidation = c["file_based_invalidation"].get<bool>();
        if (c.contains("statistics") && c["statistics"].is_boolean())
            cfg.cache.statistics = c["statistics"].get<bool>();
        if (c.contains("sweep_interval_ms") && c["sweep_interval_ms"].is_number_unsigned())
            cfg.cache.sweep_interval_ms = c["sweep_interval_ms"].get<uint64_t>();
    }

    if (j.contains("watcher") && j["watcher"].is_object()) {
        auto& w = j["watcher"];
        if (w.contains("enabled") && w["enabled"].is_boolean())
            cfg.watcher.enabled = w["enabled"].get<bool>();
        if (w.contains("poll_interval_ms") && w["poll_interval_ms"].is_number_unsigned())
            cfg.watcher.poll_interval_ms = w["poll_interval_ms"].get<uint32_t>();
        if (w.contains("extensions") && w["extensions"].is_array())
            cfg.watcher.extensions = string_list(w["extensions"]);
        if (w.contains("exclude_dirs") && w["exclude_dirs"].is_array())
            cfg.watcher.exclude_dirs = string_list(w["exclude_dirs"]);
    }

    return cfg;
}

static bool env_u64(const char* name, uint64_t& out) {
    const char* v = std::getenv(name);
    if (!v) return false;
    // stoull accepts a sign and wraps negative values around.
    if (!std::isdigit(static_cast<unsigned char>(v[0]))) {
        std::cerr << "[config] Ignoring " << name << "=" << v << ": not a number\n";
        return false;
    }
    try {
        size_t used = 0;
        unsigned long long parsed = std::stoull(v, &used);
        if (used != std::string(v).size()) throw std::invalid_argument("trailing characters");
        out = static_cast<uint64_t>(parsed);
        return true;
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring " << name << "=" << v << ": not a number\n";
        return false;
    }
}

void Config::apply_env() {
    if (const char* v = std::getenv("DOCSERVE_ROOT"))
        root = v;
    if (const char* v = std::getenv("DOCSERVE_LISTEN"))
        listen = v;
    env_u64("DOCSERVE_CACHE_TTL_MS", cache.ttl_ms);
    env_u64("DOCSERVE_CACHE_MAX_ENTRIES", cache.max_entries);
    env_u64("DOCSERVE_CACHE_MAX_BYTES", cache.max_total_bytes);
}

Config Config::load() {
    std::string config_path = expand_home("~/.docserve/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    cfg.apply_env();
    return cfg;
}

} // namespace docserve

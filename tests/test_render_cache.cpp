#include <catch2/catch.hpp>
#include "render_cache/render_cache.hpp"
#include "render_cache/fingerprint.hpp"
#include "render_cache/errors.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace docserve;

static CacheLimits front_limits(size_t entries = 100, size_t bytes = 1024 * 1024,
                                uint64_t ttl_ms = 0) {
    CacheLimits l;
    l.max_entries = entries;
    l.max_total_bytes = bytes;
    l.ttl_ms = ttl_ms;
    return l;
}

static CacheKeyParams doc(const std::string& source,
                          const std::string& path = "guide.md",
                          const std::optional<std::string>& theme = std::nullopt) {
    CacheKeyParams p;
    p.source = source;
    p.file_path = path;
    p.theme = theme;
    return p;
}

// ── get_or_compute ──────────────────────────────────────────────

TEST_CASE("RenderCache: second request is served from cache", "[render_cache]") {
    ManualClock clock;
    RenderCache cache(front_limits(), clock.clock());
    int computed = 0;
    auto render = [&]() { computed++; return std::string("<h1>Hi</h1>"); };

    bool from_cache = true;
    REQUIRE(cache.get_or_compute(doc("# Hi"), render, 10, &from_cache) == "<h1>Hi</h1>");
    REQUIRE_FALSE(from_cache);

    REQUIRE(cache.get_or_compute(doc("# Hi"), render, 10, &from_cache) == "<h1>Hi</h1>");
    REQUIRE(from_cache);
    REQUIRE(computed == 1);

    auto s = cache.statistics();
    REQUIRE(s.hits == 1);
    REQUIRE(s.misses == 1);
    REQUIRE(s.total_access == 2);
    REQUIRE(s.hit_rate == 0.5);
}

TEST_CASE("RenderCache: entry is stored under the fingerprint", "[render_cache]") {
    RenderCache cache(front_limits());
    auto params = doc("body", "a.md", std::string("dark"));
    cache.get_or_compute(params, []() { return std::string("html"); }, 5);

    auto key = fingerprint(params);
    auto r = cache.peek(key);
    REQUIRE(r.found);
    REQUIRE(r.entry->source_file_path.value_or("") == "a.md");
    REQUIRE(r.entry->source_file_modified_at.value_or(0) == 5);
    REQUIRE(cache.has(key));
    REQUIRE(cache.keys() == std::vector<CacheKey>{key});
}

TEST_CASE("RenderCache: different themes are cached separately", "[render_cache]") {
    RenderCache cache(front_limits());
    int computed = 0;
    auto render = [&]() { return "v" + std::to_string(++computed); };

    REQUIRE(cache.get_or_compute(doc("x", "a.md", std::string("light")), render) == "v1");
    REQUIRE(cache.get_or_compute(doc("x", "a.md", std::string("dark")), render) == "v2");
    REQUIRE(cache.get_or_compute(doc("x", "a.md", std::string("light")), render) == "v1");
    REQUIRE(cache.size() == 2);
}

TEST_CASE("RenderCache: invalid key params never reach compute", "[render_cache]") {
    RenderCache cache(front_limits());
    auto params = doc("x");
    params.options = nlohmann::json::array({1});
    bool called = false;

    REQUIRE_THROWS_AS(cache.get_or_compute(params, [&]() { called = true; return std::string(); }),
                      InvalidKeyParams);
    REQUIRE_FALSE(called);
    REQUIRE(cache.size() == 0);
}

TEST_CASE("RenderCache: zero capacity is rejected", "[render_cache]") {
    REQUIRE_THROWS_AS(RenderCache(front_limits(0)), CapacityMisconfigured);
}

// ── Failures ────────────────────────────────────────────────────

TEST_CASE("RenderCache: compute failure is wrapped and not cached", "[render_cache]") {
    RenderCache cache(front_limits());
    int attempts = 0;

    REQUIRE_THROWS_AS(cache.get_or_compute_key("k", [&]() -> std::string {
        attempts++;
        throw std::runtime_error("mermaid exploded");
    }), ComputeFailed);
    REQUIRE(cache.size() == 0);

    try {
        cache.get_or_compute_key("k", []() -> std::string { throw std::runtime_error("again"); });
        FAIL("expected ComputeFailed");
    } catch (const ComputeFailed& e) {
        REQUIRE(std::string(e.what()).find("again") != std::string::npos);
    }

    REQUIRE(cache.get_or_compute_key("k", [&]() { attempts++; return std::string("ok"); }) == "ok");
    REQUIRE(attempts == 2);
    REQUIRE(cache.size() == 1);
}

// ── Coalescing ──────────────────────────────────────────────────

TEST_CASE("RenderCache: concurrent misses compute once", "[render_cache]") {
    RenderCache cache(front_limits());
    std::atomic<int> computed{0};
    auto render = [&]() {
        computed++;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return std::string("<p>shared</p>");
    };

    const int n = 8;
    std::vector<std::string> results(n);
    std::vector<std::thread> threads;
    for (int i = 0; i < n; ++i) {
        threads.emplace_back([&, i]() { results[i] = cache.get_or_compute(doc("shared"), render); });
    }
    for (auto& t : threads) t.join();

    REQUIRE(computed.load() == 1);
    for (const auto& r : results) REQUIRE(r == "<p>shared</p>");

    auto s = cache.statistics();
    REQUIRE(s.total_access == static_cast<uint64_t>(n));
    REQUIRE(s.hits + s.misses == s.total_access);
    REQUIRE(cache.size() == 1);
}

TEST_CASE("RenderCache: coalesced waiters share a failure", "[render_cache]") {
    RenderCache cache(front_limits());
    std::atomic<int> failures{0};
    auto render = [&]() -> std::string {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        throw std::runtime_error("syntax error");
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() {
            try {
                cache.get_or_compute_key("k", render);
            } catch (const ComputeFailed&) {
                failures++;
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(failures.load() == 4);
    REQUIRE(cache.size() == 0);
}

TEST_CASE("RenderCache: independent keys compute in parallel", "[render_cache]") {
    RenderCache cache(front_limits());
    std::promise<void> a_started;
    std::promise<void> release_a;
    auto release = release_a.get_future().share();
    auto started = a_started.get_future();

    std::thread slow([&]() {
        cache.get_or_compute_key("a", [&]() {
            a_started.set_value();
            release.wait();
            return std::string("A");
        });
    });
    started.wait();

    // Would deadlock if "a" blocked other keys.
    REQUIRE(cache.get_or_compute_key("b", []() { return std::string("B"); }) == "B");

    release_a.set_value();
    slow.join();
    REQUIRE(cache.size() == 2);
}

// ── Invalidation racing a compute ───────────────────────────────

struct PausedCompute {
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    RenderCache::Compute fn(const std::string& value) {
        return [this, value]() {
            started.set_value();
            released.wait();
            return value;
        };
    }
};

TEST_CASE("RenderCache: file invalidated mid-render is not cached", "[render_cache]") {
    RenderCache cache(front_limits());
    PausedCompute pc;
    auto started = pc.started.get_future();
    std::string result;

    std::thread t([&]() { result = cache.get_or_compute(doc("old text", "a.md"), pc.fn("<p>old</p>"), 100); });
    started.wait();
    cache.invalidate_by_file_path("a.md");
    pc.release.set_value();
    t.join();

    REQUIRE(result == "<p>old</p>");
    REQUIRE(cache.size() == 0);
}

TEST_CASE("RenderCache: watcher change mid-render is not cached", "[render_cache]") {
    RenderCache cache(front_limits());
    PausedCompute pc;
    auto started = pc.started.get_future();

    std::thread t([&]() { cache.get_or_compute(doc("text", "a.md"), pc.fn("html"), 100); });
    started.wait();
    cache.on_file_change(FileChangeEvent{"a.md", FileChangeKind::Change, 200});
    pc.release.set_value();
    t.join();

    REQUIRE(cache.size() == 0);
}

TEST_CASE("RenderCache: matching mtime notification keeps the render", "[render_cache]") {
    RenderCache cache(front_limits());
    PausedCompute pc;
    auto started = pc.started.get_future();

    std::thread t([&]() { cache.get_or_compute(doc("text", "a.md"), pc.fn("html"), 100); });
    started.wait();
    cache.on_file_change(FileChangeEvent{"a.md", FileChangeKind::Change, 100});
    pc.release.set_value();
    t.join();

    REQUIRE(cache.size() == 1);
}

TEST_CASE("RenderCache: clear mid-render is not cached", "[render_cache]") {
    RenderCache cache(front_limits());
    PausedCompute pc;
    auto started = pc.started.get_future();

    std::thread t([&]() { cache.get_or_compute_key("k", pc.fn("html")); });
    started.wait();
    cache.clear();
    pc.release.set_value();
    t.join();

    REQUIRE(cache.size() == 0);
}

// ── TTL through the front door ──────────────────────────────────

TEST_CASE("RenderCache: expired entry is recomputed", "[render_cache]") {
    ManualClock clock;
    RenderCache cache(front_limits(100, 1024, 1000), clock.clock());
    int computed = 0;
    auto render = [&]() { return "v" + std::to_string(++computed); };

    REQUIRE(cache.get_or_compute_key("k", render) == "v1");
    clock.advance(1000);
    REQUIRE(cache.get_or_compute_key("k", render) == "v1");
    clock.advance(1);
    REQUIRE(cache.get_or_compute_key("k", render) == "v2");

    auto s = cache.statistics();
    REQUIRE(s.evictions == 1);
    REQUIRE(s.misses == 2);
    REQUIRE(s.hits == 1);
}

TEST_CASE("RenderCache: sweep_expired publishes expiry events", "[render_cache]") {
    ManualClock clock;
    RenderCache cache(front_limits(100, 1024, 1000), clock.clock());
    std::vector<InvalidationReason> reasons;
    cache.subscribe([&](const InvalidationEvent& ev) { reasons.push_back(ev.reason); });

    cache.put_key("a", "1");
    cache.put_key("b", "2");
    clock.advance(1001);

    REQUIRE(cache.sweep_expired() == 2);
    REQUIRE(reasons == std::vector<InvalidationReason>{InvalidationReason::Expired,
                                                       InvalidationReason::Expired});
    REQUIRE(cache.size() == 0);
}

// ── Direct access ───────────────────────────────────────────────

TEST_CASE("RenderCache: peek never computes or counts", "[render_cache]") {
    RenderCache cache(front_limits());
    REQUIRE_FALSE(cache.peek("k").found);

    cache.put_key("k", "v");
    auto r = cache.peek("k");
    REQUIRE(r.found);
    REQUIRE(r.value.value_or("") == "v");
    REQUIRE(cache.statistics().total_access == 0);
}

TEST_CASE("RenderCache: put and get by params", "[render_cache]") {
    RenderCache cache(front_limits());
    auto key = cache.put(doc("src", "a.md"), "<p>src</p>", 7);

    auto r = cache.get(key);
    REQUIRE(r.found);
    REQUIRE(r.hit);
    REQUIRE(r.value.value_or("") == "<p>src</p>");
    REQUIRE(r.entry->source_file_path.value_or("") == "a.md");

    REQUIRE(cache.invalidate_by_file_path("a.md") == 1);
    REQUIRE_FALSE(cache.get(key).found);
}

TEST_CASE("RenderCache: items lists metadata", "[render_cache]") {
    ManualClock clock;
    RenderCache cache(front_limits(100, 1024, 5000), clock.clock());
    cache.put_key("k", "12345", std::string("a.md"));
    clock.advance(1000);

    auto items = cache.items();
    REQUIRE(items.size() == 1);
    REQUIRE(items[0].key == "k");
    REQUIRE(items[0].size == 5);
    REQUIRE(items[0].file_path.value_or("") == "a.md");
    REQUIRE(items[0].remaining_ttl_ms.value_or(0) == 4000);
}

// ── Events ──────────────────────────────────────────────────────

TEST_CASE("RenderCache: capacity eviction is published", "[render_cache]") {
    ManualClock clock;
    RenderCache cache(front_limits(1), clock.clock());
    std::vector<InvalidationEvent> seen;
    cache.subscribe([&](const InvalidationEvent& ev) { seen.push_back(ev); });

    cache.put_key("a", "1");
    clock.advance(1);
    cache.get_or_compute_key("b", []() { return std::string("2"); });

    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].key == "a");
    REQUIRE(seen[0].reason == InvalidationReason::CapacityLimit);
    REQUIRE(seen[0].entry->value == "1");
}

TEST_CASE("RenderCache: throwing listener does not affect results", "[render_cache]") {
    ManualClock clock;
    RenderCache cache(front_limits(1), clock.clock());
    int after = 0;
    cache.subscribe([](const InvalidationEvent&) { throw 42; });
    cache.subscribe([](const InvalidationEvent&) { throw std::runtime_error("listener"); });
    cache.subscribe([&](const InvalidationEvent&) { after++; });

    cache.put_key("a", "1");
    clock.advance(1);
    std::string value;
    REQUIRE_NOTHROW(value = cache.get_or_compute_key("b", []() { return std::string("2"); }));
    REQUIRE(value == "2");
    REQUIRE(after == 1);
    REQUIRE(cache.has("b"));
    REQUIRE_FALSE(cache.has("a"));

    clock.advance(1);
    REQUIRE_NOTHROW(cache.put_key("c", "3"));
    REQUIRE(after == 2);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.invalidate("c"));
    REQUIRE(after == 3);
}

TEST_CASE("RenderCache: listeners may call back into the cache", "[render_cache]") {
    RenderCache cache(front_limits());
    size_t size_seen = 99;
    cache.subscribe([&](const InvalidationEvent&) { size_seen = cache.size(); });

    cache.put_key("a", "1");
    REQUIRE(cache.invalidate("a"));
    REQUIRE(size_seen == 0);
}

TEST_CASE("RenderCache: invalidate publishes a manual event", "[render_cache]") {
    RenderCache cache(front_limits());
    std::vector<InvalidationEvent> seen;
    auto id = cache.subscribe([&](const InvalidationEvent& ev) { seen.push_back(ev); });

    cache.put_key("a", "1");
    REQUIRE(cache.invalidate("a"));
    REQUIRE_FALSE(cache.invalidate("a"));

    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].reason == InvalidationReason::Manual);

    REQUIRE(cache.unsubscribe(id));
    cache.put_key("b", "2");
    cache.invalidate("b");
    REQUIRE(seen.size() == 1);
}

TEST_CASE("RenderCache: clear publishes one batch event", "[render_cache]") {
    RenderCache cache(front_limits());
    std::vector<InvalidationEvent> seen;
    cache.subscribe([&](const InvalidationEvent& ev) { seen.push_back(ev); });

    REQUIRE(cache.clear().cleared_count == 0);
    REQUIRE(seen.empty());

    cache.put_key("a", "1");
    cache.put_key("b", "22");
    auto r = cache.clear("reload");
    REQUIRE(r.before_size == 2);
    REQUIRE(r.before_byte_size == 3);
    REQUIRE(r.cleared_count == 2);
    REQUIRE(r.reason == "reload");

    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].reason == InvalidationReason::Batch);
    auto keys = seen[0].keys;
    std::sort(keys.begin(), keys.end());
    REQUIRE(keys == std::vector<CacheKey>{"a", "b"});
}

TEST_CASE("RenderCache: invalidate_all and invalidate_keys batch", "[render_cache]") {
    RenderCache cache(front_limits());
    int batches = 0;
    cache.subscribe([&](const InvalidationEvent& ev) {
        if (ev.reason == InvalidationReason::Batch) batches++;
    });

    cache.put_key("a", "1", std::string("a.md"));
    cache.put_key("b", "2", std::string("b.md"));
    cache.put_key("c", "3");

    REQUIRE(cache.invalidate_all({"a.md", "b.md"}) == 2);
    auto result = cache.invalidate_keys({"c", "gone"});
    REQUIRE(result.success_count == 1);
    REQUIRE(result.failed_keys == std::vector<CacheKey>{"gone"});

    REQUIRE(batches == 2);
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.statistics().invalidations == 3);
}

TEST_CASE("RenderCache: file events gated by configuration", "[render_cache]") {
    auto limits = front_limits();
    limits.file_based_invalidation = false;
    RenderCache cache(limits);
    cache.put_key("a", "1", std::string("a.md"), 1);

    REQUIRE(cache.on_file_change(FileChangeEvent{"a.md", FileChangeKind::Unlink, std::nullopt}) == 0);
    REQUIRE(cache.has("a"));
}

// ── Warmup ──────────────────────────────────────────────────────

TEST_CASE("RenderCache: warmup continues past failures", "[render_cache]") {
    RenderCache cache(front_limits());
    std::vector<RenderCache::WarmupItem> items;
    items.push_back({doc("one", "1.md"), []() { return std::string("1"); }, 10});
    items.push_back({doc("two", "2.md"), []() -> std::string { throw std::runtime_error("bad"); }, 20});
    items.push_back({doc("three", "3.md"), []() { return std::string("3"); }, std::nullopt});

    auto r = cache.warmup(items);
    REQUIRE(r.keys_count == 3);
    REQUIRE(r.success_count == 2);
    REQUIRE(r.failure_count == 1);
    REQUIRE(cache.size() == 2);
    REQUIRE(cache.has(fingerprint(doc("one", "1.md"))));
    REQUIRE_FALSE(cache.has(fingerprint(doc("two", "2.md"))));
}

// ── Statistics and health ───────────────────────────────────────

TEST_CASE("RenderCache: statistics and health agree", "[render_cache]") {
    RenderCache cache(front_limits(10, 1000));
    for (int i = 0; i < 9; ++i) {
        cache.get_or_compute_key("k" + std::to_string(i), []() { return std::string(10, 'x'); });
    }
    cache.get_or_compute_key("k0", []() { return std::string(); });

    auto s = cache.statistics();
    REQUIRE(s.current_entry_count == 9);
    REQUIRE(s.current_total_bytes == 90);
    REQUIRE(s.max_entries == 10);
    REQUIRE(s.hits == 1);
    REQUIRE(s.misses == 9);

    auto h = cache.health_status();
    REQUIRE(h.healthy);
    REQUIRE(h.utilization == 0.9);
    REQUIRE(h.memory_utilization == 0.09);
    REQUIRE(h.hit_rate == s.hit_rate);

    cache.get_or_compute_key("k9", []() { return std::string(10, 'x'); });
    REQUIRE(cache.health_status().warnings.size() == 1);

    cache.reset_statistics();
    REQUIRE(cache.statistics().total_access == 0);
    REQUIRE(cache.size() == 10);
}

TEST_CASE("RenderCache: disabled statistics still cache", "[render_cache]") {
    auto limits = front_limits();
    limits.statistics = false;
    RenderCache cache(limits);
    int computed = 0;
    auto render = [&]() { computed++; return std::string("v"); };

    cache.get_or_compute_key("k", render);
    cache.get_or_compute_key("k", render);

    REQUIRE(computed == 1);
    REQUIRE(cache.statistics().total_access == 0);
    REQUIRE(cache.health_status().healthy);
}

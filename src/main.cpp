#include "config.hpp"
#include "http_server.hpp"
#include "renderer.hpp"
#include "site.hpp"
#include "watcher.hpp"
#include "render_cache/render_cache.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>
#include <memory>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: docserve [DIR] [options]\n"
              << "\n"
              << "Serve rendered documents from DIR (default: config root or .)\n"
              << "\n"
              << "Options:\n"
              << "  --listen HOST:PORT   Address to bind (default: 127.0.0.1:3000)\n"
              << "  --workers N          HTTP worker threads (default: 4)\n"
              << "  --no-watch           Do not watch DIR for changes\n"
              << "  --no-cache           Render every request without caching\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  DOCSERVE_ROOT                Directory to serve\n"
              << "  DOCSERVE_LISTEN              Address to bind\n"
              << "  DOCSERVE_CACHE_TTL_MS        Cache entry lifetime (0 = no expiry)\n"
              << "  DOCSERVE_CACHE_MAX_ENTRIES   Maximum cached renders\n"
              << "  DOCSERVE_CACHE_MAX_BYTES     Maximum total size of cached renders\n"
              << "\n"
              << "Configuration file: ~/.docserve/config.json\n";
}

int main(int argc, char* argv[]) try {
    std::string root;
    std::string listen;
    uint32_t workers = 0;
    bool no_watch = false;
    bool no_cache = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            int n = std::atoi(argv[++i]);
            if (n <= 0) {
                std::cerr << "--workers expects a positive number\n";
                return 1;
            }
            workers = static_cast<uint32_t>(n);
        } else if (std::strcmp(argv[i], "--no-watch") == 0) {
            no_watch = true;
        } else if (std::strcmp(argv[i], "--no-cache") == 0) {
            no_cache = true;
        } else if (argv[i][0] != '-' && root.empty()) {
            root = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = docserve::Config::load();

    // Override config with CLI args
    if (!root.empty()) config.root = root;
    if (!listen.empty()) config.listen = listen;
    if (workers > 0) config.workers = workers;
    if (no_watch) config.watcher.enabled = false;
    if (no_cache) config.cache.enabled = false;

    std::unique_ptr<docserve::RenderCache> cache;
    if (config.cache.enabled) {
        cache = std::make_unique<docserve::RenderCache>(config.cache.limits());
    } else {
        std::cerr << "[cache] Disabled, rendering every request\n";
    }

    docserve::PlainTextRenderer renderer;
    docserve::DocSite site(config.root, cache.get(), renderer);
    docserve::HttpServer server(
        config.listen, config.workers, 1024 * 1024,
        [&site](const docserve::HttpRequest& req) { return site.handle(req); });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Failed to start server: " << error << "\n";
        return 1;
    }

    docserve::PollingWatcher watcher(config.root, config.watcher);
    if (config.watcher.enabled && cache) {
        docserve::RenderCache* target = cache.get();
        bool ok = watcher.start(
            [target](const docserve::FileChangeEvent& ev) { target->on_file_change(ev); },
            error);
        if (!ok) std::cerr << "[watcher] Not watching: " << error << "\n";
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "Serving " << config.root << " on http://" << config.listen << "\n";

    auto last_sweep = std::chrono::steady_clock::now();
    auto sweep_every = std::chrono::milliseconds(config.cache.sweep_interval_ms);
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (!cache || config.cache.sweep_interval_ms == 0) continue;
        auto now = std::chrono::steady_clock::now();
        if (now - last_sweep < sweep_every) continue;
        last_sweep = now;
        size_t removed = cache->sweep_expired();
        if (removed > 0) std::cerr << "[cache] Swept " << removed << " expired entries\n";
    }

    std::cerr << "[server] Shutting down\n";
    watcher.stop();
    server.stop();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}

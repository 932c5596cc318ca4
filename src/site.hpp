#pragma once
#include "http_server.hpp"
#include "renderer.hpp"
#include "render_cache/render_cache.hpp"
#include <string>

namespace docserve {

// HTTP routes of the documentation server: document rendering through the
// cache plus the cache administration API.
class DocSite {
public:
    // `cache` may be null, in which case every render is computed directly
    // and the /api/cache routes answer 503.
    DocSite(std::string root, RenderCache* cache, Renderer& renderer);

    HttpResponse handle(const HttpRequest& req);

    // Map a client-supplied path to a root-relative path with '/' separators
    // and an absolute file path. Returns false (403) for paths that leave
    // the root.
    bool resolve_path(const std::string& requested,
                      std::string& relative,
                      std::string& full) const;

private:
    HttpResponse render(const HttpRequest& req);
    HttpResponse cache_stats();
    HttpResponse cache_health();
    HttpResponse cache_items();
    HttpResponse cache_clear();
    HttpResponse cache_invalidate(const HttpRequest& req);

    std::string root_;
    RenderCache* cache_;
    Renderer& renderer_;
};

} // namespace docserve

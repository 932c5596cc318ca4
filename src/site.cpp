#include "site.hpp"
#include "util.hpp"
#include "render_cache/cache_json.hpp"
#include "render_cache/errors.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace docserve {

static HttpResponse json_response(int status, const nlohmann::json& body) {
    HttpResponse resp;
    resp.status = status;
    resp.content_type = "application/json";
    resp.body = body.dump();
    return resp;
}

static HttpResponse json_error(int status, const std::string& message) {
    return json_response(status, {{"error", message}});
}

DocSite::DocSite(std::string root, RenderCache* cache, Renderer& renderer)
    : root_(std::move(root)), cache_(cache), renderer_(renderer)
{
    std::error_code ec;
    auto canonical = fs::weakly_canonical(root_, ec);
    if (!ec) root_ = canonical.string();
}

HttpResponse DocSite::handle(const HttpRequest& req) {
    struct Route {
        const char* path;
        const char* method;
    };
    static const Route routes[] = {
        {"/api/render", "GET"},
        {"/api/cache/stats", "GET"},
        {"/api/cache/health", "GET"},
        {"/api/cache/items", "GET"},
        {"/api/cache/clear", "POST"},
        {"/api/cache/invalidate", "POST"},
    };

    const Route* route = nullptr;
    for (const auto& r : routes) {
        if (req.path == r.path) { route = &r; break; }
    }
    if (!route) return json_error(404, "Not found: " + req.path);
    if (req.method != route->method)
        return json_error(405, std::string("Use ") + route->method + " for " + req.path);

    if (req.path == "/api/render") return render(req);

    if (!cache_) return json_error(503, "Render cache is disabled");
    if (req.path == "/api/cache/stats") return cache_stats();
    if (req.path == "/api/cache/health") return cache_health();
    if (req.path == "/api/cache/items") return cache_items();
    if (req.path == "/api/cache/clear") return cache_clear();
    return cache_invalidate(req);
}

bool DocSite::resolve_path(const std::string& requested,
                           std::string& relative,
                           std::string& full) const {
    size_t start = requested.find_first_not_of('/');
    if (start == std::string::npos) return false;

    fs::path rel = fs::path(requested.substr(start)).lexically_normal();
    if (rel.empty() || rel.is_absolute() || rel.has_root_name()) return false;
    auto first = rel.begin();
    if (first != rel.end() && *first == "..") return false;

    fs::path candidate = fs::path(root_) / rel;

    // Symlinks must not lead outside the root either.
    std::error_code ec;
    fs::path real = fs::weakly_canonical(candidate, ec);
    if (ec) return false;
    auto inside = real.lexically_relative(root_);
    if (inside.empty() || *inside.begin() == "..") return false;

    relative = rel.generic_string();
    full = candidate.string();
    return true;
}

// ── Rendering ────────────────────────────────────────────────────

HttpResponse DocSite::render(const HttpRequest& req) {
    std::string requested = req.query_param("path");
    if (requested.empty()) return json_error(400, "Missing 'path' parameter");

    std::string relative, full;
    if (!resolve_path(requested, relative, full))
        return json_error(403, "Path outside document root: " + requested);

    std::string source;
    uint64_t mtime = 0;
    std::error_code ec;
    if (!fs::is_regular_file(full, ec) || !read_file(full, source) ||
        !file_mtime_millis(full, mtime))
        return json_error(404, "Document not found: " + relative);

    RenderRequest rr;
    rr.source = source;
    rr.file_path = relative;
    rr.options = {{"renderer", renderer_.name()}};
    std::string theme = req.query_param("theme");
    if (!theme.empty()) rr.theme = theme;

    std::string html;
    bool cached = false;
    if (cache_) {
        CacheKeyParams params;
        params.source = std::move(source);
        params.file_path = relative;
        params.options = rr.options;
        params.theme = rr.theme;
        try {
            html = cache_->get_or_compute(
                params, [this, &rr]() { return renderer_.render(rr); }, mtime, &cached);
        } catch (const InvalidKeyParams& e) {
            return json_error(400, e.what());
        } catch (const ComputeFailed& e) {
            return json_error(500, e.what());
        }
    } else {
        try {
            html = renderer_.render(rr);
        } catch (const std::exception& e) {
            std::cerr << "[server] Render of " << relative << " failed: " << e.what() << "\n";
            return json_error(500, std::string("render failed: ") + e.what());
        }
    }

    return json_response(200, {{"path", relative}, {"html", html}, {"cached", cached}});
}

// ── Cache administration ─────────────────────────────────────────

HttpResponse DocSite::cache_stats() {
    return json_response(200, statistics_to_json(cache_->statistics()));
}

HttpResponse DocSite::cache_health() {
    return json_response(200, health_to_json(cache_->health_status()));
}

HttpResponse DocSite::cache_items() {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& m : cache_->items()) items.push_back(item_to_json(m));
    return json_response(200, {{"count", items.size()}, {"items", items}});
}

HttpResponse DocSite::cache_clear() {
    return json_response(200, clear_result_to_json(cache_->clear("api")));
}

static bool string_array(const nlohmann::json& j, std::vector<std::string>& out) {
    if (!j.is_array()) return false;
    for (const auto& v : j) {
        if (!v.is_string()) return false;
        out.push_back(v.get<std::string>());
    }
    return true;
}

HttpResponse DocSite::cache_invalidate(const HttpRequest& req) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error& e) {
        return json_error(400, std::string("Invalid JSON: ") + e.what());
    }
    if (!body.is_object()) return json_error(400, "Expected a JSON object");

    if (body.contains("key")) {
        if (!body["key"].is_string()) return json_error(400, "'key' must be a string");
        bool removed = cache_->invalidate(body["key"].get<std::string>());
        return json_response(200, {{"removed", removed ? 1 : 0}});
    }
    if (body.contains("path")) {
        if (!body["path"].is_string()) return json_error(400, "'path' must be a string");
        size_t removed = cache_->invalidate_by_file_path(body["path"].get<std::string>());
        return json_response(200, {{"removed", removed}});
    }
    if (body.contains("paths")) {
        std::vector<std::string> paths;
        if (!string_array(body["paths"], paths))
            return json_error(400, "'paths' must be an array of strings");
        return json_response(200, {{"removed", cache_->invalidate_all(paths)}});
    }
    if (body.contains("keys")) {
        std::vector<std::string> keys;
        if (!string_array(body["keys"], keys))
            return json_error(400, "'keys' must be an array of strings");
        return json_response(200, batch_result_to_json(cache_->invalidate_keys(keys)));
    }
    return json_error(400, "Expected one of 'key', 'path', 'paths' or 'keys'");
}

} // namespace docserve

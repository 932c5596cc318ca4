#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace docserve {

struct RenderRequest {
    std::string source;
    std::optional<std::string> file_path;
    nlohmann::json options;            // null or object
    std::optional<std::string> theme;
};

// Turns document source into HTML. Implementations may be slow and may
// throw; callers go through RenderCache so the result is computed once.
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual std::string render(const RenderRequest& request) = 0;

    virtual std::string name() const = 0;
};

// Escaped source in a <pre> block. Used when no document pipeline is
// plugged in.
class PlainTextRenderer : public Renderer {
public:
    std::string render(const RenderRequest& request) override;
    std::string name() const override { return "plain"; }
};

} // namespace docserve

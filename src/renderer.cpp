#include "renderer.hpp"
#include "util.hpp"

namespace docserve {

std::string PlainTextRenderer::render(const RenderRequest& request) {
    std::string theme = request.theme.value_or("light");
    std::string html = "<pre class=\"docserve-source theme-" + html_escape(theme) + "\"";
    if (request.file_path) {
        html += " data-path=\"" + html_escape(*request.file_path) + "\"";
    }
    html += ">";
    html += html_escape(request.source);
    html += "</pre>";
    return html;
}

} // namespace docserve

#include "TextResource.hpp"

namespace mcpd {

TextResource::TextResource(ResourceInfo info, std::string text)
    : info_(std::move(info)), text_(std::move(text)) {
}

TextResource TextResource::hello() {
    return TextResource(
        {"text://hello", "Hello World", "A simple hello world text resource", "text/plain"},
        "Hello, World!");
}

json TextResource::read(const std::string& uri) const {
    return json::array({
        {
            {"uri", uri},
            {"mimeType", info_.mime_type},
            {"text", text_}
        }
    });
}

} // namespace mcpd

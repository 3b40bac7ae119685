#pragma once

#include "core/Features.hpp"
#include <string>

namespace mcpd {

/**
 * @brief Static in-memory text resource
 */
class TextResource {
public:
    TextResource(ResourceInfo info, std::string text);

    /**
     * @brief The default text://hello resource
     */
    static TextResource hello();

    const ResourceInfo& info() const { return info_; }

    /**
     * @brief Read resource contents
     * @param uri Requested URI
     * @return Array with one text content object
     */
    json read(const std::string& uri) const;

private:
    ResourceInfo info_;
    std::string text_;
};

} // namespace mcpd

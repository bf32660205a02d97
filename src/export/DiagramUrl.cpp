#include "drawlink/export/DiagramUrl.h"
#include "drawlink/core/Errors.h"

namespace drawlink {

std::string DiagramUrl::build(std::string_view payload) const {
    std::string url;
    url.reserve(options_.baseUrl.size() + options_.title.size() + payload.size() + 10);
    url.append(options_.baseUrl);
    url.append("?title=");
    url.append(options_.title);
    url.append(PAYLOAD_MARKER);
    url.append(payload);
    return url;
}

std::string DiagramUrl::extractPayload(std::string_view url) {
    size_t marker = url.find(PAYLOAD_MARKER);
    if (marker == std::string_view::npos) {
        throw CodecError("URL has no '#R' payload marker");
    }
    return std::string(url.substr(marker + PAYLOAD_MARKER.size()));
}

}  // namespace drawlink

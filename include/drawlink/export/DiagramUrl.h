#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace drawlink {

/// Viewer address and document title of the generated links
struct UrlOptions {
    std::string baseUrl = "https://app.diagrams.net";

    /// Inserted verbatim, so it must already be URL-escaped
    std::string title = "AWS%20Architecture%20Diagram.xml";
};

/// Assembles draw.io links of the form <base>?title=<title>#R<payload>.
///
/// The "#R" fragment tells draw.io the payload is a compressed document.
class DiagramUrl {
public:
    static constexpr std::string_view PAYLOAD_MARKER = "#R";

    DiagramUrl() = default;
    explicit DiagramUrl(UrlOptions options) : options_(std::move(options)) {}

    /// Link for an already percent-encoded payload
    std::string build(std::string_view payload) const;

    /// Text after the first "#R" of url
    /// @throws CodecError if url has no payload marker
    static std::string extractPayload(std::string_view url);

    const UrlOptions& options() const { return options_; }

private:
    UrlOptions options_;
};

}  // namespace drawlink

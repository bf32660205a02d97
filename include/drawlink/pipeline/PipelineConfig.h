#pragma once

#include "drawlink/encode/DiagramCodec.h"
#include "drawlink/export/DiagramUrl.h"
#include "drawlink/layout/LayoutOptions.h"

#include <optional>
#include <string>

namespace drawlink {

/// Everything that shapes the output of DiagramPipeline
struct PipelineOptions {
    LayoutOptions layout;
    UrlOptions url;
    int compressionLevel = codec::DEFAULT_COMPRESSION_LEVEL;
};

/// Pipeline options plus process-level settings, loadable from JSON:
///
/// @code
/// {
///   "layout": {"margin": 30, "defaultIconSize": 43,
///              "emptyContainerPolicy": "reject" | "zeroSizeAtCenter"},
///   "url": {"baseUrl": "https://app.diagrams.net", "title": "My%20Diagram.xml"},
///   "codec": {"compressionLevel": 9},
///   "iconBundle": "/opt/drawlink/icons"
/// }
/// @endcode
///
/// Every key is optional. Unknown keys are ignored.
struct PipelineConfig {
    PipelineOptions options;
    std::optional<std::string> iconBundle;   ///< Directory for StyleCatalog::loadIconBundle

    /// @throws MalformedInputError on invalid JSON or wrongly typed values
    static PipelineConfig fromJson(const std::string& json);

    /// @throws MalformedInputError if the file cannot be read or parsed
    static PipelineConfig fromFile(const std::string& path);

    static std::string policyToString(EmptyContainerPolicy policy);
    static EmptyContainerPolicy stringToPolicy(const std::string& str);
};

}  // namespace drawlink

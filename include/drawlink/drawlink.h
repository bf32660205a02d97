#pragma once

/// @file drawlink.h
/// @brief Main header for the DrawLink diagram link library
///
/// DrawLink turns a list of nested cloud-architecture nodes and their
/// connections into a shareable draw.io link.
///
/// Example usage:
/// @code
/// #include <drawlink/drawlink.h>
///
/// drawlink::DiagramRequest request;
/// request.nodes.emplace_back("vpc", "vpc", "VPC", "Network", drawlink::Point{0, 0});
/// request.nodes.emplace_back("web", "resource", "Web", "EC2", drawlink::Point{0, 0});
/// request.nodes.back().parent = "vpc";
///
/// drawlink::DiagramPipeline pipeline(drawlink::StyleCatalog::shared());
/// std::string url = pipeline.generateUrl(request);
/// @endcode

// Core module - Request and graph
#include "core/Types.h"
#include "core/Errors.h"
#include "core/DiagramRequest.h"
#include "core/DiagramGraph.h"

// Style module
#include "style/IStyleResolver.h"
#include "style/StyleCatalog.h"

// Layout module
#include "layout/LayoutOptions.h"
#include "layout/LayoutResult.h"
#include "layout/ILayout.h"
#include "layout/ContainmentLayout.h"

// Export module - Document, codec and link
#include "export/IExporter.h"
#include "export/DrawioExport.h"
#include "encode/DiagramCodec.h"
#include "export/DiagramUrl.h"

// Pipeline module
#include "pipeline/PipelineConfig.h"
#include "pipeline/RequestParser.h"
#include "pipeline/DiagramPipeline.h"

#include <string>

namespace drawlink {

/// Library version
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace drawlink

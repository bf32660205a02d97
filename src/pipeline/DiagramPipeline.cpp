#include "drawlink/pipeline/DiagramPipeline.h"
#include "drawlink/common/Logger.h"
#include "drawlink/core/DiagramGraph.h"
#include "drawlink/encode/DiagramCodec.h"
#include "drawlink/export/DiagramUrl.h"
#include "drawlink/export/DrawioExport.h"
#include "drawlink/layout/ContainmentLayout.h"

#include <utility>

namespace drawlink {

DiagramPipeline::DiagramPipeline(const IStyleResolver& styles)
    : styles_(styles) {}

DiagramPipeline::DiagramPipeline(const IStyleResolver& styles, PipelineOptions options)
    : styles_(styles), options_(std::move(options)) {}

std::string DiagramPipeline::generateDocument(const DiagramRequest& request) const {
    DiagramGraph graph = DiagramGraph::fromRequest(request);
    LOG_DEBUG("graph: {} nodes, {} edges", graph.nodeCount(), graph.edgeCount());

    ContainmentLayout layout(styles_, options_.layout);
    LayoutResult boxes = layout.layout(graph);
    LOG_DEBUG("layout: {} boxes", boxes.nodeCount());

    DrawioExport exporter(styles_);
    std::string xml = exporter.exportToString(graph, boxes);
    LOG_DEBUG("document: {} bytes", xml.size());
    return xml;
}

std::string DiagramPipeline::generateUrl(const DiagramRequest& request) const {
    std::string xml = generateDocument(request);
    std::string payload = codec::encodeDocument(xml, options_.compressionLevel);
    std::string url = DiagramUrl(options_.url).build(payload);

    LOG_INFO("diagram url ready: nodes={}, edges={}, payload={} chars",
             request.nodes.size(), request.edges.size(), payload.size());
    return url;
}

std::string DiagramPipeline::decodeUrl(const std::string& url) const {
    std::string xml = codec::decodeDocument(DiagramUrl::extractPayload(url));
    LOG_DEBUG("decoded {} bytes of XML", xml.size());
    return xml;
}

}  // namespace drawlink

#pragma once

#include "IExporter.h"
#include "drawlink/style/IStyleResolver.h"

#include <pugixml.hpp>

#include <ostream>
#include <string>

namespace drawlink {

struct NodeData;
struct EdgeData;
struct Rect;

/// Options for draw.io export
struct DrawioExportOptions {
    /// Indent the XML. The URL payload must stay raw; this is for files only.
    bool indent = false;

    /// Prepend <?xml ...?>. draw.io accepts both; the URL payload omits it.
    bool xmlDeclaration = false;
};

/// Exports a laid-out graph as a draw.io mxGraphModel document.
///
/// Layout of the document:
///   mxGraphModel/root holds the two cells draw.io requires first (id 0,
///   and the default layer id 1 parented to 0), then one <object> per node
///   in creation order wrapping its vertex mxCell and mxGeometry, then one
///   edge mxCell per edge with a relative geometry.
class DrawioExport : public IExporter {
public:
    /// @param styles Resolver for node and edge styles; must outlive the exporter
    explicit DrawioExport(const IStyleResolver& styles);
    DrawioExport(const IStyleResolver& styles, const DrawioExportOptions& options);
    ~DrawioExport() override = default;

    std::string exportToString(const DiagramGraph& graph, const LayoutResult& layout) override;
    void exportToStream(const DiagramGraph& graph, const LayoutResult& layout,
                        std::ostream& out) override;
    bool exportToFile(const DiagramGraph& graph, const LayoutResult& layout,
                      const std::string& filename) override;

    std::string fileExtension() const override { return "drawio"; }
    std::string mimeType() const override { return "application/vnd.jgraph.mxfile"; }

    /// Build the document tree without serializing it
    /// @throws LayoutError if a node has no box in layout
    void buildDocument(const DiagramGraph& graph, const LayoutResult& layout,
                       pugi::xml_document& doc) const;

    void setOptions(const DrawioExportOptions& options) { options_ = options; }
    const DrawioExportOptions& options() const { return options_; }

    /// Plain decimal text for a geometry value
    static std::string formatNumber(double value);

private:
    void writeNode(pugi::xml_node& root, const NodeData& node, const Rect& box) const;
    void writeEdge(pugi::xml_node& root, const EdgeData& edge, const std::string& style) const;

    const IStyleResolver& styles_;
    DrawioExportOptions options_;
};

}  // namespace drawlink

#include "drawlink/export/DrawioExport.h"
#include "drawlink/common/Logger.h"
#include "drawlink/core/DiagramGraph.h"
#include "drawlink/core/Errors.h"
#include "drawlink/layout/LayoutResult.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace drawlink {

namespace {
constexpr const char* ROOT_CELL_ID = "0";
constexpr const char* LAYER_CELL_ID = "1";

bool isNameStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool isNameChar(unsigned char c) {
    return isNameStart(c) || std::isdigit(c) || c == '-' || c == '.';
}

/// XML Name without a namespace prefix, e.g. "Arch_Amazon-EC2_48" but not "5G Core"
bool isAttributeName(const std::string& name) {
    if (name.empty() || !isNameStart(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    if (name.rfind("xmlns", 0) == 0) {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(),
                       [](char c) { return isNameChar(static_cast<unsigned char>(c)); });
}

}  // namespace

DrawioExport::DrawioExport(const IStyleResolver& styles)
    : styles_(styles) {}

DrawioExport::DrawioExport(const IStyleResolver& styles, const DrawioExportOptions& options)
    : styles_(styles), options_(options) {}

std::string DrawioExport::formatNumber(double value) {
    // Avoid "-0" for boxes that collapse onto the origin
    if (value == 0.0) {
        return "0";
    }

    // Plain decimal, never exponent form. The longest (5e-324) is 327 characters
    std::array<char, 400> buffer;
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                   std::chars_format::fixed);
    if (ec != std::errc()) {
        throw LayoutError("coordinate cannot be formatted", "");
    }
    return std::string(buffer.data(), end);
}

std::string DrawioExport::exportToString(const DiagramGraph& graph, const LayoutResult& layout) {
    std::ostringstream out;
    exportToStream(graph, layout, out);
    return out.str();
}

void DrawioExport::exportToStream(const DiagramGraph& graph, const LayoutResult& layout,
                                  std::ostream& out) {
    pugi::xml_document doc;
    buildDocument(graph, layout, doc);

    unsigned int flags = options_.indent ? pugi::format_indent : pugi::format_raw;
    if (!options_.xmlDeclaration) {
        flags |= pugi::format_no_declaration;
    }
    doc.save(out, "  ", flags, pugi::encoding_utf8);
}

bool DrawioExport::exportToFile(const DiagramGraph& graph, const LayoutResult& layout,
                                const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("cannot open {} for writing", filename);
        return false;
    }
    exportToStream(graph, layout, file);
    return true;
}

void DrawioExport::buildDocument(const DiagramGraph& graph, const LayoutResult& layout,
                                 pugi::xml_document& doc) const {
    doc.reset();
    pugi::xml_node model = doc.append_child("mxGraphModel");
    pugi::xml_node root = model.append_child("root");

    // draw.io needs these two cells before any content
    root.append_child("mxCell").append_attribute("id") = ROOT_CELL_ID;
    pugi::xml_node layer = root.append_child("mxCell");
    layer.append_attribute("id") = LAYER_CELL_ID;
    layer.append_attribute("parent") = ROOT_CELL_ID;

    for (const NodeId& id : graph.nodeOrder()) {
        writeNode(root, graph.node(id), layout.nodeBox(id));
    }

    const std::string edgeStyle = styles_.edgeStyle().style;
    for (const EdgeData& edge : graph.edges()) {
        writeEdge(root, edge, edgeStyle);
    }
}

void DrawioExport::writeNode(pugi::xml_node& root, const NodeData& node, const Rect& box) const {
    pugi::xml_node object = root.append_child("object");
    object.append_attribute("id") = node.id.c_str();
    object.append_attribute("label") = node.label.c_str();

    // The title is stored under an attribute named after the node type
    if (node.type == "id" || node.type == "label") {
        LOG_WARN("node '{}': type '{}' collides with a reserved attribute, title omitted",
                 node.id, node.type);
    } else if (!isAttributeName(node.type)) {
        LOG_WARN("node '{}': type '{}' is not a valid attribute name, title omitted",
                 node.id, node.type);
    } else {
        object.append_attribute(node.type.c_str()) = node.title.c_str();
    }

    pugi::xml_node cell = object.append_child("mxCell");
    cell.append_attribute("style") = styles_.resolve(node.type).style.c_str();
    cell.append_attribute("vertex") = "1";
    cell.append_attribute("parent") = LAYER_CELL_ID;

    pugi::xml_node geometry = cell.append_child("mxGeometry");
    geometry.append_attribute("x") = formatNumber(box.x).c_str();
    geometry.append_attribute("y") = formatNumber(box.y).c_str();
    geometry.append_attribute("height") = formatNumber(box.height).c_str();
    geometry.append_attribute("width") = formatNumber(box.width).c_str();
    geometry.append_attribute("as") = "geometry";
}

void DrawioExport::writeEdge(pugi::xml_node& root, const EdgeData& edge,
                             const std::string& style) const {
    pugi::xml_node cell = root.append_child("mxCell");
    cell.append_attribute("id") = edge.id.c_str();
    cell.append_attribute("style") = style.c_str();
    cell.append_attribute("parent") = LAYER_CELL_ID;
    cell.append_attribute("source") = edge.source.c_str();
    cell.append_attribute("target") = edge.target.c_str();
    cell.append_attribute("edge") = "1";

    // No coordinates: draw.io routes the edge between its endpoints
    pugi::xml_node geometry = cell.append_child("mxGeometry");
    geometry.append_attribute("relative") = "1";
    geometry.append_attribute("as") = "geometry";
}

}  // namespace drawlink

#pragma once

#include "DiagramRequest.h"
#include "Types.h"

#include <optional>
#include <string>
#include <utility>
#include <unordered_map>
#include <vector>

namespace drawlink {

struct NodeData {
    NodeId id;
    std::string type;       ///< Effective type identifier (after image normalization)
    std::string label;
    std::string title;
    Point center;           ///< Declared center; the box is computed by the layout
    bool isEndNode = false;
    std::optional<NodeId> parent;
    std::vector<NodeId> children;

    NodeData() = default;
    NodeData(NodeId id_, std::string type_, std::string label_, std::string title_,
             Point center_, bool endNode)
        : id(std::move(id_)), type(std::move(type_)), label(std::move(label_)),
          title(std::move(title_)), center(center_), isEndNode(endNode) {}
};

struct EdgeData {
    EdgeId id;
    NodeId source;
    NodeId target;

    EdgeData() = default;
    EdgeData(EdgeId id_, NodeId source_, NodeId target_)
        : id(std::move(id_)), source(std::move(source_)), target(std::move(target_)) {}
};

/// Nodes and edges of one diagram request, with resolved containment links.
///
/// Nodes are owned by the graph and addressed by their string identifier.
/// Creation order is kept and drives emission order downstream.
class DiagramGraph {
public:
    DiagramGraph() = default;

    /// Build a graph from request descriptors.
    ///
    /// Pass 1 creates every node (normalizing "resource" types with an image
    /// to the image's base name), pass 2 links children to parents, then
    /// edges are added.
    /// @throws MalformedInputError on missing fields or duplicate ids
    /// @throws ReferenceError on unresolved parent or edge endpoint
    static DiagramGraph fromRequest(const DiagramRequest& request);

    /// Effective type identifier for a descriptor's declared type and image
    static std::string normalizeType(const std::string& declaredType,
                                     const std::optional<std::string>& image);

    // Node operations
    const NodeData& addNode(const NodeData& data);
    void setParent(const NodeId& child, const NodeId& parent);

    bool hasNode(const NodeId& id) const;

    // - node(): throws ReferenceError for unknown ids.
    // - findNode(): returns nullptr for unknown ids.
    const NodeData& node(const NodeId& id) const;
    const NodeData* findNode(const NodeId& id) const;

    // Edge operations
    const EdgeData& addEdge(const EdgeData& data);
    bool hasEdge(const EdgeId& id) const;

    // Hierarchy queries
    std::optional<NodeId> parent(const NodeId& id) const;
    const std::vector<NodeId>& children(const NodeId& id) const;
    bool isContainer(const NodeId& id) const;
    std::vector<NodeId> rootNodes() const;
    int depth(const NodeId& id) const;

    // Iteration (creation order)
    const std::vector<NodeId>& nodeOrder() const { return nodeOrder_; }
    const std::vector<EdgeData>& edges() const { return edges_; }

    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }

private:
    NodeData& mutableNode(const NodeId& id);

    std::unordered_map<NodeId, NodeData> nodes_;
    std::vector<NodeId> nodeOrder_;
    std::vector<EdgeData> edges_;
    std::unordered_map<EdgeId, size_t> edgeIndex_;
};

}  // namespace drawlink

#include "drawlink/core/DiagramGraph.h"
#include "drawlink/common/Logger.h"
#include "drawlink/core/Errors.h"

namespace drawlink {

namespace {

const std::vector<NodeId> NO_CHILDREN;

void requireField(bool present, const char* field, const std::string& nodeId, size_t index) {
    if (!present) {
        throw MalformedInputError(std::format(
            "node #{} ('{}') is missing required field '{}'", index, nodeId, field));
    }
}

}  // namespace

std::string DiagramGraph::normalizeType(const std::string& declaredType,
                                        const std::optional<std::string>& image) {
    if (declaredType != RESOURCE_TYPE || !image || image->empty()) {
        return declaredType;
    }

    // "icons/Arch_Amazon-EC2_48.svg" -> "Arch_Amazon-EC2_48"
    std::string segment = *image;
    size_t slash = segment.rfind('/');
    if (slash != std::string::npos) {
        segment = segment.substr(slash + 1);
    }
    size_t dot = segment.find('.');
    if (dot != std::string::npos) {
        segment = segment.substr(0, dot);
    }
    return segment;
}

DiagramGraph DiagramGraph::fromRequest(const DiagramRequest& request) {
    DiagramGraph graph;

    // Pass 1: create every node so parents can be referenced in any order
    for (size_t i = 0; i < request.nodes.size(); ++i) {
        const NodeDescriptor& desc = request.nodes[i];
        requireField(!desc.id.empty(), "id", desc.id, i);
        requireField(!desc.type.empty(), "type", desc.id, i);
        requireField(desc.label.has_value(), "label", desc.id, i);
        requireField(desc.title.has_value(), "title", desc.id, i);
        requireField(desc.position.has_value(), "position", desc.id, i);

        graph.addNode(NodeData{desc.id,
                               normalizeType(desc.type, desc.image),
                               *desc.label,
                               *desc.title,
                               *desc.position,
                               desc.type == RESOURCE_TYPE});
    }

    // Pass 2: containment links
    for (const NodeDescriptor& desc : request.nodes) {
        if (desc.parent && !desc.parent->empty()) {
            graph.setParent(desc.id, *desc.parent);
        }
    }

    for (const EdgeDescriptor& edge : request.edges) {
        graph.addEdge(EdgeData{edge.id, edge.source, edge.target});
    }

    LOG_DEBUG("built graph: {} nodes, {} edges, {} roots",
              graph.nodeCount(), graph.edgeCount(), graph.rootNodes().size());
    return graph;
}

const NodeData& DiagramGraph::addNode(const NodeData& data) {
    if (data.id.empty()) {
        throw MalformedInputError("node id must not be empty");
    }
    if (hasNode(data.id)) {
        throw MalformedInputError("duplicate node id: " + data.id);
    }

    NodeData nodeData = data;
    nodeData.parent.reset();
    nodeData.children.clear();

    auto it = nodes_.emplace(nodeData.id, std::move(nodeData)).first;
    nodeOrder_.push_back(it->first);
    return it->second;
}

void DiagramGraph::setParent(const NodeId& child, const NodeId& parent) {
    if (!hasNode(child)) {
        throw ReferenceError("unknown child node: " + child, child);
    }
    if (!hasNode(parent)) {
        throw ReferenceError("node '" + child + "' references unknown parent: " + parent, parent);
    }
    if (child == parent) {
        throw MalformedInputError("node cannot be its own parent: " + child);
    }

    NodeData& childNode = mutableNode(child);
    if (childNode.parent.has_value()) {
        throw MalformedInputError("node '" + child + "' already has parent: " + *childNode.parent);
    }

    // Parent cannot be a descendant of child
    auto ancestor = this->parent(parent);
    while (ancestor.has_value()) {
        if (*ancestor == child) {
            throw MalformedInputError("setting parent of '" + child + "' to '" + parent +
                                      "' would create a containment cycle");
        }
        ancestor = this->parent(*ancestor);
    }

    childNode.parent = parent;
    mutableNode(parent).children.push_back(child);
}

bool DiagramGraph::hasNode(const NodeId& id) const {
    return nodes_.find(id) != nodes_.end();
}

const NodeData& DiagramGraph::node(const NodeId& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw ReferenceError("unknown node id: " + id, id);
    }
    return it->second;
}

const NodeData* DiagramGraph::findNode(const NodeId& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

NodeData& DiagramGraph::mutableNode(const NodeId& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw ReferenceError("unknown node id: " + id, id);
    }
    return it->second;
}

const EdgeData& DiagramGraph::addEdge(const EdgeData& data) {
    if (data.id.empty()) {
        throw MalformedInputError("edge id must not be empty");
    }
    if (hasEdge(data.id)) {
        throw MalformedInputError("duplicate edge id: " + data.id);
    }
    if (!hasNode(data.source)) {
        throw ReferenceError("edge '" + data.id + "' references unknown source: " + data.source,
                             data.source);
    }
    if (!hasNode(data.target)) {
        throw ReferenceError("edge '" + data.id + "' references unknown target: " + data.target,
                             data.target);
    }

    edgeIndex_[data.id] = edges_.size();
    edges_.push_back(data);
    return edges_.back();
}

bool DiagramGraph::hasEdge(const EdgeId& id) const {
    return edgeIndex_.find(id) != edgeIndex_.end();
}

std::optional<NodeId> DiagramGraph::parent(const NodeId& id) const {
    const NodeData* data = findNode(id);
    return data ? data->parent : std::nullopt;
}

const std::vector<NodeId>& DiagramGraph::children(const NodeId& id) const {
    const NodeData* data = findNode(id);
    return data ? data->children : NO_CHILDREN;
}

bool DiagramGraph::isContainer(const NodeId& id) const {
    const NodeData* data = findNode(id);
    return data && !data->isEndNode;
}

std::vector<NodeId> DiagramGraph::rootNodes() const {
    std::vector<NodeId> result;
    for (const NodeId& id : nodeOrder_) {
        if (!nodes_.at(id).parent.has_value()) {
            result.push_back(id);
        }
    }
    return result;
}

int DiagramGraph::depth(const NodeId& id) const {
    int depth = 0;
    auto ancestor = parent(id);
    while (ancestor.has_value()) {
        ++depth;
        ancestor = parent(*ancestor);
    }
    return depth;
}

}  // namespace drawlink

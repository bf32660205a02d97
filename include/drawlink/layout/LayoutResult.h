#pragma once

#include "drawlink/core/Types.h"

#include <unordered_map>

namespace drawlink {

/// Resolved boxes for every node of a graph, keyed by node id.
///
/// Doubles as the memo table of the layout pass: a node has a box exactly
/// when its geometry has been resolved.
class LayoutResult {
public:
    LayoutResult() = default;

    void setNodeBox(const NodeId& id, const Rect& box);

    // - nodeBox(): throws LayoutError for nodes without a box.
    // - findNodeBox(): returns nullptr for nodes without a box.
    const Rect& nodeBox(const NodeId& id) const;
    const Rect* findNodeBox(const NodeId& id) const;
    bool hasNodeBox(const NodeId& id) const;

    const std::unordered_map<NodeId, Rect>& nodeBoxes() const { return nodeBoxes_; }
    size_t nodeCount() const { return nodeBoxes_.size(); }

    /// Union of all node boxes; empty Rect when there are none
    Rect computeBounds() const;

private:
    std::unordered_map<NodeId, Rect> nodeBoxes_;
};

}  // namespace drawlink

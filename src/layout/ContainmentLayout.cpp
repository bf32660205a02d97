#include "drawlink/layout/ContainmentLayout.h"
#include "drawlink/common/Logger.h"
#include "drawlink/core/DiagramGraph.h"
#include "drawlink/core/Errors.h"

#include <algorithm>
#include <limits>
#include <vector>

namespace drawlink {

ContainmentLayout::ContainmentLayout(const IStyleResolver& styles)
    : styles_(styles) {}

ContainmentLayout::ContainmentLayout(const IStyleResolver& styles, const LayoutOptions& options)
    : styles_(styles), options_(options) {}

LayoutResult ContainmentLayout::layout(const DiagramGraph& graph) const {
    LayoutResult result;

    for (const NodeId& id : graph.nodeOrder()) {
        if (!result.hasNodeBox(id)) {
            resolveSubtree(graph, graph.node(id), result);
        }
    }

    LOG_DEBUG("resolved {} boxes (margin {})", result.nodeCount(), options_.margin);
    return result;
}

void ContainmentLayout::resolveSubtree(const DiagramGraph& graph, const NodeData& root,
                                       LayoutResult& result) const {
    struct Frame {
        const NodeData* node;
        size_t nextChild;
    };

    // Explicit stack: a container is finalized only after all of its children
    std::vector<Frame> stack;
    stack.push_back({&root, 0});

    while (!stack.empty()) {
        Frame& top = stack.back();
        const NodeData& node = *top.node;

        if (!node.isEndNode && top.nextChild < node.children.size()) {
            const NodeId& childId = node.children[top.nextChild++];
            if (!result.hasNodeBox(childId)) {
                stack.push_back({&graph.node(childId), 0});
            }
            continue;
        }

        result.setNodeBox(node.id, node.isEndNode ? endNodeBox(node)
                                                  : containerBox(graph, node, result));
        stack.pop_back();
    }
}

Rect ContainmentLayout::endNodeBox(const NodeData& node) const {
    StyleEntry entry = styles_.resolve(node.type);
    double width = entry.width.value_or(options_.defaultIconSize);
    double height = entry.height.value_or(options_.defaultIconSize);

    return {node.center.x - width / 2, node.center.y - height / 2, width, height};
}

Rect ContainmentLayout::containerBox(const DiagramGraph& graph, const NodeData& node,
                                     const LayoutResult& result) const {
    if (node.children.empty()) {
        if (options_.emptyContainerPolicy == EmptyContainerPolicy::Reject) {
            throw LayoutError("container node has no children: " + node.id, node.id);
        }
        LOG_WARN("container '{}' has no children, using zero-size box at its center", node.id);
        return {node.center.x, node.center.y, 0.0, 0.0};
    }

    double minTop = std::numeric_limits<double>::infinity();
    double minLeft = std::numeric_limits<double>::infinity();
    double maxBottom = -std::numeric_limits<double>::infinity();
    double maxRight = -std::numeric_limits<double>::infinity();

    // Child extents use the child's declared center and resolved size
    for (const NodeId& childId : node.children) {
        const NodeData& child = graph.node(childId);
        const Rect& box = result.nodeBox(childId);

        minTop = std::min(minTop, child.center.y - box.height / 2);
        minLeft = std::min(minLeft, child.center.x - box.width / 2);
        maxBottom = std::max(maxBottom, child.center.y + box.height / 2);
        maxRight = std::max(maxRight, child.center.x + box.width / 2);
    }

    const double margin = options_.margin;
    double y = minTop - margin;
    double x = minLeft - margin;
    double height = maxBottom + margin - y;
    double width = 2 * (maxRight + margin - node.center.x);

    return {x, y, width, height};
}

}  // namespace drawlink

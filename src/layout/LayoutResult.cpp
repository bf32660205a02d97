#include "drawlink/layout/LayoutResult.h"
#include "drawlink/core/Errors.h"

namespace drawlink {

void LayoutResult::setNodeBox(const NodeId& id, const Rect& box) {
    nodeBoxes_[id] = box;
}

const Rect& LayoutResult::nodeBox(const NodeId& id) const {
    auto it = nodeBoxes_.find(id);
    if (it == nodeBoxes_.end()) {
        throw LayoutError("no layout for node: " + id, id);
    }
    return it->second;
}

const Rect* LayoutResult::findNodeBox(const NodeId& id) const {
    auto it = nodeBoxes_.find(id);
    return it != nodeBoxes_.end() ? &it->second : nullptr;
}

bool LayoutResult::hasNodeBox(const NodeId& id) const {
    return nodeBoxes_.find(id) != nodeBoxes_.end();
}

Rect LayoutResult::computeBounds() const {
    if (nodeBoxes_.empty()) {
        return {};
    }

    auto it = nodeBoxes_.begin();
    Rect bounds = it->second;
    for (++it; it != nodeBoxes_.end(); ++it) {
        bounds = bounds.united(it->second);
    }
    return bounds;
}

}  // namespace drawlink

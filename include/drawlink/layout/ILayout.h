#pragma once

#include "LayoutOptions.h"
#include "LayoutResult.h"

namespace drawlink {

class DiagramGraph;

/// Abstract interface for diagram layout algorithms
class ILayout {
public:
    virtual ~ILayout() = default;

    virtual void setOptions(const LayoutOptions& options) = 0;
    virtual const LayoutOptions& options() const = 0;

    /// Resolve a box for every node of the graph
    virtual LayoutResult layout(const DiagramGraph& graph) const = 0;
};

}  // namespace drawlink

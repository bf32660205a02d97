#pragma once

#include "ILayout.h"
#include "drawlink/style/IStyleResolver.h"

namespace drawlink {

struct NodeData;

/// Resolves node boxes from declared centers and the containment tree.
///
/// End nodes take their size from the style resolver and are centered on
/// their declared position. Containers wrap their children's extents plus
/// the margin: the top, left and bottom edges follow the children, while
/// the width is mirrored around the container's own declared center x
/// (draw.io group convention of the source data).
///
/// Every box is computed once by an iterative post-order walk, with
/// LayoutResult acting as the memo table, so deep trees cost O(n).
class ContainmentLayout : public ILayout {
public:
    /// @param styles Resolver for end node sizes; must outlive the layout
    explicit ContainmentLayout(const IStyleResolver& styles);
    ContainmentLayout(const IStyleResolver& styles, const LayoutOptions& options);
    ~ContainmentLayout() override = default;

    void setOptions(const LayoutOptions& options) override { options_ = options; }
    const LayoutOptions& options() const override { return options_; }

    /// @throws LayoutError for an empty container under EmptyContainerPolicy::Reject
    LayoutResult layout(const DiagramGraph& graph) const override;

private:
    void resolveSubtree(const DiagramGraph& graph, const NodeData& root,
                        LayoutResult& result) const;
    Rect endNodeBox(const NodeData& node) const;
    Rect containerBox(const DiagramGraph& graph, const NodeData& node,
                      const LayoutResult& result) const;

    const IStyleResolver& styles_;
    LayoutOptions options_;
};

}  // namespace drawlink

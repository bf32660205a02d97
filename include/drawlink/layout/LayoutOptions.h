#pragma once

#include "drawlink/style/IStyleResolver.h"

namespace drawlink {

/// What to do with a container node that ended up without children
enum class EmptyContainerPolicy {
    Reject,            // Throw LayoutError naming the node
    ZeroSizeAtCenter   // Zero-size box at the declared center, logged as a warning
};

/// Layout configuration
struct LayoutOptions {
    /// Gap between a container's edge and its children's combined extent
    double margin = 30.0;

    /// Icon size used when the style entry for an end node carries no size
    double defaultIconSize = DEFAULT_ICON_SIZE;

    EmptyContainerPolicy emptyContainerPolicy = EmptyContainerPolicy::Reject;
};

}  // namespace drawlink

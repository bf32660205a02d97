#pragma once

#include "Types.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace drawlink {

/// Declared type that marks a descriptor as an end node
inline constexpr const char* RESOURCE_TYPE = "resource";

/// One node as supplied by the caller, before normalization
struct NodeDescriptor {
    std::string id;
    std::string type;
    std::optional<std::string> label;
    std::optional<std::string> title;
    std::optional<Point> position;
    std::optional<std::string> parent;   ///< Empty or absent means top-level
    std::optional<std::string> image;    ///< Icon path, used when type is "resource"

    NodeDescriptor() = default;
    NodeDescriptor(std::string id_, std::string type_, std::string label_,
                   std::string title_, Point pos)
        : id(std::move(id_)), type(std::move(type_)), label(std::move(label_)),
          title(std::move(title_)), position(pos) {}
};

struct EdgeDescriptor {
    std::string id;
    std::string source;
    std::string target;

    EdgeDescriptor() = default;
    EdgeDescriptor(std::string id_, std::string source_, std::string target_)
        : id(std::move(id_)), source(std::move(source_)), target(std::move(target_)) {}
};

/// Single request object: everything needed to produce one diagram
struct DiagramRequest {
    std::vector<NodeDescriptor> nodes;
    std::vector<EdgeDescriptor> edges;
};

}  // namespace drawlink

#pragma once

#include "drawlink/core/DiagramRequest.h"

#include <string>

namespace drawlink {

/// Reads diagram requests from JSON.
///
/// Accepts the GraphQL resolver event shape
/// {"arguments": {"nodes": [...], "edges": [...]}} as well as the bare
/// {"nodes": [...], "edges": [...]} object. Absent arrays are empty.
///
/// Node: {"id", "type", "label", "title", "position": {"x", "y"},
///        "parent"?, "image"?}
/// Edge: {"id", "source", "target"}
class RequestParser {
public:
    /// @throws MalformedInputError on invalid JSON, missing or wrongly typed fields
    static DiagramRequest fromJson(const std::string& json);

    /// @throws MalformedInputError if the file cannot be read or parsed
    static DiagramRequest fromJsonFile(const std::string& path);
};

}  // namespace drawlink

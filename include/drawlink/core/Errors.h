#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace drawlink {

/// Base class for every error raised while turning a request into a diagram
class DiagramError : public std::runtime_error {
public:
    explicit DiagramError(const std::string& message)
        : std::runtime_error(message) {}
};

/// A node or edge descriptor is missing a required field, or carries an
/// invalid value (duplicate id, self-parenting, unparseable JSON)
class MalformedInputError : public DiagramError {
public:
    explicit MalformedInputError(const std::string& message)
        : DiagramError(message) {}
};

/// A parent or edge endpoint names a node that does not exist
class ReferenceError : public DiagramError {
public:
    ReferenceError(const std::string& message, std::string unresolvedId)
        : DiagramError(message), unresolvedId_(std::move(unresolvedId)) {}

    const std::string& unresolvedId() const { return unresolvedId_; }

private:
    std::string unresolvedId_;
};

/// Geometry cannot be resolved for a node (empty container, containment cycle)
class LayoutError : public DiagramError {
public:
    LayoutError(const std::string& message, std::string nodeId)
        : DiagramError(message), nodeId_(std::move(nodeId)) {}

    const std::string& nodeId() const { return nodeId_; }

private:
    std::string nodeId_;
};

/// Compression or text-encoding failure, in either direction
class CodecError : public DiagramError {
public:
    explicit CodecError(const std::string& message)
        : DiagramError(message) {}
};

/// Icon bundle could not be read into the style catalog
class StyleCatalogError : public DiagramError {
public:
    explicit StyleCatalogError(const std::string& message)
        : DiagramError(message) {}
};

}  // namespace drawlink

#pragma once

#include <ostream>
#include <string>

namespace drawlink {

// Forward declarations
class DiagramGraph;
class LayoutResult;

/// Abstract interface for diagram exporters
class IExporter {
public:
    virtual ~IExporter() = default;

    /// Export a laid-out graph to string
    virtual std::string exportToString(const DiagramGraph& graph, const LayoutResult& layout) = 0;

    /// Export to an output stream
    virtual void exportToStream(const DiagramGraph& graph, const LayoutResult& layout,
                                std::ostream& out) = 0;

    /// Export to a file; false if the file cannot be opened
    virtual bool exportToFile(const DiagramGraph& graph, const LayoutResult& layout,
                              const std::string& filename) = 0;

    /// File extension for this export format (e.g., "drawio")
    virtual std::string fileExtension() const = 0;

    /// MIME type for this export format
    virtual std::string mimeType() const = 0;
};

}  // namespace drawlink

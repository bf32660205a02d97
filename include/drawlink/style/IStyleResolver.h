#pragma once

#include <optional>
#include <string>

namespace drawlink {

/// Reserved type identifier carrying the edge style
inline constexpr const char* EDGE_STYLE_ID = "edge";

/// Edge length of the generic resource icon, also used for bundle icons
inline constexpr double DEFAULT_ICON_SIZE = 43.0;

/// Visual attributes for one type identifier
struct StyleEntry {
    std::string style;              ///< draw.io style string
    std::optional<double> width;    ///< Fixed icon width, absent for containers
    std::optional<double> height;   ///< Fixed icon height, absent for containers

    bool hasFixedSize() const { return width.has_value() && height.has_value(); }
};

/// Lookup from type identifier to visual attributes.
///
/// resolve() never fails: identifiers without an entry get the
/// implementation's default entry. Implementations must be deterministic
/// and safe for concurrent readers once populated.
class IStyleResolver {
public:
    virtual ~IStyleResolver() = default;

    /// Entry for typeId, or the default entry when typeId is unknown
    virtual StyleEntry resolve(const std::string& typeId) const = 0;

    /// Style applied to every edge
    virtual StyleEntry edgeStyle() const { return resolve(EDGE_STYLE_ID); }
};

}  // namespace drawlink

#pragma once

#include "IStyleResolver.h"

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

namespace drawlink {

/// Style table: built-in container/edge styles merged with an icon bundle.
///
/// The catalog is populated before first use and read-only afterwards, so
/// layout and export may share one instance across threads without locking.
/// loadIconBundle() is guarded by std::call_once: a catalog is populated
/// from a bundle at most once.
///
/// Example:
/// @code
/// auto& catalog = drawlink::StyleCatalog::shared();
/// catalog.loadIconBundle("/opt/icons");   // once, at startup
/// drawlink::DiagramPipeline pipeline(catalog);
/// @endcode
class StyleCatalog : public IStyleResolver {
public:
    /// Catalog holding the built-in entries only
    StyleCatalog();

    StyleCatalog(const StyleCatalog&) = delete;
    StyleCatalog& operator=(const StyleCatalog&) = delete;

    /// Process-wide catalog, created with the built-in entries on first call
    static StyleCatalog& shared();

    /// Generic resource icon returned for unknown identifiers
    static const StyleEntry& defaultEntry();

    /// Style for an image icon embedding the given SVG document
    static std::string imageStyle(const std::string& svgBytes);

    StyleEntry resolve(const std::string& typeId) const override;

    /// Add or replace an entry. Must happen before the catalog is shared.
    void registerType(const std::string& typeId, StyleEntry entry);

    /// Register every *.svg below directory (recursive) under its file stem.
    ///
    /// Existing entries win over bundle icons. Runs at most once per catalog;
    /// later calls return 0 without touching the table.
    /// @return Number of icons added
    /// @throws StyleCatalogError if directory is missing or unlistable, or an icon cannot
    ///         be read. The catalog is left unchanged in that case.
    size_t loadIconBundle(const std::filesystem::path& directory);

    bool isBundleLoaded() const { return bundleLoaded_; }

    bool contains(const std::string& typeId) const;
    size_t size() const { return entries_.size(); }

private:
    void registerBuiltins();

    std::unordered_map<std::string, StyleEntry> entries_;
    std::once_flag bundleOnce_;
    bool bundleLoaded_ = false;
};

}  // namespace drawlink

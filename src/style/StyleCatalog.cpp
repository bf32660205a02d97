#include "drawlink/style/StyleCatalog.h"
#include "drawlink/common/Logger.h"
#include "drawlink/core/Errors.h"
#include "drawlink/encode/DiagramCodec.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace drawlink {

namespace {

// Styles from the draw.io AWS shape library
constexpr const char* DEFAULT_ICON_STYLE =
    "gradientDirection=north;outlineConnect=0;fontColor=#232F3E;gradientColor=#505863;"
    "fillColor=#1E262E;strokeColor=#ffffff;dashed=0;verticalLabelPosition=bottom;"
    "verticalAlign=top;align=center;html=1;fontSize=11;fontStyle=0;fontFamily=Tahoma;"
    "aspect=fixed;shape=mxgraph.aws4.resourceIcon;resIcon=mxgraph.aws4.general;";

constexpr const char* GROUP_POINTS =
    "points=[[0,0],[0.25,0],[0.5,0],[0.75,0],[1,0],[1,0.25],[1,0.5],[1,0.75],[1,1],"
    "[0.75,1],[0.5,1],[0.25,1],[0,1],[0,0.75],[0,0.5],[0,0.25]];outlineConnect=0;"
    "gradientColor=none;html=1;whiteSpace=wrap;fontSize=11;fontStyle=0;fontFamily=Tahoma;"
    "shape=mxgraph.aws4.group;";

constexpr const char* IMAGE_STYLE_PREFIX =
    "shape=image;verticalLabelPosition=bottom;verticalAlign=top;fontSize=11;"
    "fontFamily=Tahoma;aspect=fixed;imageAspect=0;image=data:image/svg+xml,";

std::string groupStyle(const std::string& icon, const std::string& stroke,
                       const std::string& fill, const std::string& fontColor,
                       const std::string& extra = "") {
    return std::string(GROUP_POINTS) + "grIcon=" + icon + ";" + extra +
           "strokeColor=" + stroke + ";fillColor=" + fill +
           ";verticalAlign=top;align=left;spacingLeft=30;fontColor=" + fontColor + ";dashed=0;";
}

std::string dashedGroupStyle(const std::string& color) {
    return "fillColor=none;strokeColor=" + color +
           ";dashed=1;verticalAlign=top;fontSize=11;fontStyle=0;fontColor=" + color +
           ";fontFamily=Tahoma;";
}

}  // namespace

StyleCatalog::StyleCatalog() {
    registerBuiltins();
}

StyleCatalog& StyleCatalog::shared() {
    static StyleCatalog catalog;
    return catalog;
}

const StyleEntry& StyleCatalog::defaultEntry() {
    static const StyleEntry entry{DEFAULT_ICON_STYLE, DEFAULT_ICON_SIZE, DEFAULT_ICON_SIZE};
    return entry;
}

std::string StyleCatalog::imageStyle(const std::string& svgBytes) {
    return IMAGE_STYLE_PREFIX + codec::base64Encode(svgBytes);
}

void StyleCatalog::registerBuiltins() {
    // Containers carry no fixed size: their boxes come from their children
    entries_["account"] = {groupStyle("mxgraph.aws4.group_aws_cloud_alt", "#232F3E", "none", "#232F3E"),
                           std::nullopt, std::nullopt};
    entries_["availabilityZone"] = {dashedGroupStyle("#147EBA"), std::nullopt, std::nullopt};
    entries_[EDGE_STYLE_ID] = {
        "html=1;endArrow=block;elbow=vertical;startArrow=none;endFill=1;strokeColor=#545B64;"
        "rounded=0;jumpStyle=gap;opacity=80;",
        std::nullopt, std::nullopt};
    entries_["region"] = {groupStyle("mxgraph.aws4.group_region", "#147EBA", "none", "#147EBA"),
                          std::nullopt, std::nullopt};
    entries_["subnet"] = {groupStyle("mxgraph.aws4.group_security_group", "#248814", "#E9F3E6",
                                     "#248814", "grStroke=0;"),
                          std::nullopt, std::nullopt};
    entries_["type"] = {dashedGroupStyle("#5A6C86"), std::nullopt, std::nullopt};
    entries_["vpc"] = {groupStyle("mxgraph.aws4.group_vpc", "#248814", "none", "#AAB7B8"),
                       std::nullopt, std::nullopt};
}

StyleEntry StyleCatalog::resolve(const std::string& typeId) const {
    auto it = entries_.find(typeId);
    if (it != entries_.end()) {
        return it->second;
    }
    return defaultEntry();
}

void StyleCatalog::registerType(const std::string& typeId, StyleEntry entry) {
    entries_[typeId] = std::move(entry);
}

bool StyleCatalog::contains(const std::string& typeId) const {
    return entries_.find(typeId) != entries_.end();
}

size_t StyleCatalog::loadIconBundle(const std::filesystem::path& directory) {
    size_t added = 0;
    bool ran = false;

    // call_once leaves the flag unset when the callable throws, so a failed
    // load can be retried. Nothing reaches entries_ until every icon is read.
    std::call_once(bundleOnce_, [&]() {
        ran = true;
        std::error_code ec;
        if (!std::filesystem::is_directory(directory, ec)) {
            throw StyleCatalogError("icon bundle directory not found: " + directory.string());
        }

        // Sorted so duplicate stems resolve the same way on every platform
        std::vector<std::filesystem::path> icons;
        std::filesystem::recursive_directory_iterator it(directory, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            bool regular = it->is_regular_file(ec);
            if (ec) {
                break;
            }
            if (regular && it->path().extension() == ".svg") {
                icons.push_back(it->path());
            }
        }
        if (ec) {
            throw StyleCatalogError("failed to list icon bundle " + directory.string() + ": " +
                                    ec.message());
        }
        std::sort(icons.begin(), icons.end());

        std::unordered_map<std::string, StyleEntry> loaded;
        for (const auto& path : icons) {
            std::string name = path.stem().string();
            if (contains(name) || loaded.count(name) > 0) {
                LOG_TRACE("icon '{}' already defined, keeping existing style", name);
                continue;
            }

            std::ifstream file(path, std::ios::binary);
            if (!file.is_open()) {
                throw StyleCatalogError("failed to read icon: " + path.string());
            }
            std::string svg((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
            if (file.bad()) {
                throw StyleCatalogError("failed to read icon: " + path.string());
            }

            loaded.emplace(name, StyleEntry{imageStyle(svg), DEFAULT_ICON_SIZE, DEFAULT_ICON_SIZE});
        }

        added = loaded.size();
        entries_.merge(loaded);
        bundleLoaded_ = true;
        LOG_INFO("loaded {} icons from {} ({} styles total)", added, directory.string(), entries_.size());
    });

    if (!ran) {
        LOG_DEBUG("icon bundle already loaded, ignoring {}", directory.string());
    }
    return added;
}

}  // namespace drawlink

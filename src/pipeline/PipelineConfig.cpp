#include "drawlink/pipeline/PipelineConfig.h"
#include "drawlink/common/Logger.h"
#include "drawlink/core/Errors.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace drawlink {

std::string PipelineConfig::policyToString(EmptyContainerPolicy policy) {
    switch (policy) {
        case EmptyContainerPolicy::Reject: return "reject";
        case EmptyContainerPolicy::ZeroSizeAtCenter: return "zeroSizeAtCenter";
    }
    return "reject";
}

EmptyContainerPolicy PipelineConfig::stringToPolicy(const std::string& str) {
    if (str == "reject") return EmptyContainerPolicy::Reject;
    if (str == "zeroSizeAtCenter") return EmptyContainerPolicy::ZeroSizeAtCenter;
    throw MalformedInputError("unknown emptyContainerPolicy: " + str);
}

PipelineConfig PipelineConfig::fromJson(const std::string& jsonStr) {
    PipelineConfig config;

    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw MalformedInputError("pipeline config must be a JSON object");
        }

        if (j.contains("layout")) {
            const json& layout = j.at("layout");
            LayoutOptions& opts = config.options.layout;
            opts.margin = layout.value("margin", opts.margin);
            opts.defaultIconSize = layout.value("defaultIconSize", opts.defaultIconSize);
            if (layout.contains("emptyContainerPolicy")) {
                opts.emptyContainerPolicy =
                    stringToPolicy(layout.at("emptyContainerPolicy").get<std::string>());
            }
        }

        if (j.contains("url")) {
            const json& url = j.at("url");
            config.options.url.baseUrl = url.value("baseUrl", config.options.url.baseUrl);
            config.options.url.title = url.value("title", config.options.url.title);
        }

        if (j.contains("codec")) {
            config.options.compressionLevel =
                j.at("codec").value("compressionLevel", config.options.compressionLevel);
        }

        if (j.contains("iconBundle") && !j.at("iconBundle").is_null()) {
            config.iconBundle = j.at("iconBundle").get<std::string>();
        }
    } catch (const json::exception& e) {
        throw MalformedInputError(std::string("invalid pipeline config: ") + e.what());
    }

    LOG_DEBUG("config: margin={}, policy={}, level={}, iconBundle={}",
              config.options.layout.margin,
              policyToString(config.options.layout.emptyContainerPolicy),
              config.options.compressionLevel,
              config.iconBundle.value_or("<none>"));
    return config;
}

PipelineConfig PipelineConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw MalformedInputError("cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

}  // namespace drawlink

#include "drawlink/pipeline/RequestParser.h"
#include "drawlink/common/Logger.h"
#include "drawlink/core/Errors.h"

#include <nlohmann/json.hpp>
#include <format>
#include <optional>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace drawlink {

namespace {

const json& requireMember(const json& obj, const char* key, const char* kind, size_t index) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        throw MalformedInputError(std::format("{} #{} is missing required field '{}'", kind, index, key));
    }
    return *it;
}

std::string requireString(const json& obj, const char* key, const char* kind, size_t index) {
    const json& value = requireMember(obj, key, kind, index);
    if (!value.is_string()) {
        throw MalformedInputError(std::format("{} #{} field '{}' must be a string", kind, index, key));
    }
    return value.get<std::string>();
}

std::optional<std::string> optionalString(const json& obj, const char* key, const char* kind,
                                          size_t index) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw MalformedInputError(std::format("{} #{} field '{}' must be a string", kind, index, key));
    }
    return it->get<std::string>();
}

double requireCoordinate(const json& pos, const char* axis, size_t index) {
    auto it = pos.find(axis);
    if (it == pos.end() || !it->is_number()) {
        throw MalformedInputError(
            std::format("node #{} field 'position.{}' must be a number", index, axis));
    }
    return it->get<double>();
}

Point requirePosition(const json& obj, size_t index) {
    const json& pos = requireMember(obj, "position", "node", index);
    if (!pos.is_object()) {
        throw MalformedInputError(std::format("node #{} field 'position' must be an object", index));
    }
    return Point{requireCoordinate(pos, "x", index), requireCoordinate(pos, "y", index)};
}

const json* findArray(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_array()) {
        throw MalformedInputError(std::format("'{}' must be an array", key));
    }
    return &*it;
}

}  // namespace

DiagramRequest RequestParser::fromJson(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw MalformedInputError(std::string("invalid request JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw MalformedInputError("request must be a JSON object");
    }

    const json& body = j.contains("arguments") ? j.at("arguments") : j;
    if (!body.is_object()) {
        throw MalformedInputError("'arguments' must be a JSON object");
    }

    DiagramRequest request;

    if (const json* nodes = findArray(body, "nodes")) {
        request.nodes.reserve(nodes->size());
        for (size_t i = 0; i < nodes->size(); ++i) {
            const json& n = (*nodes)[i];
            if (!n.is_object()) {
                throw MalformedInputError(std::format("node #{} must be an object", i));
            }
            NodeDescriptor desc(requireString(n, "id", "node", i),
                                requireString(n, "type", "node", i),
                                requireString(n, "label", "node", i),
                                requireString(n, "title", "node", i),
                                requirePosition(n, i));
            desc.parent = optionalString(n, "parent", "node", i);
            desc.image = optionalString(n, "image", "node", i);
            request.nodes.push_back(std::move(desc));
        }
    }

    if (const json* edges = findArray(body, "edges")) {
        request.edges.reserve(edges->size());
        for (size_t i = 0; i < edges->size(); ++i) {
            const json& e = (*edges)[i];
            if (!e.is_object()) {
                throw MalformedInputError(std::format("edge #{} must be an object", i));
            }
            request.edges.emplace_back(requireString(e, "id", "edge", i),
                                       requireString(e, "source", "edge", i),
                                       requireString(e, "target", "edge", i));
        }
    }

    LOG_DEBUG("parsed request: {} nodes, {} edges", request.nodes.size(), request.edges.size());
    return request;
}

DiagramRequest RequestParser::fromJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw MalformedInputError("cannot open request file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

}  // namespace drawlink

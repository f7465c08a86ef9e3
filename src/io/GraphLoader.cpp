#include "accessroute/io/GraphLoader.h"
#include "accessroute/core/GeoUtils.h"
#include "accessroute/common/Logger.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace accessroute {

namespace {

/// Tag value as text. Lists use their first element.
std::optional<std::string> tagText(const json& edge, const char* key) {
    auto it = edge.find(key);
    if (it == edge.end() || it->is_null()) {
        return std::nullopt;
    }
    const json* value = &*it;
    if (value->is_array()) {
        if (value->empty()) {
            return std::nullopt;
        }
        value = &value->front();
    }
    if (value->is_string()) return value->get<std::string>();
    if (value->is_boolean()) return value->get<bool>() ? std::string("yes") : std::string("no");
    if (value->is_number()) {
        // Shortest text that parses back to the same double
        return fmt::format("{}", value->get<double>());
    }
    return std::nullopt;
}

EdgeAttributes parseAttributes(const json& edge) {
    EdgeAttributes attrs;
    if (auto v = tagText(edge, "highway")) attrs.pathClass = tags::parsePathClass(*v);
    if (auto v = tagText(edge, "surface")) attrs.surface = tags::parseSurface(*v);
    if (auto v = tagText(edge, "wheelchair")) attrs.wheelchair = tags::parseWheelchair(*v);
    if (auto v = tagText(edge, "incline")) attrs.inclinePercent = tags::parseIncline(*v);
    if (auto v = tagText(edge, "width")) attrs.widthMeters = tags::parseWidth(*v);
    if (auto v = tagText(edge, "ramp")) attrs.hasRamp = tags::parseFlag(*v);
    if (auto v = tagText(edge, "steps")) attrs.hasSteps = tags::parseFlag(*v);
    if (auto v = tagText(edge, "crossing")) attrs.crossing = tags::parseCrossing(*v);

    if (attrs.pathClass == PathClass::Steps) {
        attrs.hasSteps = true;
    }
    if (attrs.pathClass == PathClass::Crossing && attrs.crossing == CrossingKind::None) {
        attrs.crossing = CrossingKind::Unknown;
    }
    return attrs;
}

Polyline parseGeometry(const json& edge) {
    Polyline line;
    auto it = edge.find("geometry");
    if (it == edge.end() || !it->is_array()) {
        return line;
    }
    for (const auto& point : *it) {
        if (point.is_array() && point.size() >= 2 && point[0].is_number() && point[1].is_number()) {
            GeoPoint p(point[0].get<double>(), point[1].get<double>());
            if (p.isValid()) {
                line.push_back(p);
            }
        }
    }
    return line;
}

void skipNode(GraphLoadReport& report, size_t index, const std::string& reason) {
    std::string issue = "node #" + std::to_string(index) + ": " + reason;
    LOG_WARN("Skipping {}", issue);
    report.issues.push_back(std::move(issue));
    ++report.nodesSkipped;
}

void skipEdge(GraphLoadReport& report, size_t index, const std::string& reason) {
    std::string issue = "edge #" + std::to_string(index) + ": " + reason;
    LOG_WARN("Dropping {}", issue);
    report.issues.push_back(std::move(issue));
    ++report.edgesSkipped;
}

void loadNodes(const json& nodes, PathGraph& graph, GraphLoadReport& report) {
    for (size_t i = 0; i < nodes.size(); ++i) {
        const json& node = nodes[i];
        if (!node.is_object() || !node.contains("id") || !node["id"].is_number_integer() ||
            !node.contains("lat") || !node["lat"].is_number() ||
            !node.contains("lon") || !node["lon"].is_number()) {
            skipNode(report, i, "missing or non-numeric id/lat/lon");
            continue;
        }

        const auto sourceId = node["id"].get<int64_t>();
        GeoPoint position(node["lat"].get<double>(), node["lon"].get<double>());
        if (graph.findBySourceId(sourceId)) {
            skipNode(report, i, "duplicate id " + std::to_string(sourceId));
            continue;
        }

        try {
            graph.addNode(position, sourceId);
            ++report.nodesLoaded;
        } catch (const std::invalid_argument& e) {
            skipNode(report, i, e.what());
        }
    }
}

void loadEdges(const json& edges, PathGraph& graph, GraphLoadReport& report) {
    for (size_t i = 0; i < edges.size(); ++i) {
        const json& edge = edges[i];
        if (!edge.is_object() || !edge.contains("u") || !edge["u"].is_number_integer() ||
            !edge.contains("v") || !edge["v"].is_number_integer()) {
            skipEdge(report, i, "missing or non-integer u/v");
            continue;
        }

        const auto u = edge["u"].get<int64_t>();
        const auto v = edge["v"].get<int64_t>();
        auto from = graph.findBySourceId(u);
        auto to = graph.findBySourceId(v);
        if (!from || !to) {
            skipEdge(report, i, "dangling endpoint " + std::to_string(from ? v : u));
            continue;
        }

        EdgeData data(*from, *to, 0.0);
        data.geometry = parseGeometry(edge);
        data.attributes = parseAttributes(edge);

        auto length = edge.find("length");
        if (length != edge.end() && !length->is_null()) {
            if (!length->is_number()) {
                skipEdge(report, i, "non-numeric length");
                continue;
            }
            data.lengthMeters = length->get<double>();
        } else {
            Polyline line = data.geometry;
            if (line.size() < 2) {
                line = {graph.getNode(*from).position, graph.getNode(*to).position};
            }
            data.lengthMeters = geo::polylineLength(line);
            ++report.lengthsDerived;
        }

        try {
            graph.addEdge(data);
            ++report.edgesLoaded;
        } catch (const std::invalid_argument& e) {
            skipEdge(report, i, e.what());
        }
    }
}

}  // namespace

std::shared_ptr<PathGraph> GraphLoader::loadFromString(const std::string& text, GraphLoadReport* report) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw GraphLoadError(std::string("Invalid graph JSON: ") + e.what());
    }

    if (!document.is_object() || !document.contains("nodes") || !document["nodes"].is_array()) {
        throw GraphLoadError("Graph JSON must be an object with a \"nodes\" array");
    }
    if (document.contains("edges") && !document["edges"].is_array()) {
        throw GraphLoadError("Graph JSON \"edges\" must be an array");
    }

    GraphLoadReport local;
    GraphLoadReport& r = report ? *report : local;
    r = GraphLoadReport{};

    auto graph = std::make_shared<PathGraph>();
    loadNodes(document["nodes"], *graph, r);
    if (document.contains("edges")) {
        loadEdges(document["edges"], *graph, r);
    }

    LOG_INFO("Loaded path graph: {} nodes, {} edges ({} nodes and {} edges skipped)",
             r.nodesLoaded, r.edgesLoaded, r.nodesSkipped, r.edgesSkipped);
    return graph;
}

std::shared_ptr<PathGraph> GraphLoader::loadFromFile(const std::string& path, GraphLoadReport* report) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw GraphLoadError("Cannot open graph file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    LOG_DEBUG("Reading path graph from {}", path);
    return loadFromString(buffer.str(), report);
}

std::string GraphLoader::toJson(const PathGraph& graph) {
    json j;

    json nodes = json::array();
    for (const auto& node : graph.nodes()) {
        const int64_t id = node.sourceId != NO_SOURCE_ID ? node.sourceId : static_cast<int64_t>(node.id);
        nodes.push_back({{"id", id}, {"lat", node.position.lat}, {"lon", node.position.lon}});
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto& edge : graph.edges()) {
        const auto& from = graph.getNode(edge.from);
        const auto& to = graph.getNode(edge.to);
        const auto& attrs = edge.attributes;

        json e = {
            {"u", from.sourceId != NO_SOURCE_ID ? from.sourceId : static_cast<int64_t>(from.id)},
            {"v", to.sourceId != NO_SOURCE_ID ? to.sourceId : static_cast<int64_t>(to.id)},
            {"length", edge.lengthMeters},
            {"highway", tags::toString(attrs.pathClass)},
            {"surface", tags::toString(attrs.surface)},
            {"wheelchair", tags::toString(attrs.wheelchair)},
            {"crossing", tags::toString(attrs.crossing)},
            {"steps", attrs.hasSteps},
            {"ramp", attrs.hasRamp}
        };
        if (attrs.inclinePercent) e["incline"] = *attrs.inclinePercent;
        if (attrs.widthMeters) e["width"] = *attrs.widthMeters;

        json geometry = json::array();
        for (const auto& p : edge.geometry) {
            geometry.push_back({p.lat, p.lon});
        }
        e["geometry"] = geometry;
        edges.push_back(e);
    }
    j["edges"] = edges;

    return j.dump(2);
}

bool GraphLoader::saveToFile(const PathGraph& graph, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file << toJson(graph);
    return file.good();
}

}  // namespace accessroute

#pragma once

#include "../core/PathGraph.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace accessroute {

/// Graph file missing or not valid JSON
class GraphLoadError : public std::runtime_error {
public:
    explicit GraphLoadError(const std::string& message) : std::runtime_error(message) {}
};

/// What a graph load kept and what it dropped
struct GraphLoadReport {
    size_t nodesLoaded = 0;
    size_t edgesLoaded = 0;
    size_t nodesSkipped = 0;
    size_t edgesSkipped = 0;
    size_t lengthsDerived = 0;         ///< Edges whose length came from geometry
    std::vector<std::string> issues;   ///< One entry per skipped item

    bool clean() const { return nodesSkipped == 0 && edgesSkipped == 0; }
};

/// Loads the path network from the JSON export of the geodata source.
///
/// Format:
/// @code
/// {
///   "nodes": [{"id": 101, "lat": -3.7681, "lon": -38.4772}, ...],
///   "edges": [{"u": 101, "v": 102, "length": 35.2,
///              "geometry": [[-3.7681, -38.4772], ...],
///              "highway": "footway", "surface": "asphalt",
///              "wheelchair": "yes", "incline": "4%", "width": "2",
///              "ramp": "no", "steps": false, "crossing": "marked"}, ...]
/// }
/// @endcode
///
/// Malformed nodes and edges are skipped and logged; the rest of the
/// file still loads. Tag values may be strings, numbers, booleans, or
/// lists (the first element is used).
class GraphLoader {
public:
    /// @throws GraphLoadError if the file cannot be read or parsed
    static std::shared_ptr<PathGraph> loadFromFile(const std::string& path,
                                                   GraphLoadReport* report = nullptr);

    /// @throws GraphLoadError if @p json is not a valid graph document
    static std::shared_ptr<PathGraph> loadFromString(const std::string& json,
                                                     GraphLoadReport* report = nullptr);

    /// Serialize a graph in the same format
    static std::string toJson(const PathGraph& graph);

    /// Write toJson() output to @p path
    /// @return true if save succeeded
    static bool saveToFile(const PathGraph& graph, const std::string& path);
};

}  // namespace accessroute

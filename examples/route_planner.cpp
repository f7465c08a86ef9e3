#include <accessroute/accessroute.h>
#include <accessroute/common/Logger.h>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace accessroute;

namespace {

struct Arguments {
    std::string graphPath;
    std::string poiPath;
    std::string configPath;
    std::string profile = profiles::STANDARD;
    std::string from;
    std::string to;
    std::string strategy;
    std::string gpxPath;
    std::string logDir;
    bool listProfiles = false;
    bool listPois = false;
    bool verbose = false;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " --graph=FILE --from=ENDPOINT --to=ENDPOINT [options]\n"
              << "\n"
              << "Endpoints: a POI name, \"lat,lon\", or node:<source id>\n"
              << "\n"
              << "Options:\n"
              << "  --pois=FILE          POI catalog\n"
              << "  --config=FILE        Planner options (JSON)\n"
              << "  --profile=KEY        Mobility profile (default: standard)\n"
              << "  --strategy=NAME      dijkstra | bidirectional | astar\n"
              << "  --gpx=FILE           Write the route as GPX\n"
              << "  --log-dir=DIR        Also write logs to DIR/accessroute.log\n"
              << "  --list-profiles      Print available profiles and exit\n"
              << "  --list-pois          Print the POI catalog and exit\n"
              << "  -v, --verbose        Debug logging\n";
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::optional<Arguments> parseArguments(int argc, char* argv[]) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto valueOf = [&arg](const std::string& flag) { return arg.substr(flag.size()); };

        if (startsWith(arg, "--graph=")) {
            args.graphPath = valueOf("--graph=");
        } else if (startsWith(arg, "--pois=")) {
            args.poiPath = valueOf("--pois=");
        } else if (startsWith(arg, "--config=")) {
            args.configPath = valueOf("--config=");
        } else if (startsWith(arg, "--profile=")) {
            args.profile = valueOf("--profile=");
        } else if (startsWith(arg, "--from=")) {
            args.from = valueOf("--from=");
        } else if (startsWith(arg, "--to=")) {
            args.to = valueOf("--to=");
        } else if (startsWith(arg, "--strategy=")) {
            args.strategy = valueOf("--strategy=");
        } else if (startsWith(arg, "--gpx=")) {
            args.gpxPath = valueOf("--gpx=");
        } else if (startsWith(arg, "--log-dir=")) {
            args.logDir = valueOf("--log-dir=");
        } else if (arg == "--list-profiles") {
            args.listProfiles = true;
        } else if (arg == "--list-pois") {
            args.listPois = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    return args;
}

/// Parse "lat,lon"
std::optional<GeoPoint> parseCoordinates(const std::string& text) {
    const auto comma = text.find(',');
    if (comma == std::string::npos) {
        return std::nullopt;
    }
    char* end = nullptr;
    const std::string latText = text.substr(0, comma);
    const std::string lonText = text.substr(comma + 1);
    double lat = std::strtod(latText.c_str(), &end);
    if (end == latText.c_str() || *end != '\0') {
        return std::nullopt;
    }
    double lon = std::strtod(lonText.c_str(), &end);
    if (end == lonText.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return GeoPoint(lat, lon);
}

std::optional<RouteEndpoint> resolveEndpoint(const std::string& text,
                                             const PathGraph& graph,
                                             const PoiCatalog& catalog) {
    if (startsWith(text, "node:")) {
        char* end = nullptr;
        const std::string idText = text.substr(5);
        long long sourceId = std::strtoll(idText.c_str(), &end, 10);
        if (end == idText.c_str() || *end != '\0') {
            return std::nullopt;
        }
        auto node = graph.findBySourceId(sourceId);
        if (!node) {
            return std::nullopt;
        }
        return RouteEndpoint::atNode(*node);
    }
    if (const PointOfInterest* poi = catalog.find(text)) {
        return RouteEndpoint::at(poi->position);
    }
    if (auto point = parseCoordinates(text)) {
        return RouteEndpoint::at(*point);
    }
    return std::nullopt;
}

void listProfiles(const ProfileRegistry& registry) {
    for (const auto& key : registry.keys()) {
        const auto& profile = registry.get(key);
        std::cout << std::left << std::setw(22) << key << profile.displayName
                  << " (" << profile.baseSpeedMps << " m/s)\n";
    }
}

void listPois(const PoiCatalog& catalog) {
    for (const auto& category : catalog.categories()) {
        std::cout << "---" << category << "---\n";
        for (const auto* poi : catalog.inCategory(category)) {
            std::cout << "  " << poi->name << "\n";
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parseArguments(argc, argv);
    if (!parsed) {
        printUsage(argv[0]);
        return 1;
    }
    const Arguments& args = *parsed;

    if (args.logDir.empty()) {
        Logger::initialize();
    } else {
        Logger::initialize(args.logDir, true);
    }
    if (args.verbose) {
        Logger::setLevel(LogLevel::Debug);
    }

    ProfileRegistry registry = ProfileRegistry::builtin();
    if (args.listProfiles) {
        listProfiles(registry);
        return 0;
    }

    // The route tool keeps working without POIs
    PoiCatalog catalog;
    if (!args.poiPath.empty()) {
        try {
            catalog = PoiCatalog::loadFromFile(args.poiPath);
        } catch (const PoiLoadError& e) {
            LOG_WARN("Continuing without POIs: {}", e.what());
        }
    }
    if (args.listPois) {
        listPois(catalog);
        return 0;
    }

    if (args.graphPath.empty() || args.from.empty() || args.to.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    PlannerOptions options;
    std::shared_ptr<PathGraph> graph;
    try {
        if (!args.configPath.empty()) {
            options = ConfigSerializer::loadPlannerOptions(args.configPath);
        }
        graph = GraphLoader::loadFromFile(args.graphPath);
    } catch (const GraphLoadError& e) {
        LOG_ERROR("{}", e.what());
        return 1;
    } catch (const ConfigError& e) {
        LOG_ERROR("{}", e.what());
        return 1;
    }

    RouteRequest request;
    request.profileKey = args.profile;
    if (!args.strategy.empty()) {
        request.strategy = parseSearchStrategy(args.strategy);
        if (!request.strategy) {
            LOG_ERROR("Unknown search strategy: {}", args.strategy);
            return 1;
        }
    }

    auto origin = resolveEndpoint(args.from, *graph, catalog);
    auto destination = resolveEndpoint(args.to, *graph, catalog);
    if (!origin || !destination) {
        LOG_ERROR("Cannot resolve endpoint '{}'", !origin ? args.from : args.to);
        return 2;
    }
    request.origin = *origin;
    request.destination = *destination;

    RoutePlanner planner(graph, std::move(registry), options);
    PlanOutcome outcome = planner.plan(request);

    if (!outcome.ok()) {
        std::cerr << toString(outcome.status) << ": " << outcome.message << "\n";
        return 2;
    }

    const Route& route = outcome.route;
    std::cout << std::fixed << std::setprecision(1)
              << "Profile:   " << route.profileKey << "\n"
              << "Strategy:  " << toString(outcome.strategy) << "\n"
              << "Distance:  " << route.distanceMeters << " m\n"
              << "Time:      " << route.durationMinutes() << " min\n"
              << "Steps:     " << route.stepCount << "\n"
              << "Explored:  " << outcome.nodesExplored << " nodes\n";

    if (!args.gpxPath.empty()) {
        GpxExportOptions gpxOptions;
        gpxOptions.trackName = args.from + " -> " + args.to;
        GpxExport gpx(gpxOptions);
        if (!gpx.exportToFile(route, args.gpxPath)) {
            LOG_ERROR("Cannot write GPX file {}", args.gpxPath);
            return 1;
        }
        std::cout << "GPX:       " << args.gpxPath << "\n";
    }

    Logger::flush();
    return 0;
}

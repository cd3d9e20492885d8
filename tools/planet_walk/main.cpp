#include "planetwalk/geogrid.h"
#include "planetwalk/landscape.h"
#include "planetwalk/log.h"
#include "planetwalk/recenter.h"
#include "planetwalk/region.h"
#include "planetwalk/runtime_config.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <numbers>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;
namespace gg = planetwalk::geogrid;
namespace rg = planetwalk::region;
namespace rc = planetwalk::recenter;
namespace ls = planetwalk::landscape;
using json = nlohmann::ordered_json;

struct Cli {
    std::string raster_path;
    std::string config_path;
    std::optional<double> lon;
    std::optional<double> lat;
    std::optional<int> radius;
    std::optional<int> subpixels;
    std::optional<double> planet_radius;
    std::optional<rg::DistanceMetric> metric;
    double heading = 90.0; // degrees clockwise from north
    double speed = 4.0;    // cells per second
    double seconds = 30.0;
    double dt = 0.1;
    int agents = 0;
    int verbosity = 0;
};

static void usage() {
    std::cerr
        << "Usage: planet_walk [raster.png|raster.tga] [--lon DEG] [--lat DEG] [--heading DEG]\n"
        << "       [--speed CELLS_PER_S] [--seconds S] [--dt S] [--agents N] [--radius N]\n"
        << "       [--metric manhattan|euclidean|chebyshev] [--subpixels N] [--planet-radius R]\n"
        << "       [--config planetwalk.json] [-v|-vv]\n\n"
        << "Walks a subject across the planet at a fixed heading and prints one JSON\n"
        << "line per terrain recenter, followed by a summary line.\n";
}

static int parse_cli(int argc, char** argv, Cli& cli) {
    std::vector<std::string> pos;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--lon") == 0 && i + 1 < argc) cli.lon = std::stod(argv[++i]);
        else if (std::strcmp(argv[i], "--lat") == 0 && i + 1 < argc) cli.lat = std::stod(argv[++i]);
        else if (std::strcmp(argv[i], "--heading") == 0 && i + 1 < argc) cli.heading = std::stod(argv[++i]);
        else if (std::strcmp(argv[i], "--speed") == 0 && i + 1 < argc) cli.speed = std::stod(argv[++i]);
        else if (std::strcmp(argv[i], "--seconds") == 0 && i + 1 < argc) cli.seconds = std::stod(argv[++i]);
        else if (std::strcmp(argv[i], "--dt") == 0 && i + 1 < argc) cli.dt = std::stod(argv[++i]);
        else if (std::strcmp(argv[i], "--agents") == 0 && i + 1 < argc) cli.agents = std::stoi(argv[++i]);
        else if (std::strcmp(argv[i], "--radius") == 0 && i + 1 < argc) cli.radius = std::stoi(argv[++i]);
        else if (std::strcmp(argv[i], "--subpixels") == 0 && i + 1 < argc) cli.subpixels = std::stoi(argv[++i]);
        else if (std::strcmp(argv[i], "--planet-radius") == 0 && i + 1 < argc) cli.planet_radius = std::stod(argv[++i]);
        else if (std::strcmp(argv[i], "--metric") == 0 && i + 1 < argc) {
            cli.metric = rg::parse_metric(argv[++i]);
            if (!cli.metric) {
                std::cerr << "Error: unknown metric " << argv[i] << '\n';
                return -1;
            }
        }
        else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) cli.config_path = argv[++i];
        else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0)
            cli.verbosity = std::min(cli.verbosity + 1, 2);
        else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0)
            cli.verbosity = 2;
        else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            usage();
            return 1;
        } else {
            pos.emplace_back(argv[i]);
        }
    }

    if (pos.size() > 1 || !(cli.dt > 0.0) || cli.seconds < 0.0 || cli.agents < 0) {
        usage();
        return -1;
    }
    if (!pos.empty()) cli.raster_path = pos[0];
    return 0;
}

// Agents are placed on distinct cells around the centre, inside the agent radius.
static std::vector<gg::GridAddress> spawn_agents(const gg::GeoGrid& grid, const rc::RecenterController& controller,
                                                 int count, int search_radius) {
    std::vector<gg::GridAddress> out;
    std::unordered_set<gg::GridAddress> occupied;
    const gg::GridAddress center = controller.center().address;
    const int spread = std::max(1, 2 * controller.options().region_radius / 3);

    for (int n = 0; n < count; ++n) {
        const double rx = ls::deterministic_random(center.i + n, center.j, 1);
        const double ry = ls::deterministic_random(center.i, center.j + n, 2);
        const int di = static_cast<int>(std::lround((rx * 2.0 - 1.0) * spread * 0.5));
        const int dj = static_cast<int>(std::lround((ry * 2.0 - 1.0) * spread * 0.5));
        const gg::GridAddress desired = grid.neighbor(center, di, dj);
        const gg::GridAddress placed = ls::find_nearest_free_cell(grid, desired, occupied, search_radius);
        occupied.insert(placed);
        out.push_back(placed);
    }
    return out;
}

static size_t count_nearby_elements(const gg::GeoGrid& grid, const rc::TerrainSnapshot& snap, int landscape_radius) {
    const int reach = landscape_radius * grid.subpixel_divisions();
    size_t n = 0;
    for (const ls::Placement& p : ls::scatter(grid, snap.triangle_cells(), snap.center.geo)) {
        if (rg::cell_distance(grid, snap.center.address, p.address, rg::DistanceMetric::Chebyshev) <= reach) ++n;
    }
    return n;
}

static json address_json(const gg::GridAddress& a) {
    return {{"i", a.i}, {"j", a.j}, {"k", a.k}};
}

int main(int argc, char** argv) {
    Cli cli;
    const int parse_result = parse_cli(argc, argv, cli);
    if (parse_result != 0) {
        if (parse_result > 0) return 0;
        return 1;
    }

    planetwalk::log::set_verbosity(cli.verbosity);

    try {
        const fs::path config_path =
            cli.config_path.empty() ? planetwalk::config::runtime_config_path() : fs::path(cli.config_path);
        planetwalk::config::RuntimeConfig config = planetwalk::config::load_runtime_config(config_path);
        LOGI("Config:", config_path.string());

        if (!cli.raster_path.empty()) config.raster = cli.raster_path;
        if (cli.subpixels) config.subpixel_divisions = *cli.subpixels;
        if (cli.planet_radius) config.planet_radius = *cli.planet_radius;
        if (cli.lon) config.start_longitude = *cli.lon;
        if (cli.lat) config.start_latitude = *cli.lat;
        if (cli.radius) {
            config.region_radius = *cli.radius;
            config.max_distance_in_cells = std::max(1.0, config.region_radius / 4.0);
        }
        if (cli.metric) config.distance_metric = *cli.metric;

        LOGI("Reading", config.raster);
        gg::GeoGrid grid = gg::GeoGrid::load(config.raster, config.subpixel_divisions);
        grid.set_radius(config.planet_radius);

        rc::RecenterController controller(grid, planetwalk::config::to_recenter_options(config));
        controller.initialize({config.start_longitude, config.start_latitude});

        // tracked[0] is the subject, the rest are agents.
        std::vector<rc::LocalPosition> tracked = {{0.0, 0.0, 0.0}};
        for (const gg::GridAddress& a : spawn_agents(grid, controller, cli.agents, config.agent_search_radius)) {
            tracked.push_back(controller.cell_position(a));
        }
        LOGI("Spawned", tracked.size() - 1, "agents");

        const double heading = cli.heading * std::numbers::pi / 180.0;
        const double step = cli.speed * grid.mean_tile_size() * cli.dt;
        const double dx = std::sin(heading) * step;
        const double dz = std::cos(heading) * step;

        double elapsed = 0.0;
        double walked = 0.0;
        size_t ticks = 0;
        while (elapsed + cli.dt <= cli.seconds + 1e-9) {
            elapsed += cli.dt;
            ++ticks;
            tracked[0].x += dx;
            tracked[0].z += dz;
            walked += step;

            const auto decision = controller.on_tick(tracked[0], elapsed);
            if (!decision) continue;

            const rc::LocalPosition subject = tracked[0];
            controller.apply(*decision, subject, tracked);

            const auto snap = controller.snapshot();
            size_t agents_in_range = 0;
            for (size_t n = 1; n < tracked.size(); ++n) {
                const auto addr = controller.locate(tracked[n]);
                if (addr && controller.within_agent_radius(*addr)) ++agents_in_range;
            }

            const json line = {
                {"event", "recenter"},
                {"time", elapsed},
                {"generation", snap->generation},
                {"center", {{"lon", snap->center.geo.lon}, {"lat", snap->center.geo.lat},
                            {"address", address_json(snap->center.address)}}},
                {"cells", snap->cells.size()},
                {"triangles", snap->mesh.triangle_count()},
                {"landscapeElements", count_nearby_elements(grid, *snap, config.landscape_radius)},
                {"agentsInRange", agents_in_range},
            };
            std::cout << line << '\n';
        }

        const auto final_geo = controller.locate_geo(tracked[0]);
        const auto final_addr = controller.locate(tracked[0]);
        json summary = {
            {"event", "summary"},
            {"ticks", ticks},
            {"seconds", elapsed},
            {"distance", walked},
            {"recenters", controller.recenter_count()},
            {"metric", std::string(rg::metric_name(config.distance_metric))},
        };
        if (final_geo && final_addr) {
            summary["subject"] = {{"lon", final_geo->lon}, {"lat", final_geo->lat},
                                  {"address", address_json(*final_addr)},
                                  {"sea", grid.is_sea(final_addr->i, final_addr->j)}};
        }
        std::cout << summary << '\n';
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

#include "planetwalk/geogrid.h"
#include "planetwalk/log.h"
#include "planetwalk/mesh.h"
#include "planetwalk/raster.h"
#include "planetwalk/region.h"
#include "planetwalk/runtime_config.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace gg = planetwalk::geogrid;
namespace rg = planetwalk::region;
namespace ms = planetwalk::mesh;
using json = nlohmann::ordered_json;

struct Cli {
    std::string raster_path;
    std::string config_path;
    std::string obj_path;
    std::string preview_path;
    std::optional<double> lon;
    std::optional<double> lat;
    std::optional<int> radius;
    std::optional<int> subpixels;
    std::optional<double> planet_radius;
    std::optional<rg::DistanceMetric> metric;
    int preview_size = 512;
    bool pretty = false;
    int verbosity = 0;
};

static void usage() {
    std::cerr
        << "Usage: planet_mesh [raster.png|raster.tga] [--lon DEG] [--lat DEG] [--radius N]\n"
        << "       [--metric manhattan|euclidean|chebyshev] [--subpixels N] [--planet-radius R]\n"
        << "       [--obj out.obj] [--preview out.png] [--preview-size PX] [--config planetwalk.json]\n"
        << "       [--pretty] [-v|-vv]\n\n"
        << "Builds the terrain mesh around one point of an equirectangular planet\n"
        << "raster and prints a JSON summary to stdout.\n";
}

static int parse_cli(int argc, char** argv, Cli& cli) {
    std::vector<std::string> pos;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--lon") == 0 && i + 1 < argc) cli.lon = std::stod(argv[++i]);
        else if (std::strcmp(argv[i], "--lat") == 0 && i + 1 < argc) cli.lat = std::stod(argv[++i]);
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
        else if (std::strcmp(argv[i], "--obj") == 0 && i + 1 < argc) cli.obj_path = argv[++i];
        else if (std::strcmp(argv[i], "--preview") == 0 && i + 1 < argc) cli.preview_path = argv[++i];
        else if (std::strcmp(argv[i], "--preview-size") == 0 && i + 1 < argc) cli.preview_size = std::stoi(argv[++i]);
        else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) cli.config_path = argv[++i];
        else if (std::strcmp(argv[i], "--pretty") == 0) cli.pretty = true;
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

    if (pos.size() > 1 || cli.preview_size <= 0) {
        usage();
        return -1;
    }
    if (!pos.empty()) cli.raster_path = pos[0];
    return 0;
}

static void write_obj(const std::string& path, const ms::TerrainMesh& mesh) {
    fs::path p(path);
    if (!p.parent_path().empty()) fs::create_directories(p.parent_path());
    std::ofstream out(path);
    if (!out) throw std::runtime_error("cannot write output: " + path);

    out << "# planet_mesh " << mesh.cell_count() << " cells\n";
    for (const auto& v : mesh.vertices) out << std::format("v {:.6f} {:.6f} {:.6f}\n", v[0], v[1], v[2]);
    for (const auto& uv : mesh.uvs) out << std::format("vt {:.6f} {:.6f}\n", uv[0], uv[1]);
    for (size_t t = 0; t + 2 < mesh.indices.size(); t += 3) {
        const uint32_t a = mesh.indices[t] + 1;
        const uint32_t b = mesh.indices[t + 1] + 1;
        const uint32_t c = mesh.indices[t + 2] + 1;
        out << std::format("f {}/{} {}/{} {}/{}\n", a, a, b, b, c, c);
    }
    if (!out) throw std::runtime_error("failed while writing: " + path);
}

// Top-down preview: each quad's bounding box is filled with its pixel colour,
// north up.
static planetwalk::raster::Image render_preview(const gg::GeoGrid& grid, const ms::TerrainMesh& mesh, int size) {
    planetwalk::raster::Image img(size, size);
    if (mesh.empty()) return img;

    double min_x = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double min_z = min_x;
    double max_z = max_x;
    for (const auto& v : mesh.vertices) {
        min_x = std::min(min_x, static_cast<double>(v[0]));
        max_x = std::max(max_x, static_cast<double>(v[0]));
        min_z = std::min(min_z, static_cast<double>(v[2]));
        max_z = std::max(max_z, static_cast<double>(v[2]));
    }
    const double extent = std::max({max_x - min_x, max_z - min_z, 1e-9});
    const double scale = (size - 1) / extent;

    for (size_t q = 0; q < mesh.cell_count(); ++q) {
        double qx0 = std::numeric_limits<double>::max();
        double qx1 = std::numeric_limits<double>::lowest();
        double qz0 = qx0;
        double qz1 = qx1;
        for (size_t c = 0; c < 4; ++c) {
            const auto& v = mesh.vertices[q * 4 + c];
            qx0 = std::min(qx0, static_cast<double>(v[0]));
            qx1 = std::max(qx1, static_cast<double>(v[0]));
            qz0 = std::min(qz0, static_cast<double>(v[2]));
            qz1 = std::max(qz1, static_cast<double>(v[2]));
        }

        const gg::GridAddress& addr = mesh.triangle_cells[q * 2];
        const gg::Rgba color = grid.rgba(addr.i, addr.j);
        const int x0 = std::clamp(static_cast<int>(std::floor((qx0 - min_x) * scale)), 0, size - 1);
        const int x1 = std::clamp(static_cast<int>(std::ceil((qx1 - min_x) * scale)), 0, size - 1);
        const int y0 = std::clamp(static_cast<int>(std::floor((max_z - qz1) * scale)), 0, size - 1);
        const int y1 = std::clamp(static_cast<int>(std::ceil((max_z - qz0) * scale)), 0, size - 1);
        for (int y = y0; y <= y1; ++y) {
            for (int x = x0; x <= x1; ++x) {
                uint8_t* p = img.at(x, y);
                p[0] = static_cast<uint8_t>(std::lround(std::clamp(color.r, 0.0, 1.0) * 255.0));
                p[1] = static_cast<uint8_t>(std::lround(std::clamp(color.g, 0.0, 1.0) * 255.0));
                p[2] = static_cast<uint8_t>(std::lround(std::clamp(color.b, 0.0, 1.0) * 255.0));
                p[3] = 255;
            }
        }
    }
    return img;
}

static json build_summary(const gg::GeoGrid& grid, const gg::GeoCoordinate& center, const gg::GridAddress& addr,
                          int radius, rg::DistanceMetric metric, const ms::TerrainMesh& mesh) {
    std::array<int, ms::texture_tile_count> histogram{};
    for (int tile : mesh.cell_tiles) histogram[static_cast<size_t>(std::clamp(tile, 0, ms::texture_tile_count - 1))]++;

    size_t sea_cells = 0;
    for (size_t q = 0; q < mesh.cell_count(); ++q) {
        const gg::GridAddress& c = mesh.triangle_cells[q * 2];
        if (grid.is_sea(c.i, c.j)) ++sea_cells;
    }

    return {
        {"schemaVersion", 1},
        {"grid", {{"width", grid.width_pixels()}, {"height", grid.height_pixels()},
                  {"subpixelDivisions", grid.subpixel_divisions()}, {"planetRadius", grid.radius()},
                  {"meanTileSize", grid.mean_tile_size()}}},
        {"center", {{"lon", center.lon}, {"lat", center.lat}, {"i", addr.i}, {"j", addr.j}, {"k", addr.k},
                    {"lonSubdivisions", grid.row_lon_subdivisions(addr.j)}}},
        {"region", {{"metric", std::string(rg::metric_name(metric))}, {"radius", radius}}},
        {"cells", mesh.cell_count()},
        {"seaCells", sea_cells},
        {"vertices", mesh.vertices.size()},
        {"triangles", mesh.triangle_count()},
        {"textureHistogram", histogram},
    };
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
        if (cli.radius) config.region_radius = *cli.radius;
        if (cli.metric) config.distance_metric = *cli.metric;

        LOGI("Reading", config.raster);
        gg::GeoGrid grid = gg::GeoGrid::load(config.raster, config.subpixel_divisions);
        grid.set_radius(config.planet_radius);
        LOGD("Grid:", grid.width_pixels(), "x", grid.height_pixels(), "S", grid.subpixel_divisions(),
             "tile", grid.mean_tile_size());

        const gg::GeoCoordinate center{config.start_longitude, config.start_latitude};
        if (!center.valid()) throw std::invalid_argument("planet_mesh: centre is not a valid coordinate");
        const gg::GridAddress addr = grid.geo_to_grid(center.lon, center.lat);

        const rg::Region region = rg::select(grid, addr, config.region_radius, config.distance_metric);
        LOGI("Selected", region.size(), "cells with", rg::metric_name(config.distance_metric), "radius",
             config.region_radius);
        const ms::TerrainMesh mesh = ms::build(grid, region, center);

        if (!cli.obj_path.empty()) {
            write_obj(cli.obj_path, mesh);
            LOGI("Wrote", cli.obj_path);
        }
        if (!cli.preview_path.empty()) {
            planetwalk::raster::save_png(cli.preview_path, render_preview(grid, mesh, cli.preview_size));
            LOGI("Wrote", cli.preview_path);
        }

        const json doc = build_summary(grid, center, addr, config.region_radius, config.distance_metric, mesh);
        if (cli.pretty) std::cout << std::setw(2) << doc << '\n';
        else std::cout << doc << '\n';
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

#include "planetwalk/runtime_config.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <fstream>

namespace planetwalk::config {

namespace {

namespace fs = std::filesystem;
using json = nlohmann::json;

fs::path executable_dir() {
    std::error_code ec;
    auto link_path = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return link_path.parent_path();
    }
    return fs::current_path();
}

const json& planetwalk_node_or_root(const json& root) {
    if (root.contains("planetwalk") && root.at("planetwalk").is_object()) {
        return root.at("planetwalk");
    }
    return root;
}

// Values of the wrong type or out of range leave the default in place.
void read_positive_int(const json& node, const char* key, int& out, int max) {
    if (!node.contains(key) || !node.at(key).is_number_integer()) return;
    const auto v = node.at(key).get<long long>();
    if (v > 0 && v <= max) out = static_cast<int>(v);
}

void read_non_negative_int(const json& node, const char* key, int& out) {
    if (!node.contains(key) || !node.at(key).is_number_integer()) return;
    const auto v = node.at(key).get<long long>();
    if (v >= 0 && v <= 1 << 20) out = static_cast<int>(v);
}

void read_finite(const json& node, const char* key, double& out, double min, double max) {
    if (!node.contains(key) || !node.at(key).is_number()) return;
    const double v = node.at(key).get<double>();
    if (std::isfinite(v) && v >= min && v <= max) out = v;
}

} // namespace

std::filesystem::path runtime_config_path() {
    const char* override_path = std::getenv("PLANETWALK_CONFIG");
    if (override_path && override_path[0] != '\0') {
        return std::filesystem::path(override_path);
    }

    const auto beside_exe = executable_dir() / "planetwalk.json";
    if (std::filesystem::exists(beside_exe)) {
        return beside_exe;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::filesystem::path(home) / ".config" / "planetwalk" / "planetwalk.json";
    }

    return beside_exe;
}

RuntimeConfig load_runtime_config() {
    return load_runtime_config(runtime_config_path());
}

RuntimeConfig load_runtime_config(const std::filesystem::path& path) {
    RuntimeConfig cfg;

    std::ifstream stream(path);
    if (!stream.is_open()) {
        return cfg;
    }

    try {
        json parsed = json::parse(stream);
        const auto& pw = planetwalk_node_or_root(parsed);

        if (pw.contains("raster") && pw.at("raster").is_string()) {
            const auto raster = pw.at("raster").get<std::string>();
            if (!raster.empty()) cfg.raster = raster;
        }
        read_positive_int(pw, "subpixel_divisions", cfg.subpixel_divisions, geogrid::max_subpixel_divisions);
        read_finite(pw, "planet_radius", cfg.planet_radius, 1e-6, 1e12);
        read_finite(pw, "start_longitude", cfg.start_longitude, -180.0, 180.0);
        read_finite(pw, "start_latitude", cfg.start_latitude, -90.0, 90.0);
        read_non_negative_int(pw, "region_radius", cfg.region_radius);

        // Without an explicit threshold recenter after a quarter of the region.
        cfg.max_distance_in_cells = cfg.region_radius / 4.0;
        read_finite(pw, "max_distance_in_cells", cfg.max_distance_in_cells, 1e-6, 1e9);
        if (!(cfg.max_distance_in_cells > 0.0)) cfg.max_distance_in_cells = RuntimeConfig{}.max_distance_in_cells;

        read_finite(pw, "recreation_cooldown_seconds", cfg.recreation_cooldown_seconds, 0.0, 1e9);
        if (pw.contains("distance_metric") && pw.at("distance_metric").is_string()) {
            if (const auto metric = region::parse_metric(pw.at("distance_metric").get<std::string>())) {
                cfg.distance_metric = *metric;
            }
        }
        read_non_negative_int(pw, "landscape_radius", cfg.landscape_radius);
        read_non_negative_int(pw, "agent_search_radius", cfg.agent_search_radius);
    } catch (const json::exception&) {
        cfg = RuntimeConfig{};
    }

    return cfg;
}

bool save_runtime_config(const RuntimeConfig& cfg) {
    return save_runtime_config(cfg, runtime_config_path());
}

bool save_runtime_config(const RuntimeConfig& cfg, const std::filesystem::path& path) {
    json parsed;
    parsed["planetwalk"] = {
        {"raster", cfg.raster},
        {"subpixel_divisions", cfg.subpixel_divisions},
        {"planet_radius", cfg.planet_radius},
        {"start_longitude", cfg.start_longitude},
        {"start_latitude", cfg.start_latitude},
        {"region_radius", cfg.region_radius},
        {"max_distance_in_cells", cfg.max_distance_in_cells},
        {"recreation_cooldown_seconds", cfg.recreation_cooldown_seconds},
        {"distance_metric", std::string(region::metric_name(cfg.distance_metric))},
        {"landscape_radius", cfg.landscape_radius},
        {"agent_search_radius", cfg.agent_search_radius},
    };

    std::error_code ec;
    if (!path.parent_path().empty()) std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream stream(path);
    if (!stream.is_open()) {
        return false;
    }

    stream << parsed.dump(2) << "\n";
    return static_cast<bool>(stream);
}

recenter::RecenterOptions to_recenter_options(const RuntimeConfig& cfg) {
    recenter::RecenterOptions opt;
    opt.region_radius = cfg.region_radius;
    opt.max_distance_in_cells = cfg.max_distance_in_cells;
    opt.recreation_cooldown_seconds = cfg.recreation_cooldown_seconds;
    opt.metric = cfg.distance_metric;
    return opt;
}

} // namespace planetwalk::config

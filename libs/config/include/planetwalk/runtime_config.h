#pragma once

#include <planetwalk/recenter.h>
#include <planetwalk/region.h>

#include <filesystem>
#include <string>

namespace planetwalk::config {

struct RuntimeConfig {
    std::string raster = "assets/maps/sphere_texture.png";
    int subpixel_divisions = 14;
    double planet_radius = 1000.0;
    double start_longitude = 0.0;
    double start_latitude = 0.0;
    int region_radius = 80;
    double max_distance_in_cells = 20.0;
    double recreation_cooldown_seconds = 1.0;
    region::DistanceMetric distance_metric = region::DistanceMetric::Chebyshev;
    int landscape_radius = 3;
    int agent_search_radius = 5;
};

// runtime_config_path resolves PLANETWALK_CONFIG, then planetwalk.json beside
// the executable, then ~/.config/planetwalk/planetwalk.json.
std::filesystem::path runtime_config_path();

RuntimeConfig load_runtime_config();
RuntimeConfig load_runtime_config(const std::filesystem::path& path);
bool save_runtime_config(const RuntimeConfig& cfg);
bool save_runtime_config(const RuntimeConfig& cfg, const std::filesystem::path& path);

[[nodiscard]] recenter::RecenterOptions to_recenter_options(const RuntimeConfig& cfg);

} // namespace planetwalk::config

#include "planetwalk/landscape.h"

#include <planetwalk/log.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace planetwalk::landscape {

double deterministic_random(int i, int j, int k) {
    uint64_t hash = static_cast<uint64_t>(static_cast<int64_t>(i)) * 0x9E3779B185EBCA87ULL;
    hash ^= static_cast<uint64_t>(static_cast<int64_t>(j)) * 0xC2B2AE3D27D4EB4FULL;
    hash ^= static_cast<uint64_t>(static_cast<int64_t>(k)) * 0x165667B19E3779F9ULL;

    hash ^= hash >> 27;
    hash *= 0x3C79AC492BA7B653ULL;
    hash ^= hash >> 33;
    hash *= 0x1C69B3F74AC4AE35ULL;
    hash ^= hash >> 27;

    return static_cast<double>(hash) / static_cast<double>(std::numeric_limits<uint64_t>::max());
}

std::optional<ElementClass> alpha_band(double alpha) {
    if (alpha >= 0.8 && alpha <= 1.0) return ElementClass{ElementKind::Tree, 0.6, 0.003};
    if (alpha >= 0.6 && alpha < 0.8) return ElementClass{ElementKind::Rock, 0.3, 0.006};
    if (alpha >= 0.3 && alpha < 0.6) return ElementClass{ElementKind::Stone, 0.15, 0.010};
    return std::nullopt;
}

std::optional<ElementClass> classify(const geogrid::Rgba& rgba, const geogrid::GridAddress& addr) {
    const std::optional<ElementClass> band = alpha_band(rgba.a);
    if (!band) return std::nullopt;
    if (deterministic_random(addr.i, addr.j, addr.k) >= band->spawn_probability) return std::nullopt;
    return band;
}

std::vector<Placement> scatter(const geogrid::GeoGrid& grid, const std::vector<geogrid::GridAddress>& triangle_cells,
                               const geogrid::GeoCoordinate& center) {
    std::vector<Placement> out;
    std::unordered_set<geogrid::GridAddress> seen;
    for (const geogrid::GridAddress& addr : triangle_cells) {
        if (!seen.insert(addr).second) continue;
        if (!grid.contains(addr)) continue;

        const std::optional<ElementClass> element = classify(grid.rgba(addr.i, addr.j), addr);
        if (!element) continue;

        const geogrid::GeoCoordinate g = grid.cell_center(addr);
        const geogrid::PlanePoint p = grid.geo_to_gnomonic(g.lon, g.lat, center.lon, center.lat);
        out.push_back({element->kind, addr, p.x, element->y_offset, p.y});
    }
    LOGD("landscape:", out.size(), "elements over", seen.size(), "cells");
    return out;
}

geogrid::GridAddress find_nearest_free_cell(const geogrid::GeoGrid& grid, const geogrid::GridAddress& desired,
                                            const std::unordered_set<geogrid::GridAddress>& occupied,
                                            int search_radius) {
    if (!occupied.contains(desired)) return desired;

    const int s = grid.subpixel_divisions();
    for (int radius = 1; radius <= search_radius; ++radius) {
        for (int dy = -radius; dy <= radius; ++dy) {
            for (int dx = -radius; dx <= radius; ++dx) {
                // ring only
                if (std::abs(dx) != radius && std::abs(dy) != radius) continue;

                const int i = std::clamp(desired.i + dx, 0, grid.width_pixels() - 1);
                const int j = std::clamp(desired.j + dy, 0, grid.height_pixels() - 1);
                for (int k = 0; k < s; ++k) {
                    const geogrid::GridAddress candidate{i, j, k};
                    if (!occupied.contains(candidate)) return candidate;
                }
            }
        }
    }

    LOGW("landscape: no free cell within", search_radius, "pixels of", desired.i, desired.j, desired.k,
         "keeping the requested one");
    return desired;
}

std::string_view kind_name(ElementKind kind) {
    switch (kind) {
        case ElementKind::Tree: return "tree";
        case ElementKind::Rock: return "rock";
        case ElementKind::Stone: return "stone";
    }
    return "tree";
}

} // namespace planetwalk::landscape

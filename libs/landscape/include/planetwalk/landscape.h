#pragma once

#include <planetwalk/geogrid.h>

#include <optional>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace planetwalk::landscape {

enum class ElementKind { Tree, Rock, Stone };

struct ElementClass {
    ElementKind kind = ElementKind::Tree;
    double y_offset = 0.0;
    double spawn_probability = 0.0;
};

struct Placement {
    ElementKind kind = ElementKind::Tree;
    geogrid::GridAddress address;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

// deterministic_random hashes a cell address into [0, 1]. The same address
// always yields the same value, so scattering survives rebuilds.
[[nodiscard]] double deterministic_random(int i, int j, int k);

// alpha_band picks the element family from the alpha channel:
// tree >= 0.8, rock [0.6, 0.8), stone [0.3, 0.6), nothing below.
[[nodiscard]] std::optional<ElementClass> alpha_band(double alpha);

// classify returns the element that spawns on addr, if any.
[[nodiscard]] std::optional<ElementClass> classify(const geogrid::Rgba& rgba, const geogrid::GridAddress& addr);

// scatter places elements on the unique cells of a triangle map, positioned
// on the tangent plane around center.
std::vector<Placement> scatter(const geogrid::GeoGrid& grid, const std::vector<geogrid::GridAddress>& triangle_cells,
                               const geogrid::GeoCoordinate& center);

// find_nearest_free_cell searches square rings of pixels around desired for a
// cell not in occupied. It returns desired when nothing is free.
geogrid::GridAddress find_nearest_free_cell(const geogrid::GeoGrid& grid, const geogrid::GridAddress& desired,
                                            const std::unordered_set<geogrid::GridAddress>& occupied,
                                            int search_radius);

[[nodiscard]] std::string_view kind_name(ElementKind kind);

} // namespace planetwalk::landscape

#pragma once

#include <planetwalk/geogrid.h>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace planetwalk::region {

enum class DistanceMetric { Manhattan, Euclidean, Chebyshev };

struct RegionCell {
    geogrid::GridAddress address;
    geogrid::Corners corners{};
};

struct Region {
    std::vector<RegionCell> cells;

    [[nodiscard]] size_t size() const { return cells.size(); }
    [[nodiscard]] bool empty() const { return cells.empty(); }
};

// select enumerates the cells within max_distance subpixel steps of center.
// The centre is always the first cell and appears exactly once. Chebyshev
// returns the whole latitude-corrected bounding rectangle without filtering.
Region select(const geogrid::GeoGrid& grid, const geogrid::GridAddress& center, int max_distance,
              DistanceMetric metric);

// cell_distance measures a cell the way select does, using the shortest
// longitude pixel offset across the date line.
[[nodiscard]] double cell_distance(const geogrid::GeoGrid& grid, const geogrid::GridAddress& center,
                                   const geogrid::GridAddress& cell, DistanceMetric metric);

// cells_in_box lists every valid cell of the pixel rectangle. i wraps, j is clamped.
std::vector<geogrid::GridAddress> cells_in_box(const geogrid::GeoGrid& grid, int min_i, int max_i, int min_j,
                                               int max_j);

// select_rect_around walks an nx by ny block of subcells out from center.
Region select_rect_around(const geogrid::GeoGrid& grid, const geogrid::GridAddress& center, int nx, int ny);

[[nodiscard]] std::string_view metric_name(DistanceMetric metric);
[[nodiscard]] std::optional<DistanceMetric> parse_metric(std::string_view name);

} // namespace planetwalk::region

#include "planetwalk/region.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace planetwalk::region {

namespace {

using geogrid::GeoGrid;
using geogrid::GridAddress;

// Signed pixel offsets to scan around ci; never repeats a column.
struct ColumnRange {
    int lo = 0;
    int hi = 0;
};

[[nodiscard]] ColumnRange column_range(const GeoGrid& grid, int radius) {
    const int w = grid.width_pixels();
    if (2 * radius + 1 >= w) return {-(w / 2), w - 1 - w / 2};
    return {-radius, radius};
}

[[nodiscard]] int shortest_column_offset(const GeoGrid& grid, int from, int to) {
    const int w = grid.width_pixels();
    return grid.wrap_i(to - from + w / 2) - w / 2;
}

// Steps along one axis between sub-position c in the centre pixel and s in a
// pixel d pixels away, each pixel holding n sub-positions.
[[nodiscard]] int axis_steps(int c, int s, int d, int n) {
    if (d == 0) return std::abs(s - c);
    if (d > 0) return (n - c) + s + (d - 1) * n;
    return c + (n - s) + (-d - 1) * n;
}

[[nodiscard]] double distance_at_offset(const GeoGrid& grid, const GridAddress& center, const GridAddress& cell,
                                        int di, int dj, DistanceMetric metric) {
    const int s = grid.subpixel_divisions();
    const int c_si = grid.sub_i(center.k);
    const int c_sj = grid.sub_j(center.k);
    const int si = grid.sub_i(cell.k);
    const int sj = grid.sub_j(cell.k);

    switch (metric) {
        case DistanceMetric::Manhattan: {
            const int n_c = grid.row_lon_subdivisions(center.j);
            const int n_t = grid.row_lon_subdivisions(cell.j);
            const int c_rescaled = c_si * n_t / n_c;
            return static_cast<double>(axis_steps(c_rescaled, si, di, n_t) + axis_steps(c_sj, sj, dj, s));
        }
        case DistanceMetric::Euclidean: {
            const double dx = static_cast<double>(di * s + si - c_si);
            const double dy = static_cast<double>(dj * s + sj - c_sj);
            return std::sqrt(dx * dx + dy * dy);
        }
        case DistanceMetric::Chebyshev: {
            const double dx = std::abs(static_cast<double>(di * s + si - c_si));
            const double dy = std::abs(static_cast<double>(dj * s + sj - c_sj));
            return std::max(dx, dy);
        }
    }
    return 0.0;
}

void push_cell(const GeoGrid& grid, Region& out, const GridAddress& addr) {
    out.cells.push_back({addr, grid.corners(addr)});
}

} // namespace

Region select(const GeoGrid& grid, const GridAddress& center_in, int max_distance, DistanceMetric metric) {
    if (max_distance < 0)
        throw std::invalid_argument(std::format("region: max distance must not be negative, got {}", max_distance));

    const GridAddress center = grid.normalize(center_in);
    const int s = grid.subpixel_divisions();

    int radius_x = 0;
    int radius_y = 0;
    switch (metric) {
        case DistanceMetric::Manhattan:
            radius_x = radius_y = max_distance / s + 1;
            break;
        case DistanceMetric::Euclidean:
            radius_x = radius_y = max_distance / s + 2;
            break;
        case DistanceMetric::Chebyshev:
            radius_y = max_distance / s + 1;
            radius_x = max_distance / grid.row_lon_subdivisions(center.j) + 1;
            break;
    }

    const ColumnRange cols = column_range(grid, radius_x);
    const int min_j = std::max(0, center.j - radius_y);
    const int max_j = std::min(grid.height_pixels() - 1, center.j + radius_y);

    Region out;
    out.cells.reserve(static_cast<size_t>(cols.hi - cols.lo + 1) * static_cast<size_t>(max_j - min_j + 1) *
                      static_cast<size_t>(s) * static_cast<size_t>(s));
    push_cell(grid, out, center);

    for (int j = min_j; j <= max_j; ++j) {
        const int dj = j - center.j;
        const int n = grid.row_lon_subdivisions(j);
        for (int di = cols.lo; di <= cols.hi; ++di) {
            const int i = grid.wrap_i(center.i + di);
            for (int si = 0; si < n; ++si) {
                for (int sj = 0; sj < s; ++sj) {
                    const GridAddress cell{i, j, grid.compose_k(si, sj)};
                    if (cell == center) continue;
                    // Chebyshev keeps the whole rectangle.
                    if (metric != DistanceMetric::Chebyshev &&
                        distance_at_offset(grid, center, cell, di, dj, metric) > max_distance) {
                        continue;
                    }
                    push_cell(grid, out, cell);
                }
            }
        }
    }
    return out;
}

double cell_distance(const GeoGrid& grid, const GridAddress& center, const GridAddress& cell,
                     DistanceMetric metric) {
    const GridAddress c = grid.normalize(center);
    const GridAddress t = grid.normalize(cell);
    return distance_at_offset(grid, c, t, shortest_column_offset(grid, c.i, t.i), t.j - c.j, metric);
}

std::vector<GridAddress> cells_in_box(const GeoGrid& grid, int min_i, int max_i, int min_j, int max_j) {
    std::vector<GridAddress> out;
    min_j = std::max(min_j, 0);
    max_j = std::min(max_j, grid.height_pixels() - 1);
    if (max_i < min_i || max_j < min_j) return out;

    // A box wider than the world visits each column once.
    max_i = std::min(max_i, min_i + grid.width_pixels() - 1);

    const int s = grid.subpixel_divisions();
    for (int raw_i = min_i; raw_i <= max_i; ++raw_i) {
        const int i = grid.wrap_i(raw_i);
        for (int j = min_j; j <= max_j; ++j) {
            const int n = grid.row_lon_subdivisions(j);
            for (int si = 0; si < n; ++si) {
                for (int sj = 0; sj < s; ++sj) out.push_back({i, j, grid.compose_k(si, sj)});
            }
        }
    }
    return out;
}

Region select_rect_around(const GeoGrid& grid, const GridAddress& center_in, int nx, int ny) {
    if (nx <= 0 || ny <= 0)
        throw std::invalid_argument(std::format("region: invalid rectangle {}x{}", nx, ny));

    const GridAddress center = grid.normalize(center_in);
    Region out;
    std::unordered_set<GridAddress> seen;
    push_cell(grid, out, center);
    seen.insert(center);

    for (int dy = -(ny / 2); dy < ny - ny / 2; ++dy) {
        for (int dx = -(nx / 2); dx < nx - nx / 2; ++dx) {
            const GridAddress cell = grid.neighbor(center, dx, dy);
            // Near the poles several walks land on the same cell.
            if (!seen.insert(cell).second) continue;
            push_cell(grid, out, cell);
        }
    }
    return out;
}

std::string_view metric_name(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::Manhattan: return "manhattan";
        case DistanceMetric::Euclidean: return "euclidean";
        case DistanceMetric::Chebyshev: return "chebyshev";
    }
    return "chebyshev";
}

std::optional<DistanceMetric> parse_metric(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "manhattan") return DistanceMetric::Manhattan;
    if (lower == "euclidean" || lower == "circular") return DistanceMetric::Euclidean;
    if (lower == "chebyshev" || lower == "rectangular") return DistanceMetric::Chebyshev;
    return std::nullopt;
}

} // namespace planetwalk::region

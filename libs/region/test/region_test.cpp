#include "planetwalk/region.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>
#include <stdexcept>
#include <unordered_set>

namespace gg = planetwalk::geogrid;
namespace rg = planetwalk::region;

namespace {

gg::GeoGrid make_world() {
    gg::GeoGrid grid(360, 180, 8);
    grid.set_radius(1000.0);
    return grid;
}

size_t count_of(const rg::Region& region, const gg::GridAddress& addr) {
    return static_cast<size_t>(std::count_if(region.cells.begin(), region.cells.end(),
                                             [&](const rg::RegionCell& c) { return c.address == addr; }));
}

// Position in subcell units: (i*S + sub_i, j*S + sub_j).
struct Continuous {
    double x = 0.0;
    double y = 0.0;
};

Continuous continuous(const gg::GeoGrid& grid, const gg::GridAddress& a) {
    const int s = grid.subpixel_divisions();
    return {static_cast<double>(a.i * s + grid.sub_i(a.k)), static_cast<double>(a.j * s + grid.sub_j(a.k))};
}

constexpr rg::DistanceMetric kAllMetrics[] = {rg::DistanceMetric::Manhattan, rg::DistanceMetric::Euclidean,
                                              rg::DistanceMetric::Chebyshev};

} // namespace

TEST(Region, CentreComesFirstExactlyOnce) {
    const gg::GeoGrid grid = make_world();
    const gg::GridAddress center{100, 90, grid.compose_k(3, 4)};

    for (const rg::DistanceMetric metric : kAllMetrics) {
        const rg::Region region = rg::select(grid, center, 20, metric);
        ASSERT_FALSE(region.empty()) << rg::metric_name(metric);
        EXPECT_EQ(region.cells.front().address, center) << rg::metric_name(metric);
        EXPECT_EQ(count_of(region, center), 1u) << rg::metric_name(metric);
    }
}

TEST(Region, FilteredMetricsStayWithinDistance) {
    const gg::GeoGrid grid = make_world();
    const gg::GridAddress center{100, 120, grid.compose_k(1, 6)};

    for (const rg::DistanceMetric metric : {rg::DistanceMetric::Manhattan, rg::DistanceMetric::Euclidean}) {
        const rg::Region region = rg::select(grid, center, 17, metric);
        for (const rg::RegionCell& c : region.cells) {
            EXPECT_LE(rg::cell_distance(grid, center, c.address, metric), 17.0) << rg::metric_name(metric);
            EXPECT_TRUE(grid.contains(c.address));
        }
    }
}

TEST(Region, EuclideanMatchesBruteForceScan) {
    const gg::GeoGrid grid = make_world();
    const gg::GridAddress center{200, 95, grid.compose_k(5, 2)};
    const int max_distance = 5;

    const rg::Region region = rg::select(grid, center, max_distance, rg::DistanceMetric::Euclidean);

    // Scan every subcell of a generous pixel box directly in subcell units.
    const Continuous c = continuous(grid, center);
    std::set<std::tuple<int, int, int>> expected;
    for (int j = center.j - 3; j <= center.j + 3; ++j) {
        for (int i = center.i - 3; i <= center.i + 3; ++i) {
            for (int si = 0; si < grid.row_lon_subdivisions(j); ++si) {
                for (int sj = 0; sj < grid.subpixel_divisions(); ++sj) {
                    const gg::GridAddress a{i, j, grid.compose_k(si, sj)};
                    const Continuous p = continuous(grid, a);
                    const double dx = p.x - c.x;
                    const double dy = p.y - c.y;
                    if (std::sqrt(dx * dx + dy * dy) <= max_distance) expected.insert({i, j, a.k});
                }
            }
        }
    }

    std::set<std::tuple<int, int, int>> got;
    for (const rg::RegionCell& cell : region.cells) got.insert({cell.address.i, cell.address.j, cell.address.k});
    EXPECT_EQ(got.size(), region.size());
    EXPECT_EQ(got, expected);
}

TEST(Region, ManhattanMatchesBruteForceNearEquator) {
    const gg::GeoGrid grid = make_world();
    const gg::GridAddress center{200, 90, grid.compose_k(3, 4)};
    const int max_distance = 11;

    // Rows 88..92 all carry the full eight longitude subdivisions.
    for (int j = 88; j <= 92; ++j) ASSERT_EQ(grid.row_lon_subdivisions(j), 8);

    const rg::Region region = rg::select(grid, center, max_distance, rg::DistanceMetric::Manhattan);

    const Continuous c = continuous(grid, center);
    std::set<std::tuple<int, int, int>> expected;
    for (int j = 88; j <= 92; ++j) {
        for (int i = center.i - 2; i <= center.i + 2; ++i) {
            for (int k = 0; k < 64; ++k) {
                const Continuous p = continuous(grid, {i, j, k});
                if (std::abs(p.x - c.x) + std::abs(p.y - c.y) <= max_distance) expected.insert({i, j, k});
            }
        }
    }

    std::set<std::tuple<int, int, int>> got;
    for (const rg::RegionCell& cell : region.cells) got.insert({cell.address.i, cell.address.j, cell.address.k});
    EXPECT_EQ(got.size(), region.size());
    EXPECT_EQ(got, expected);
}

TEST(Region, ManhattanZeroAndOneStep) {
    const gg::GeoGrid grid = make_world();
    const gg::GridAddress center{100, 90, grid.compose_k(3, 4)};

    EXPECT_EQ(rg::select(grid, center, 0, rg::DistanceMetric::Manhattan).size(), 1u);

    const rg::Region diamond = rg::select(grid, center, 1, rg::DistanceMetric::Manhattan);
    EXPECT_EQ(diamond.size(), 5u);
    EXPECT_EQ(count_of(diamond, {100, 90, grid.compose_k(2, 4)}), 1u);
    EXPECT_EQ(count_of(diamond, {100, 90, grid.compose_k(4, 4)}), 1u);
    EXPECT_EQ(count_of(diamond, {100, 90, grid.compose_k(3, 3)}), 1u);
    EXPECT_EQ(count_of(diamond, {100, 90, grid.compose_k(3, 5)}), 1u);
}

TEST(Region, ManhattanStepCrossesPixelEdge) {
    const gg::GeoGrid grid = make_world();
    const gg::GridAddress center{100, 90, grid.compose_k(0, 0)};
    const gg::GridAddress west{99, 90, grid.compose_k(7, 0)};
    const gg::GridAddress south{100, 89, grid.compose_k(0, 7)};

    EXPECT_DOUBLE_EQ(rg::cell_distance(grid, center, west, rg::DistanceMetric::Manhattan), 1.0);
    EXPECT_DOUBLE_EQ(rg::cell_distance(grid, center, south, rg::DistanceMetric::Manhattan), 1.0);
    EXPECT_DOUBLE_EQ(rg::cell_distance(grid, center, grid.neighbor(center, -5, -3), rg::DistanceMetric::Manhattan),
                     8.0);
}

TEST(Region, ChebyshevReturnsWholeRectangle) {
    const gg::GeoGrid grid = make_world();
    const gg::GridAddress center{100, 90, grid.compose_k(3, 4)};

    const rg::Region region = rg::select(grid, center, 20, rg::DistanceMetric::Chebyshev);
    // 7 x 7 pixels, all rows near the equator carry 8 x 8 subcells.
    EXPECT_EQ(region.size(), 7u * 7u * 64u);

    double farthest = 0.0;
    for (const rg::RegionCell& c : region.cells) {
        farthest = std::max(farthest, rg::cell_distance(grid, center, c.address, rg::DistanceMetric::Chebyshev));
    }
    EXPECT_GT(farthest, 20.0);
}

TEST(Region, ChebyshevWidensInLongitudeNearPoles) {
    const gg::GeoGrid grid = make_world();
    const gg::GridAddress polar{100, 170, 0};
    ASSERT_EQ(grid.row_lon_subdivisions(170), 1);

    const rg::Region region = rg::select(grid, polar, 20, rg::DistanceMetric::Chebyshev);
    std::unordered_set<int> columns;
    for (const rg::RegionCell& c : region.cells) columns.insert(c.address.i);
    EXPECT_EQ(columns.size(), 2u * 21u + 1u);
}

TEST(Region, SelectionWrapsAtDateLine) {
    const gg::GeoGrid grid = make_world();
    const gg::GridAddress center{0, 90, grid.compose_k(0, 4)};

    const rg::Region region = rg::select(grid, center, 10, rg::DistanceMetric::Euclidean);
    const bool has_west = std::any_of(region.cells.begin(), region.cells.end(),
                                      [](const rg::RegionCell& c) { return c.address.i == 359; });
    EXPECT_TRUE(has_west);
}

TEST(Region, WholeWorldBoxVisitsEachColumnOnce) {
    gg::GeoGrid grid(4, 4, 2);
    const gg::GridAddress center{1, 2, 0};

    const rg::Region region = rg::select(grid, center, 100, rg::DistanceMetric::Chebyshev);
    EXPECT_EQ(region.size(), rg::cells_in_box(grid, 0, 3, 0, 3).size());
    EXPECT_EQ(count_of(region, center), 1u);
}

TEST(Region, CellsInBoxCountsRowSubdivisions) {
    const gg::GeoGrid grid = make_world();
    EXPECT_EQ(rg::cells_in_box(grid, 0, 1, 90, 90).size(), 2u * 64u);
    EXPECT_EQ(rg::cells_in_box(grid, 359, 360, 90, 90).front().i, 359);
    EXPECT_TRUE(rg::cells_in_box(grid, 5, 4, 0, 0).empty());
}

TEST(Region, RectAroundIsUniqueAndCentred) {
    const gg::GeoGrid grid = make_world();
    const gg::GridAddress center{50, 90, grid.compose_k(4, 4)};

    const rg::Region rect = rg::select_rect_around(grid, center, 3, 3);
    EXPECT_EQ(rect.size(), 9u);
    EXPECT_EQ(rect.cells.front().address, center);
    EXPECT_THROW((void)rg::select_rect_around(grid, center, 0, 3), std::invalid_argument);
}

TEST(Region, MetricNamesParseBack) {
    for (const rg::DistanceMetric metric : kAllMetrics) {
        EXPECT_TRUE(rg::parse_metric(rg::metric_name(metric)) == metric);
    }
    EXPECT_TRUE(rg::parse_metric("Chebyshev") == rg::DistanceMetric::Chebyshev);
    EXPECT_FALSE(rg::parse_metric("taxicab").has_value());
}

TEST(Region, NegativeDistanceThrows) {
    const gg::GeoGrid grid = make_world();
    EXPECT_THROW((void)rg::select(grid, {0, 0, 0}, -1, rg::DistanceMetric::Manhattan), std::invalid_argument);
}

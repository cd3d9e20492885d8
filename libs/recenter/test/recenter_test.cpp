#include "planetwalk/recenter.h"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

namespace gg = planetwalk::geogrid;
namespace rc = planetwalk::recenter;
namespace rg = planetwalk::region;

namespace {

bool nearly_equal(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) <= eps;
}

gg::GeoGrid make_world() {
    gg::GeoGrid grid(360, 180, 8);
    grid.set_radius(1000.0);
    return grid;
}

rc::RecenterOptions small_options() {
    rc::RecenterOptions opt;
    opt.region_radius = 8;
    opt.max_distance_in_cells = 20.0;
    opt.recreation_cooldown_seconds = 1.0;
    return opt;
}

} // namespace

TEST(Recenter, InitializeBuildsFirstSnapshot) {
    const gg::GeoGrid grid = make_world();
    rc::RecenterController controller(grid, small_options());
    EXPECT_EQ(controller.snapshot(), nullptr);

    controller.initialize({0.5, 0.5});
    const auto snap = controller.snapshot();
    ASSERT_NE(snap, nullptr);
    EXPECT_EQ(snap->generation, 1u);
    EXPECT_EQ(controller.state(), rc::RecenterState::Stable);
    EXPECT_EQ(controller.center().address, grid.geo_to_grid(0.5, 0.5));
    EXPECT_TRUE(controller.is_visible(controller.center().address));
    EXPECT_EQ(snap->mesh.triangle_cells.size(), 2 * snap->cells.size());
    EXPECT_EQ(controller.recenter_count(), 0u);
}

TEST(Recenter, StaysPutWithinThreshold) {
    const gg::GeoGrid grid = make_world();
    rc::RecenterController controller(grid, small_options());
    controller.initialize({0.5, 0.5});

    const double tile = grid.mean_tile_size();
    EXPECT_FALSE(controller.on_tick({19.0 * tile, 0.0, 0.0}, 10.0).has_value());
    EXPECT_FALSE(controller.on_tick({0.0, 0.0, 19.5 * tile}, 10.0).has_value());
    // Height does not count towards the distance.
    EXPECT_FALSE(controller.on_tick({0.0, 500.0 * tile, 0.0}, 10.0).has_value());
}

TEST(Recenter, FarSubjectTriggersRecenterOntoItsCell) {
    const gg::GeoGrid grid = make_world();
    rc::RecenterController controller(grid, small_options());
    controller.initialize({0.5, 0.5});

    const double tile = grid.mean_tile_size();
    const rc::LocalPosition subject{25.0 * tile, 0.0, -3.0 * tile};
    const rc::LocalPosition companion{subject.x + 3.0, 2.0, subject.z + 4.0};

    const auto expected = controller.locate(subject);
    ASSERT_TRUE(expected.has_value());

    const auto decision = controller.on_tick(subject, 5.0);
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->new_center, *expected);

    std::vector<rc::LocalPosition> tracked = {subject, companion};
    controller.apply(*decision, subject, tracked);

    EXPECT_TRUE(nearly_equal(tracked[0].x, 0.0));
    EXPECT_TRUE(nearly_equal(tracked[0].y, 0.0));
    EXPECT_TRUE(nearly_equal(tracked[0].z, 0.0));
    EXPECT_TRUE(nearly_equal(tracked[1].x, 3.0));
    EXPECT_TRUE(nearly_equal(tracked[1].y, 2.0));
    EXPECT_TRUE(nearly_equal(tracked[1].z, 4.0));

    EXPECT_EQ(controller.center().address, *expected);
    EXPECT_EQ(controller.snapshot()->generation, 2u);
    EXPECT_EQ(controller.recenter_count(), 1u);
    EXPECT_TRUE(controller.is_visible(*expected));

    // The subject now sits on the new tangent point.
    EXPECT_TRUE(controller.locate({0.0, 0.0, 0.0}) == *expected);
}

TEST(Recenter, CooldownThrottlesRecentering) {
    const gg::GeoGrid grid = make_world();
    rc::RecenterController controller(grid, small_options());
    controller.initialize({0.5, 0.5});

    const double tile = grid.mean_tile_size();
    const rc::LocalPosition far{30.0 * tile, 0.0, 0.0};

    auto decision = controller.on_tick(far, 5.0);
    ASSERT_TRUE(decision.has_value());
    std::vector<rc::LocalPosition> tracked = {far};
    controller.apply(*decision, far, tracked);

    EXPECT_FALSE(controller.on_tick(far, 5.5).has_value());
    EXPECT_TRUE(controller.on_tick(far, 6.0).has_value());
}

TEST(Recenter, ReadersKeepTheSnapshotTheyHold) {
    const gg::GeoGrid grid = make_world();
    rc::RecenterController controller(grid, small_options());
    controller.initialize({0.5, 0.5});

    const auto before = controller.snapshot();
    const gg::GridAddress old_center = before->center.address;
    const size_t old_triangles = before->mesh.triangle_cells.size();

    const double tile = grid.mean_tile_size();
    const rc::LocalPosition far{0.0, 0.0, 40.0 * tile};
    const auto decision = controller.on_tick(far, 2.0);
    ASSERT_TRUE(decision.has_value());
    std::vector<rc::LocalPosition> tracked;
    controller.apply(*decision, far, tracked);

    EXPECT_EQ(before->generation, 1u);
    EXPECT_EQ(before->center.address, old_center);
    EXPECT_EQ(before->mesh.triangle_cells.size(), old_triangles);
    EXPECT_NE(controller.snapshot(), before);
    EXPECT_NE(controller.center().address, old_center);
}

TEST(Recenter, ResolvedAddressOverloadAndValidation) {
    const gg::GeoGrid grid = make_world();
    rc::RecenterController controller(grid, small_options());
    controller.initialize({0.5, 0.5});

    const double tile = grid.mean_tile_size();
    const rc::LocalPosition far{-30.0 * tile, 0.0, 0.0};
    const gg::GridAddress hit{170, 90, grid.compose_k(1, 1)};

    const auto decision = controller.on_tick(far, hit, 3.0);
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->new_center, hit);

    EXPECT_FALSE(controller.on_tick(far, {170, 90, grid.compose_k(30, 1)}, 3.0).has_value());
}

TEST(Recenter, SubjectOutsideProjectionDomainIsIgnored) {
    const gg::GeoGrid grid = make_world();
    rc::RecenterController controller(grid, small_options());
    controller.initialize({0.5, 0.5});

    EXPECT_FALSE(controller.locate({20000.0, 0.0, 0.0}).has_value());
    EXPECT_FALSE(controller.on_tick({20000.0, 0.0, 0.0}, 4.0).has_value());
}

TEST(Recenter, TrianglesResolveAgainstCurrentSnapshot) {
    const gg::GeoGrid grid = make_world();
    rc::RecenterController controller(grid, small_options());
    EXPECT_FALSE(controller.resolve_triangle(0).has_value());

    controller.initialize({0.5, 0.5});
    const auto snap = controller.snapshot();
    EXPECT_TRUE(controller.resolve_triangle(1) == snap->mesh.triangle_cells[1]);
    EXPECT_TRUE(controller.resolve_triangle(snap->mesh.triangle_cells.size()) == snap->mesh.triangle_cells[0]);
}

TEST(Recenter, CellPositionAndAgentRadius) {
    const gg::GeoGrid grid = make_world();
    rc::RecenterController controller(grid, small_options());
    controller.initialize({0.5, 0.5});

    const gg::GridAddress here = controller.center().address;
    const rc::LocalPosition p = controller.cell_position(here);
    EXPECT_LT(std::hypot(p.x, p.z), 2.0 * grid.mean_tile_size() * grid.subpixel_divisions());
    EXPECT_DOUBLE_EQ(p.y, 0.0);

    EXPECT_TRUE(controller.within_agent_radius(here));
    EXPECT_FALSE(controller.within_agent_radius(grid.neighbor(here, 0, 20)));
}

TEST(Recenter, RebaseShiftsOnlyTheHorizontalPlane) {
    rc::ProjectionCenter c;
    c.origin = {10.0, 99.0, -5.0};
    const auto out = rc::rebase(c, {{10.0, 1.0, -5.0}, {0.0, 0.0, 0.0}});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_TRUE(nearly_equal(out[0].x, 0.0));
    EXPECT_TRUE(nearly_equal(out[0].y, 1.0));
    EXPECT_TRUE(nearly_equal(out[0].z, 0.0));
    EXPECT_TRUE(nearly_equal(out[1].x, -10.0));
    EXPECT_TRUE(nearly_equal(out[1].z, 5.0));
}

TEST(Recenter, InvalidUseThrows) {
    const gg::GeoGrid grid = make_world();
    rc::RecenterOptions bad = small_options();
    bad.max_distance_in_cells = 0.0;
    EXPECT_THROW((void)rc::RecenterController(grid, bad), std::invalid_argument);
    bad = small_options();
    bad.max_region_cells = 0;
    EXPECT_THROW((void)rc::RecenterController(grid, bad), std::invalid_argument);

    rc::RecenterController controller(grid, small_options());
    std::vector<rc::LocalPosition> tracked;
    EXPECT_THROW(controller.apply({gg::GridAddress{}}, {}, tracked), std::logic_error);
}

TEST(Recenter, FailedRebuildKeepsOldSnapshotAndStaysStable) {
    const gg::GeoGrid grid = make_world();
    const gg::GridAddress polar = grid.geo_to_grid(0.0, 89.7);
    const gg::GridAddress equator = grid.geo_to_grid(0.5, 0.5);

    rc::RecenterOptions opt = small_options();
    opt.metric = rg::DistanceMetric::Euclidean;
    const size_t polar_cells = rg::select(grid, polar, opt.region_radius, opt.metric).size();
    ASSERT_LT(polar_cells, rg::select(grid, equator, opt.region_radius, opt.metric).size());

    // Room for the polar region only.
    opt.max_region_cells = polar_cells;
    rc::RecenterController controller(grid, opt);
    controller.initialize({0.0, 89.7});
    const auto before = controller.snapshot();

    const double tile = grid.mean_tile_size();
    std::vector<rc::LocalPosition> tracked = {{1.0, 0.0, 2.0}};
    EXPECT_THROW(controller.apply({equator}, {30.0 * tile, 0.0, 0.0}, tracked), std::length_error);

    EXPECT_EQ(controller.state(), rc::RecenterState::Stable);
    EXPECT_EQ(controller.snapshot(), before);
    EXPECT_EQ(controller.center().address, polar);
    EXPECT_TRUE(nearly_equal(tracked[0].x, 1.0));
    EXPECT_TRUE(nearly_equal(tracked[0].z, 2.0));

    // Ticks are still evaluated afterwards.
    EXPECT_TRUE(controller.on_tick({0.0, 0.0, -30.0 * tile}, 5.0).has_value());
}

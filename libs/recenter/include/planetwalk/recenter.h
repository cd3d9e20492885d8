#pragma once

#include <planetwalk/geogrid.h>
#include <planetwalk/mesh.h>
#include <planetwalk/region.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>

namespace planetwalk::recenter {

struct RecenterOptions {
    int region_radius = 80;
    double max_distance_in_cells = 20.0;
    double recreation_cooldown_seconds = 1.0;
    region::DistanceMetric metric = region::DistanceMetric::Chebyshev;
    // Rebuilds selecting more cells than this throw std::length_error.
    size_t max_region_cells = 4'000'000;
};

// LocalPosition lives on the tangent plane: x east, z north, y up.
struct LocalPosition {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

// ProjectionCenter is the tangent point in effect. origin is where the new
// centre sat in the previous local frame; it is (0,0,0) for the first one.
struct ProjectionCenter {
    geogrid::GeoCoordinate geo;
    geogrid::GridAddress address;
    LocalPosition origin;
};

// TerrainSnapshot is published whole on every recenter and never mutated.
struct TerrainSnapshot {
    ProjectionCenter center;
    mesh::TerrainMesh mesh;
    std::unordered_set<geogrid::GridAddress> cells;
    int region_radius = 0;
    region::DistanceMetric metric = region::DistanceMetric::Chebyshev;
    uint64_t generation = 0;

    [[nodiscard]] const std::vector<geogrid::GridAddress>& triangle_cells() const { return mesh.triangle_cells; }
};

enum class RecenterState { Stable, Recreating };

struct RecenterDecision {
    geogrid::GridAddress new_center;
};

// rebase moves positions from the old local frame into the one rooted at
// new_center: x and z lose new_center.origin, y is kept.
[[nodiscard]] std::vector<LocalPosition> rebase(const ProjectionCenter& new_center,
                                                std::vector<LocalPosition> positions);

class RecenterController {
public:
    RecenterController(const geogrid::GeoGrid& grid, RecenterOptions options);

    void initialize(const geogrid::GeoCoordinate& center_geo);

    // on_tick returns a decision once the subject is farther than
    // max_distance_in_cells from the origin and the cooldown has passed.
    [[nodiscard]] std::optional<RecenterDecision> on_tick(const LocalPosition& subject, double elapsed_seconds);
    [[nodiscard]] std::optional<RecenterDecision> on_tick(const LocalPosition& subject,
                                                          const geogrid::GridAddress& subject_address,
                                                          double elapsed_seconds);

    // apply rebuilds the terrain around the decision, publishes the snapshot
    // and rebases tracked, in that order. If the rebuild throws, nothing is
    // published and the controller stays Stable on the old snapshot.
    void apply(const RecenterDecision& decision, const LocalPosition& subject, std::vector<LocalPosition>& tracked);

    [[nodiscard]] std::shared_ptr<const TerrainSnapshot> snapshot() const { return snapshot_; }
    [[nodiscard]] const ProjectionCenter& center() const { return center_; }
    [[nodiscard]] RecenterState state() const { return state_; }
    [[nodiscard]] const RecenterOptions& options() const { return options_; }
    [[nodiscard]] uint64_t recenter_count() const { return generation_ > 0 ? generation_ - 1 : 0; }

    [[nodiscard]] double distance_in_cells(const LocalPosition& subject) const;
    [[nodiscard]] std::optional<geogrid::GeoCoordinate> locate_geo(const LocalPosition& pos) const;
    [[nodiscard]] std::optional<geogrid::GridAddress> locate(const LocalPosition& pos) const;
    [[nodiscard]] std::optional<geogrid::GridAddress> resolve_triangle(size_t triangle) const;
    [[nodiscard]] bool is_visible(const geogrid::GridAddress& addr) const;
    [[nodiscard]] bool within_agent_radius(const geogrid::GridAddress& addr) const;
    [[nodiscard]] LocalPosition cell_position(const geogrid::GridAddress& addr) const;

private:
    [[nodiscard]] std::shared_ptr<const TerrainSnapshot> build_snapshot(const ProjectionCenter& center);
    [[nodiscard]] bool cooled_down(double elapsed_seconds) const;

    const geogrid::GeoGrid& grid_;
    RecenterOptions options_;
    ProjectionCenter center_;
    std::shared_ptr<const TerrainSnapshot> snapshot_;
    RecenterState state_ = RecenterState::Stable;
    double last_recenter_seconds_;
    double last_tick_seconds_ = 0.0;
    uint64_t generation_ = 0;
};

} // namespace planetwalk::recenter

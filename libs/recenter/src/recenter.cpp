#include "planetwalk/recenter.h"

#include <planetwalk/log.h>

#include <cassert>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace planetwalk::recenter {

std::vector<LocalPosition> rebase(const ProjectionCenter& new_center, std::vector<LocalPosition> positions) {
    for (LocalPosition& p : positions) {
        p.x -= new_center.origin.x;
        p.z -= new_center.origin.z;
    }
    return positions;
}

RecenterController::RecenterController(const geogrid::GeoGrid& grid, RecenterOptions options)
    : grid_(grid), options_(options), last_recenter_seconds_(-std::numeric_limits<double>::infinity()) {
    if (options_.region_radius < 0)
        throw std::invalid_argument(std::format("recenter: region radius must not be negative, got {}",
                                                options_.region_radius));
    if (!(options_.max_distance_in_cells > 0.0))
        throw std::invalid_argument(std::format("recenter: max distance in cells must be positive, got {}",
                                                options_.max_distance_in_cells));
    if (options_.max_region_cells == 0)
        throw std::invalid_argument("recenter: region cell limit must be positive");
    if (options_.recreation_cooldown_seconds < 0.0)
        throw std::invalid_argument(std::format("recenter: cooldown must not be negative, got {}",
                                                options_.recreation_cooldown_seconds));
}

void RecenterController::initialize(const geogrid::GeoCoordinate& center_geo) {
    if (!center_geo.valid())
        throw std::invalid_argument("recenter: initial centre is not a valid coordinate");

    ProjectionCenter c;
    c.geo = center_geo;
    c.address = grid_.geo_to_grid(center_geo.lon, center_geo.lat);

    state_ = RecenterState::Recreating;
    snapshot_ = build_snapshot(c);
    center_ = c;
    state_ = RecenterState::Stable;
    LOGI("recenter: initialized at", center_geo.lon, center_geo.lat, "with", snapshot_->cells.size(), "cells");
}

double RecenterController::distance_in_cells(const LocalPosition& subject) const {
    return std::hypot(subject.x, subject.z) / grid_.mean_tile_size();
}

bool RecenterController::cooled_down(double elapsed_seconds) const {
    return elapsed_seconds - last_recenter_seconds_ >= options_.recreation_cooldown_seconds;
}

std::optional<RecenterDecision> RecenterController::on_tick(const LocalPosition& subject, double elapsed_seconds) {
    last_tick_seconds_ = elapsed_seconds;
    if (!snapshot_ || state_ != RecenterState::Stable) return std::nullopt;
    if (distance_in_cells(subject) <= options_.max_distance_in_cells || !cooled_down(elapsed_seconds))
        return std::nullopt;

    const std::optional<geogrid::GridAddress> addr = locate(subject);
    if (!addr) {
        LOGW_RATE_LIMIT(1000, "recenter: subject at", subject.x, subject.z, "is outside the projection domain");
        return std::nullopt;
    }
    return RecenterDecision{*addr};
}

std::optional<RecenterDecision> RecenterController::on_tick(const LocalPosition& subject,
                                                            const geogrid::GridAddress& subject_address,
                                                            double elapsed_seconds) {
    last_tick_seconds_ = elapsed_seconds;
    if (!snapshot_ || state_ != RecenterState::Stable) return std::nullopt;
    if (distance_in_cells(subject) <= options_.max_distance_in_cells || !cooled_down(elapsed_seconds))
        return std::nullopt;
    if (!grid_.contains(subject_address)) {
        LOGW_RATE_LIMIT(1000, "recenter: ignoring invalid subject address", subject_address.i, subject_address.j,
                        subject_address.k);
        return std::nullopt;
    }
    return RecenterDecision{subject_address};
}

void RecenterController::apply(const RecenterDecision& decision, const LocalPosition& subject,
                               std::vector<LocalPosition>& tracked) {
    if (!snapshot_) throw std::logic_error("recenter: apply called before initialize");

    state_ = RecenterState::Recreating;

    ProjectionCenter next;
    next.address = grid_.normalize(decision.new_center);
    next.origin = subject;
    const std::optional<geogrid::GeoCoordinate> geo = locate_geo(subject);
    next.geo = geo ? *geo : grid_.cell_center(next.address);

    std::shared_ptr<const TerrainSnapshot> built;
    std::vector<LocalPosition> moved;
    try {
        built = build_snapshot(next);
        moved = rebase(next, tracked);
    } catch (const std::exception& e) {
        state_ = RecenterState::Stable;
        LOGE("recenter: rebuild at", next.address.i, next.address.j, next.address.k, "failed:", e.what());
        throw;
    }

    // Publish mesh, triangle map and rebased positions together.
    snapshot_ = std::move(built);
    center_ = next;
    tracked = std::move(moved);
    last_recenter_seconds_ = last_tick_seconds_;
    state_ = RecenterState::Stable;

    LOGI("recenter: moved to", next.address.i, next.address.j, next.address.k, "cells", snapshot_->cells.size(),
         "generation", snapshot_->generation);
}

std::shared_ptr<const TerrainSnapshot> RecenterController::build_snapshot(const ProjectionCenter& center) {
    auto snap = std::make_shared<TerrainSnapshot>();
    snap->center = center;
    snap->region_radius = options_.region_radius;
    snap->metric = options_.metric;

    region::Region cells = region::select(grid_, center.address, options_.region_radius, options_.metric);
    assert(!cells.empty() && "region selection must include its centre");
    if (cells.empty()) {
        LOGE("recenter: empty region at", center.address.i, center.address.j, center.address.k,
             "falling back to a single cell");
        cells.cells.push_back({center.address, grid_.corners(center.address)});
    }

    if (cells.size() > options_.max_region_cells)
        throw std::length_error(std::format("recenter: region of {} cells exceeds the limit of {}", cells.size(),
                                            options_.max_region_cells));

    snap->mesh = mesh::build(grid_, cells, center.geo);
    snap->cells.reserve(cells.size());
    for (const region::RegionCell& c : cells.cells) snap->cells.insert(c.address);
    snap->generation = ++generation_;
    return snap;
}

std::optional<geogrid::GeoCoordinate> RecenterController::locate_geo(const LocalPosition& pos) const {
    const geogrid::GeoCoordinate g = grid_.gnomonic_to_geo(pos.x, pos.z, center_.geo.lon, center_.geo.lat);
    if (!g.valid()) return std::nullopt;
    return g;
}

std::optional<geogrid::GridAddress> RecenterController::locate(const LocalPosition& pos) const {
    const std::optional<geogrid::GeoCoordinate> g = locate_geo(pos);
    if (!g) return std::nullopt;
    return grid_.geo_to_grid(g->lon, g->lat);
}

std::optional<geogrid::GridAddress> RecenterController::resolve_triangle(size_t triangle) const {
    if (!snapshot_) return std::nullopt;
    return mesh::resolve_triangle(snapshot_->triangle_cells(), triangle);
}

bool RecenterController::is_visible(const geogrid::GridAddress& addr) const {
    return snapshot_ && snapshot_->cells.contains(addr);
}

bool RecenterController::within_agent_radius(const geogrid::GridAddress& addr) const {
    const double limit = 2.0 * options_.region_radius / 3.0;
    return region::cell_distance(grid_, center_.address, addr, options_.metric) <= limit;
}

LocalPosition RecenterController::cell_position(const geogrid::GridAddress& addr) const {
    const geogrid::GeoCoordinate g = grid_.cell_center(addr);
    const geogrid::PlanePoint p = grid_.geo_to_gnomonic(g.lon, g.lat, center_.geo.lon, center_.geo.lat);
    return {p.x, 0.0, p.y};
}

} // namespace planetwalk::recenter

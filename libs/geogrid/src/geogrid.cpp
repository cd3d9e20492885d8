#include "planetwalk/geogrid.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <numbers>
#include <stdexcept>

namespace planetwalk::geogrid {

namespace {

constexpr double deg2rad = std::numbers::pi / 180.0;
constexpr double rad2deg = 180.0 / std::numbers::pi;

[[nodiscard]] int posmod(int v, int m) {
    const int r = v % m;
    return r < 0 ? r + m : r;
}

[[nodiscard]] GeoCoordinate invalid_coordinate() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    return {nan, nan};
}

// Longitude folded into [-180, 180).
[[nodiscard]] double wrap_longitude(double lon) {
    double w = std::fmod(lon + 180.0, 360.0);
    if (w < 0.0) w += 360.0;
    return w - 180.0;
}

[[nodiscard]] int sign(int v) {
    return (v > 0) - (v < 0);
}

} // namespace

bool GeoCoordinate::valid() const {
    return std::isfinite(lon) && std::isfinite(lat);
}

int lon_subdivisions(int subpixel_divisions, double latitude) {
    const double n = std::round(static_cast<double>(subpixel_divisions) * std::cos(latitude * deg2rad));
    return std::max(1, static_cast<int>(n));
}

PlanePoint geo_to_gnomonic(double lon, double lat, double center_lon, double center_lat, double radius) {
    const double phi = lat * deg2rad;
    const double phi0 = center_lat * deg2rad;
    const double dlambda = (lon - center_lon) * deg2rad;

    double cos_c = std::sin(phi0) * std::sin(phi) + std::cos(phi0) * std::cos(phi) * std::cos(dlambda);
    cos_c = std::max(cos_c, min_projection_cosine);

    PlanePoint p;
    p.x = radius * std::cos(phi) * std::sin(dlambda) / cos_c;
    p.y = radius * (std::cos(phi0) * std::sin(phi) - std::sin(phi0) * std::cos(phi) * std::cos(dlambda)) / cos_c;
    return p;
}

GeoCoordinate gnomonic_to_geo(double x, double y, double center_lon, double center_lat, double radius) {
    const double xn = x / radius;
    const double yn = y / radius;
    const double rho = std::hypot(xn, yn);
    if (rho < 1e-12) return {center_lon, center_lat};
    if (rho > max_inverse_rho || !std::isfinite(rho)) return invalid_coordinate();

    const double phi0 = center_lat * deg2rad;
    const double c = std::atan(rho);
    const double sin_c = std::sin(c);
    const double cos_c = std::cos(c);

    const double s = std::clamp(cos_c * std::sin(phi0) + yn * sin_c * std::cos(phi0) / rho, -1.0, 1.0);
    const double lat = std::asin(s) * rad2deg;
    const double lon = wrap_longitude(
        center_lon + std::atan2(xn * sin_c, rho * std::cos(phi0) * cos_c - yn * std::sin(phi0) * sin_c) * rad2deg);

    if (!std::isfinite(lon) || lat < -90.0 || lat > 90.0) return invalid_coordinate();
    return {lon, lat};
}

GeoGrid::GeoGrid(int width_pixels, int height_pixels, int subpixel_divisions)
    : width_(width_pixels), height_(height_pixels), subdivisions_(subpixel_divisions) {
    if (width_ <= 0 || height_ <= 0)
        throw std::invalid_argument(std::format("geogrid: invalid dimensions {}x{}", width_, height_));
    if (subdivisions_ <= 0 || subdivisions_ > max_subpixel_divisions)
        throw std::invalid_argument(std::format("geogrid: subpixel divisions must be in [1, {}], got {}",
                                                max_subpixel_divisions, subdivisions_));
    cells_.resize(static_cast<size_t>(width_) * static_cast<size_t>(height_));
    compute_mean_tile_size();
}

GeoGrid GeoGrid::from_image(const raster::Image& image, int subpixel_divisions) {
    if (image.empty()) throw raster::LoadError("geogrid: empty raster");

    GeoGrid grid(image.width, image.height, subpixel_divisions);
    for (int y = 0; y < image.height; ++y) {
        const int j = image.height - 1 - y;
        for (int x = 0; x < image.width; ++x) {
            const uint8_t* px = image.at(x, y);
            RasterCell& c = grid.cells_[static_cast<size_t>(j) * static_cast<size_t>(grid.width_) +
                                        static_cast<size_t>(x)];
            c.elevation = raster::luma(px) / 255.0;
            c.sea = c.elevation < sea_level;
            c.color = {px[0] / 255.0, px[1] / 255.0, px[2] / 255.0, px[3] / 255.0};
        }
    }
    return grid;
}

GeoGrid GeoGrid::load(const std::filesystem::path& path, int subpixel_divisions) {
    return from_image(raster::load(path), subpixel_divisions);
}

void GeoGrid::set_radius(double radius) {
    if (!(radius > 0.0) || !std::isfinite(radius))
        throw std::invalid_argument(std::format("geogrid: planet radius must be positive, got {}", radius));
    radius_ = radius;
    compute_mean_tile_size();
}

void GeoGrid::compute_mean_tile_size() {
    const GridAddress a{width_ / 2, height_ / 2, 0};
    const GridAddress b{width_ / 2, height_ / 2, 1};
    const GeoCoordinate ga = grid_to_geo(a);
    const GeoCoordinate gb = grid_to_geo(b);
    const PlanePoint pa = geo_to_gnomonic(ga.lon, ga.lat, 0.0, 0.0);
    const PlanePoint pb = geo_to_gnomonic(gb.lon, gb.lat, 0.0, 0.0);
    mean_tile_size_ = std::abs(pb.x - pa.x) + std::abs(pb.y - pa.y);

    // With a single subdivision k=1 folds back onto k=0; use one pixel row instead.
    if (mean_tile_size_ <= 0.0) mean_tile_size_ = radius_ * pixel_height_degrees() * deg2rad;
}

int GeoGrid::lon_subdivisions(double latitude) const {
    return geogrid::lon_subdivisions(subdivisions_, latitude);
}

double GeoGrid::row_latitude(int j) const {
    return (static_cast<double>(j) + 0.5) / static_cast<double>(height_) * 180.0 - 90.0;
}

int GeoGrid::row_lon_subdivisions(int j) const {
    return lon_subdivisions(row_latitude(std::clamp(j, 0, height_ - 1)));
}

double GeoGrid::pixel_width_degrees() const {
    return 360.0 / static_cast<double>(width_);
}

double GeoGrid::pixel_height_degrees() const {
    return 180.0 / static_cast<double>(height_);
}

int GeoGrid::wrap_i(int i) const {
    return posmod(i, width_);
}

bool GeoGrid::in_bounds(int i, int j) const {
    return i >= 0 && i < width_ && j >= 0 && j < height_;
}

GridAddress GeoGrid::geo_to_grid(double lon, double lat) const {
    if (!std::isfinite(lon) || !std::isfinite(lat))
        throw std::invalid_argument(std::format("geogrid: non-finite coordinate ({}, {})", lon, lat));

    double u = (lon + 180.0) / 360.0;
    u -= std::floor(u);
    const double v = (lat + 90.0) / 180.0;

    const int i = wrap_i(static_cast<int>(std::floor(u * width_)));
    const int j = std::clamp(static_cast<int>(std::floor(v * height_)), 0, height_ - 1);

    // Subcell indices are taken modulo the pixel index; the mapping is lossy.
    const int n = row_lon_subdivisions(j);
    return {i, j, compose_k(i % n, j % subdivisions_)};
}

GeoCoordinate GeoGrid::grid_to_geo(const GridAddress& addr) const {
    const int n = row_lon_subdivisions(addr.j);
    const int si = posmod(sub_i(addr.k), n);
    const int sj = posmod(sub_j(addr.k), subdivisions_);
    const double pw = pixel_width_degrees();
    const double ph = pixel_height_degrees();
    return {addr.i * pw - 180.0 + si * pw / n, addr.j * ph - 90.0 + sj * ph / subdivisions_};
}

GeoCoordinate GeoGrid::cell_center(const GridAddress& addr) const {
    const GeoCoordinate sw = grid_to_geo(addr);
    const int n = row_lon_subdivisions(addr.j);
    return {sw.lon + 0.5 * pixel_width_degrees() / n, sw.lat + 0.5 * pixel_height_degrees() / subdivisions_};
}

GridAddress GeoGrid::neighbor(const GridAddress& addr, int di, int dj) const {
    const GridAddress start = normalize(addr);
    int i = start.i;
    int j = start.j;
    int si = sub_i(start.k);
    int sj = sub_j(start.k);

    int step = sign(dj);
    for (int remaining = std::abs(dj); remaining > 0; --remaining) {
        sj += step;
        if (sj >= 0 && sj < subdivisions_) continue;

        const int n_c = row_lon_subdivisions(j);
        const int target = j + step;
        if (target < 0 || target >= height_) {
            // Over the pole: same row on the far side, walking back.
            sj = sj < 0 ? 0 : subdivisions_ - 1;
            step = -step;
            i = wrap_i(i + width_ / 2);
            continue;
        }
        const int n_t = row_lon_subdivisions(target);
        si = si * n_t / n_c;
        sj = sj < 0 ? subdivisions_ - 1 : 0;
        j = target;
    }

    const int n = row_lon_subdivisions(j);
    const int lon_step = sign(di);
    for (int remaining = std::abs(di); remaining > 0; --remaining) {
        si += lon_step;
        if (si >= n) {
            si = 0;
            i = wrap_i(i + 1);
        } else if (si < 0) {
            si = n - 1;
            i = wrap_i(i - 1);
        }
    }

    return {i, j, compose_k(si, sj)};
}

std::pair<int, int> GeoGrid::neighbor_pixel(int i, int j, int di, int dj) const {
    i += di;
    j += dj;
    while (j < 0 || j >= height_) {
        j = j < 0 ? -1 - j : 2 * height_ - 1 - j;
        i += width_ / 2;
    }
    return {wrap_i(i), j};
}

PlanePoint GeoGrid::geo_to_gnomonic(double lon, double lat, double center_lon, double center_lat) const {
    return geogrid::geo_to_gnomonic(lon, lat, center_lon, center_lat, radius_);
}

GeoCoordinate GeoGrid::gnomonic_to_geo(double x, double y, double center_lon, double center_lat) const {
    return geogrid::gnomonic_to_geo(x, y, center_lon, center_lat, radius_);
}

Corners GeoGrid::corners(const GridAddress& addr) const {
    const GridAddress a = normalize(addr);
    const int n = row_lon_subdivisions(a.j);
    const GeoCoordinate sw = grid_to_geo(a);
    const double east = sw.lon + pixel_width_degrees() / n;
    const double north = sw.lat + pixel_height_degrees() / subdivisions_;
    return {GeoCoordinate{sw.lon, north}, GeoCoordinate{east, north}, GeoCoordinate{east, sw.lat},
            GeoCoordinate{sw.lon, sw.lat}};
}

Corners GeoGrid::pixel_corners(int i, int j) const {
    i = wrap_i(i);
    j = std::clamp(j, 0, height_ - 1);
    const double west = i * pixel_width_degrees() - 180.0;
    const double south = j * pixel_height_degrees() - 90.0;
    const double east = west + pixel_width_degrees();
    const double north = south + pixel_height_degrees();
    return {GeoCoordinate{west, north}, GeoCoordinate{east, north}, GeoCoordinate{east, south},
            GeoCoordinate{west, south}};
}

Rgba GeoGrid::rgba(int i, int j) const {
    if (!in_bounds(i, j)) return {0.0, 0.0, 0.0, 1.0};
    return cell(i, j).color;
}

const RasterCell& GeoGrid::cell(int i, int j) const {
    if (!in_bounds(i, j))
        throw std::out_of_range(std::format("geogrid: pixel ({}, {}) outside {}x{}", i, j, width_, height_));
    return cells_[static_cast<size_t>(j) * static_cast<size_t>(width_) + static_cast<size_t>(i)];
}

double GeoGrid::elevation(int i, int j) const {
    return cell(i, j).elevation;
}

bool GeoGrid::is_sea(int i, int j) const {
    return cell(i, j).sea;
}

bool GeoGrid::contains(const GridAddress& addr) const {
    if (!in_bounds(addr.i, addr.j) || addr.k < 0) return false;
    return sub_i(addr.k) < row_lon_subdivisions(addr.j);
}

GridAddress GeoGrid::normalize(const GridAddress& addr) const {
    const int i = wrap_i(addr.i);
    const int j = std::clamp(addr.j, 0, height_ - 1);
    const int k = std::max(addr.k, 0);
    const int n = row_lon_subdivisions(j);
    return {i, j, compose_k(sub_i(k) % n, sub_j(k))};
}

} // namespace planetwalk::geogrid

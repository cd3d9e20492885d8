#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <utility>
#include <vector>

#include <planetwalk/raster.h>

namespace planetwalk::geogrid {

// Elevations below this normalized value are sea.
inline constexpr double sea_level = 0.3;

// Angular-distance cosine floor of the forward gnomonic projection.
inline constexpr double min_projection_cosine = 0.01;

// Upper bound on S; k = sub_i * S + sub_j must stay well inside int.
inline constexpr int max_subpixel_divisions = 1024;

// Normalized radius beyond which the inverse gnomonic projection gives up.
inline constexpr double max_inverse_rho = 10.0;

// GeoCoordinate is a longitude/latitude pair in degrees. Inverse projections
// that leave their domain return NaN for both fields.
struct GeoCoordinate {
    double lon = 0.0;
    double lat = 0.0;

    [[nodiscard]] bool valid() const;
};

// GridAddress names one subcell: pixel (i, j) and composite subpixel
// index k = sub_i * S + sub_j.
struct GridAddress {
    int i = 0;
    int j = 0;
    int k = 0;

    bool operator==(const GridAddress&) const = default;
};

struct GridAddressHash {
    size_t operator()(const GridAddress& a) const noexcept {
        uint64_t h = static_cast<uint64_t>(static_cast<uint32_t>(a.i)) * 0x9E3779B185EBCA87ULL;
        h ^= static_cast<uint64_t>(static_cast<uint32_t>(a.j)) * 0xC2B2AE3D27D4EB4FULL;
        h ^= static_cast<uint64_t>(static_cast<uint32_t>(a.k)) * 0x165667B19E3779F9ULL;
        return static_cast<size_t>(h ^ (h >> 29));
    }
};

// PlanePoint is a position on the gnomonic tangent plane, x east and y north.
struct PlanePoint {
    double x = 0.0;
    double y = 0.0;
};

struct Rgba {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;
};

struct RasterCell {
    double elevation = 0.0;
    bool sea = false;
    Rgba color;
};

// Corners are ordered clockwise: top-left, top-right, bottom-right,
// bottom-left, with top being the northern edge. Longitudes stay inside the
// parent pixel's span and never wrap across the date line.
using Corners = std::array<GeoCoordinate, 4>;

// lon_subdivisions is max(1, round(S * cos(lat))).
[[nodiscard]] int lon_subdivisions(int subpixel_divisions, double latitude);

[[nodiscard]] PlanePoint geo_to_gnomonic(double lon, double lat, double center_lon, double center_lat, double radius);

// gnomonic_to_geo returns (NaN, NaN) outside the projection's validity domain.
// Longitudes past the date line or across a pole are folded into [-180, 180).
[[nodiscard]] GeoCoordinate gnomonic_to_geo(double x, double y, double center_lon, double center_lat, double radius);

// GeoGrid is the planisphere: an equirectangular raster addressed as pixels
// split into latitude-corrected subcells. It is immutable once loaded.
class GeoGrid {
public:
    GeoGrid(int width_pixels, int height_pixels, int subpixel_divisions);

    // Image row 0 becomes grid row height-1; grid rows count northwards.
    static GeoGrid from_image(const raster::Image& image, int subpixel_divisions);
    static GeoGrid load(const std::filesystem::path& path, int subpixel_divisions);

    [[nodiscard]] int width_pixels() const { return width_; }
    [[nodiscard]] int height_pixels() const { return height_; }
    [[nodiscard]] int subpixel_divisions() const { return subdivisions_; }
    [[nodiscard]] double radius() const { return radius_; }
    [[nodiscard]] double mean_tile_size() const { return mean_tile_size_; }

    void set_radius(double radius);

    [[nodiscard]] int lon_subdivisions(double latitude) const;
    [[nodiscard]] double row_latitude(int j) const;
    [[nodiscard]] int row_lon_subdivisions(int j) const;
    [[nodiscard]] double pixel_width_degrees() const;
    [[nodiscard]] double pixel_height_degrees() const;

    [[nodiscard]] GridAddress geo_to_grid(double lon, double lat) const;
    [[nodiscard]] GeoCoordinate grid_to_geo(const GridAddress& addr) const;
    [[nodiscard]] GeoCoordinate cell_center(const GridAddress& addr) const;

    [[nodiscard]] GridAddress neighbor(const GridAddress& addr, int di, int dj) const;
    [[nodiscard]] std::pair<int, int> neighbor_pixel(int i, int j, int di, int dj) const;

    [[nodiscard]] PlanePoint geo_to_gnomonic(double lon, double lat, double center_lon, double center_lat) const;
    [[nodiscard]] GeoCoordinate gnomonic_to_geo(double x, double y, double center_lon, double center_lat) const;

    [[nodiscard]] Corners corners(const GridAddress& addr) const;
    [[nodiscard]] Corners pixel_corners(int i, int j) const;

    [[nodiscard]] Rgba rgba(int i, int j) const;
    [[nodiscard]] const RasterCell& cell(int i, int j) const;
    [[nodiscard]] double elevation(int i, int j) const;
    [[nodiscard]] bool is_sea(int i, int j) const;

    [[nodiscard]] bool contains(const GridAddress& addr) const;
    [[nodiscard]] GridAddress normalize(const GridAddress& addr) const;

    [[nodiscard]] int sub_i(int k) const { return k / subdivisions_; }
    [[nodiscard]] int sub_j(int k) const { return k % subdivisions_; }
    [[nodiscard]] int compose_k(int sub_i, int sub_j) const { return sub_i * subdivisions_ + sub_j; }

    [[nodiscard]] int wrap_i(int i) const;

private:
    [[nodiscard]] bool in_bounds(int i, int j) const;
    void compute_mean_tile_size();

    int width_ = 0;
    int height_ = 0;
    int subdivisions_ = 1;
    double radius_ = 1.0;
    double mean_tile_size_ = 0.0;
    std::vector<RasterCell> cells_; // row-major, row 0 = southernmost
};

} // namespace planetwalk::geogrid

template <>
struct std::hash<planetwalk::geogrid::GridAddress> : planetwalk::geogrid::GridAddressHash {};

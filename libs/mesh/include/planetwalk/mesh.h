#pragma once

#include <planetwalk/geogrid.h>
#include <planetwalk/region.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace planetwalk::mesh {

inline constexpr int atlas_size = 16;
inline constexpr int texture_tile_count = 10;

// TerrainMesh is the flat tangent-plane mesh of one region. Vertex positions are
// (x, 0, y) with x east and y north of the projection centre. Triangle t is
// indices[3t..3t+2] and came from cell triangle_cells[t].
struct TerrainMesh {
    std::vector<std::array<float, 3>> vertices;
    std::vector<std::array<float, 2>> uvs;
    std::vector<uint32_t> indices;
    std::vector<geogrid::GridAddress> triangle_cells;
    std::vector<int> cell_tiles; // texture tile per quad

    [[nodiscard]] size_t cell_count() const { return vertices.size() / 4; }
    [[nodiscard]] size_t triangle_count() const { return indices.size() / 3; }
    [[nodiscard]] bool empty() const { return vertices.empty(); }
};

TerrainMesh build(const geogrid::GeoGrid& grid, const region::Region& region, const geogrid::GeoCoordinate& center);

// select_texture maps the red channel into ten 0.1-wide bands.
[[nodiscard]] int select_texture(const geogrid::Rgba& rgba);

// atlas_uvs returns the tile's quad in the atlas in bottom-left, bottom-right,
// top-right, top-left order.
[[nodiscard]] std::array<std::array<float, 2>, 4> atlas_uvs(int tile);

// collision_triangles groups the index list by triangle in mesh order, so a
// collider built from it reports the same triangle ids as triangle_cells.
[[nodiscard]] std::vector<std::array<uint32_t, 3>> collision_triangles(const TerrainMesh& mesh);

// resolve_triangle maps a collider triangle id back to its cell. Ids past the
// end are folded modulo the map length with a warning; an empty map yields
// nothing.
[[nodiscard]] std::optional<geogrid::GridAddress> resolve_triangle(
    const std::vector<geogrid::GridAddress>& triangle_cells, size_t triangle);

} // namespace planetwalk::mesh

#include "planetwalk/mesh.h"

#include <planetwalk/log.h>

#include <algorithm>
#include <cassert>
#include <cmath>

namespace planetwalk::mesh {

TerrainMesh build(const geogrid::GeoGrid& grid, const region::Region& region, const geogrid::GeoCoordinate& center) {
    TerrainMesh mesh;
    assert(!region.empty() && "region selection must include its centre");
    if (region.empty()) {
        LOGE("mesh: empty region around", center.lon, center.lat);
        return mesh;
    }

    const size_t n = region.size();
    mesh.vertices.reserve(n * 4);
    mesh.uvs.reserve(n * 4);
    mesh.indices.reserve(n * 6);
    mesh.triangle_cells.reserve(n * 2);
    mesh.cell_tiles.reserve(n);

    uint32_t base = 0;
    for (const region::RegionCell& cell : region.cells) {
        for (const geogrid::GeoCoordinate& corner : cell.corners) {
            const geogrid::PlanePoint p = grid.geo_to_gnomonic(corner.lon, corner.lat, center.lon, center.lat);
            mesh.vertices.push_back({static_cast<float>(p.x), 0.0f, static_cast<float>(p.y)});
        }

        const int tile = select_texture(grid.rgba(cell.address.i, cell.address.j));
        for (const auto& uv : atlas_uvs(tile)) mesh.uvs.push_back(uv);
        mesh.cell_tiles.push_back(tile);

        mesh.indices.insert(mesh.indices.end(), {base, base + 1, base + 2, base, base + 2, base + 3});
        mesh.triangle_cells.push_back(cell.address);
        mesh.triangle_cells.push_back(cell.address);
        base += 4;
    }

    LOGD("mesh:", n, "cells,", mesh.triangle_count(), "triangles around", center.lon, center.lat);
    return mesh;
}

int select_texture(const geogrid::Rgba& rgba) {
    if (!(rgba.r >= 0.0)) return 0;
    const int band = static_cast<int>(std::floor(rgba.r * 10.0));
    return std::clamp(band, 0, texture_tile_count - 1);
}

std::array<std::array<float, 2>, 4> atlas_uvs(int tile) {
    const float size = 1.0f / static_cast<float>(atlas_size);
    const float u = static_cast<float>(tile % atlas_size) * size;
    const float v = static_cast<float>(tile / atlas_size) * size;
    return {{{u, v}, {u + size, v}, {u + size, v + size}, {u, v + size}}};
}

std::vector<std::array<uint32_t, 3>> collision_triangles(const TerrainMesh& mesh) {
    std::vector<std::array<uint32_t, 3>> out;
    out.reserve(mesh.triangle_count());
    for (size_t t = 0; t + 2 < mesh.indices.size(); t += 3) {
        out.push_back({mesh.indices[t], mesh.indices[t + 1], mesh.indices[t + 2]});
    }
    return out;
}

std::optional<geogrid::GridAddress> resolve_triangle(const std::vector<geogrid::GridAddress>& triangle_cells,
                                                     size_t triangle) {
    if (triangle_cells.empty()) return std::nullopt;
    if (triangle < triangle_cells.size()) return triangle_cells[triangle];

    LOGW_RATE_LIMIT(1000, "mesh: triangle", triangle, "outside map of", triangle_cells.size(), "entries, folding");
    return triangle_cells[triangle % triangle_cells.size()];
}

} // namespace planetwalk::mesh

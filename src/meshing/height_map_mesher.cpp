#include "meshing/height_map_mesher.h"

#include <cstdint>

#include <glm/geometric.hpp>

namespace meshing
{

void triangulateHeightMap(const procgen::Array2<float>& heights,
                          const procgen::Extent2i& extent,
                          HeightMapMeshBuffer& buffer)
{
    PosNormMesh& mesh = buffer.mesh;
    mesh.clear();

    const procgen::Extent2i interior = extent.intersection(heights.extent()).padded(-1);
    if (interior.isEmpty())
    {
        return;
    }

    const glm::ivec2 stepX{1, 0};
    const glm::ivec2 stepZ{0, 1};
    interior.forEachPoint([&](const glm::ivec2& p) {
        const float height = heights.get(p);
        const float dx = heights.get(p + stepX) - heights.get(p - stepX);
        const float dz = heights.get(p + stepZ) - heights.get(p - stepZ);

        mesh.positions.emplace_back(static_cast<float>(p.x), height, static_cast<float>(p.y));
        mesh.normals.push_back(glm::normalize(glm::vec3(-dx, 2.0f, -dz)));
    });

    // Vertices were emitted x fastest, so (x, z) lives at x + z * width.
    const auto width = static_cast<std::uint32_t>(interior.shape.x);
    const auto depth = static_cast<std::uint32_t>(interior.shape.y);
    for (std::uint32_t z = 0; z + 1 < depth; ++z)
    {
        for (std::uint32_t x = 0; x + 1 < width; ++x)
        {
            const std::uint32_t i00 = x + z * width;
            const std::uint32_t i10 = i00 + 1;
            const std::uint32_t i01 = i00 + width;
            const std::uint32_t i11 = i01 + 1;
            mesh.indices.insert(mesh.indices.end(), {i00, i01, i10, i10, i01, i11});
        }
    }
}

} // namespace meshing

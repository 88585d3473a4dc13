#include "meshing/surface_nets.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

#include <glm/common.hpp>
#include <glm/geometric.hpp>

namespace meshing
{
namespace
{
using procgen::Array3;
using procgen::Extent3i;

// Corner i of a cell sits at offset (i & 1, (i >> 1) & 1, (i >> 2) & 1).
constexpr std::array<glm::ivec3, 8> kCubeCorners{
    glm::ivec3{0, 0, 0},
    glm::ivec3{1, 0, 0},
    glm::ivec3{0, 1, 0},
    glm::ivec3{1, 1, 0},
    glm::ivec3{0, 0, 1},
    glm::ivec3{1, 0, 1},
    glm::ivec3{0, 1, 1},
    glm::ivec3{1, 1, 1}
};

constexpr std::array<std::array<int, 2>, 12> kCubeEdges{{
    {0, 1}, {2, 3}, {4, 5}, {6, 7},
    {0, 2}, {1, 3}, {4, 6}, {5, 7},
    {0, 4}, {1, 5}, {2, 6}, {3, 7}
}};

constexpr std::array<glm::ivec3, 3> kAxes{
    glm::ivec3{1, 0, 0},
    glm::ivec3{0, 1, 0},
    glm::ivec3{0, 0, 1}
};

// Ambient samples are float max; clamp before differencing so gradients stay finite.
constexpr float kGradientSampleLimit = 1.0e6f;

inline bool isInside(float value) noexcept
{
    return value < 0.0f;
}

void estimateSurfaceInCell(const Array3<float>& sdf, const glm::ivec3& cellMin, SurfaceNetsBuffer& buffer)
{
    std::array<float, 8> corners{};
    int insideCount = 0;
    for (std::size_t i = 0; i < kCubeCorners.size(); ++i)
    {
        corners[i] = sdf.get(cellMin + kCubeCorners[i]);
        if (isInside(corners[i]))
        {
            ++insideCount;
        }
    }

    if (insideCount == 0 || insideCount == 8)
    {
        return;
    }

    glm::vec3 crossingSum{0.0f};
    int crossingCount = 0;
    for (const auto& edge : kCubeEdges)
    {
        const float a = corners[static_cast<std::size_t>(edge[0])];
        const float b = corners[static_cast<std::size_t>(edge[1])];
        if (isInside(a) == isInside(b))
        {
            continue;
        }

        const float t = a / (a - b);
        const glm::vec3 cornerA(kCubeCorners[static_cast<std::size_t>(edge[0])]);
        const glm::vec3 cornerB(kCubeCorners[static_cast<std::size_t>(edge[1])]);
        crossingSum += glm::mix(cornerA, cornerB, std::clamp(t, 0.0f, 1.0f));
        ++crossingCount;
    }

    std::array<float, 8> clamped{};
    for (std::size_t i = 0; i < corners.size(); ++i)
    {
        clamped[i] = std::clamp(corners[i], -kGradientSampleLimit, kGradientSampleLimit);
    }

    glm::vec3 gradient{
        (clamped[1] + clamped[3] + clamped[5] + clamped[7]) - (clamped[0] + clamped[2] + clamped[4] + clamped[6]),
        (clamped[2] + clamped[3] + clamped[6] + clamped[7]) - (clamped[0] + clamped[1] + clamped[4] + clamped[5]),
        (clamped[4] + clamped[5] + clamped[6] + clamped[7]) - (clamped[0] + clamped[1] + clamped[2] + clamped[3])
    };
    const float gradientLength = glm::length(gradient);
    if (gradientLength > 0.0f)
    {
        gradient /= gradientLength;
    }

    const auto vertexIndex = static_cast<std::uint32_t>(buffer.mesh.positions.size());
    buffer.mesh.positions.push_back(glm::vec3(cellMin) + crossingSum / static_cast<float>(crossingCount));
    buffer.mesh.normals.push_back(gradient);
    buffer.cellToVertex[sdf.index(cellMin)] = vertexIndex;
    buffer.surfacePoints.push_back(cellMin);
}

// Emits the quad around the edge from p along axis a, if the edge changes sign.
void maybeMakeQuad(const Array3<float>& sdf, const glm::ivec3& p, int a, SurfaceNetsBuffer& buffer)
{
    const float start = sdf.get(p);
    const float end = sdf.get(p + kAxes[static_cast<std::size_t>(a)]);
    if (isInside(start) == isInside(end))
    {
        return;
    }

    const glm::ivec3 stepB = kAxes[static_cast<std::size_t>((a + 1) % 3)];
    const glm::ivec3 stepC = kAxes[static_cast<std::size_t>((a + 2) % 3)];

    const std::uint32_t v0 = buffer.cellToVertex[sdf.index(p - stepB - stepC)];
    const std::uint32_t v1 = buffer.cellToVertex[sdf.index(p - stepC)];
    const std::uint32_t v2 = buffer.cellToVertex[sdf.index(p)];
    const std::uint32_t v3 = buffer.cellToVertex[sdf.index(p - stepB)];
    if (v0 == SurfaceNetsBuffer::kNoVertex || v1 == SurfaceNetsBuffer::kNoVertex ||
        v2 == SurfaceNetsBuffer::kNoVertex || v3 == SurfaceNetsBuffer::kNoVertex)
    {
        return;
    }

    // v0..v3 wind counter-clockwise around +a, so keep that order when the solid is behind.
    std::vector<std::uint32_t>& indices = buffer.mesh.indices;
    if (isInside(start))
    {
        indices.insert(indices.end(), {v0, v1, v2, v0, v2, v3});
    }
    else
    {
        indices.insert(indices.end(), {v0, v2, v1, v0, v3, v2});
    }
}

} // namespace

void surfaceNets(const Array3<float>& sdf, const Extent3i& extent, SurfaceNetsBuffer& buffer)
{
    buffer.reset(static_cast<std::size_t>(sdf.extent().volume()));

    const Extent3i region = extent.intersection(sdf.extent());
    if (region.isEmpty())
    {
        return;
    }

    // A cell is named by its minimum corner and needs all eight corners in the region.
    const Extent3i cells = region.addToShape(glm::ivec3(-1));
    cells.forEachPoint([&](const glm::ivec3& cellMin) {
        estimateSurfaceInCell(sdf, cellMin, buffer);
    });

    const Extent3i interior = region.padded(-1);
    for (const glm::ivec3& p : buffer.surfacePoints)
    {
        if (!interior.contains(p))
        {
            continue;
        }
        for (int a = 0; a < 3; ++a)
        {
            maybeMakeQuad(sdf, p, a, buffer);
        }
    }
}

} // namespace meshing

#pragma once
// surface_nets.h
// Iso-surface extraction for volumetric fields sampled on the lattice.

#include <cstdint>
#include <limits>
#include <vector>

#include <glm/vec3.hpp>

#include "meshing/pos_norm_mesh.h"
#include "procgen/array.h"
#include "procgen/extent.h"

namespace meshing
{

struct SurfaceNetsBuffer
{
    static constexpr std::uint32_t kNoVertex = std::numeric_limits<std::uint32_t>::max();

    PosNormMesh mesh;
    // Minimum corners of the cells that received a vertex.
    std::vector<glm::ivec3> surfacePoints;
    // Vertex index per array cell, kNoVertex where the cell has no crossing.
    std::vector<std::uint32_t> cellToVertex;

    SurfaceNetsBuffer()
    {
        mesh.positions.reserve(4096);
        mesh.normals.reserve(4096);
        mesh.indices.reserve(6144);
        surfacePoints.reserve(4096);
    }

    void reset(std::size_t arrayVolume)
    {
        mesh.clear();
        surfacePoints.clear();
        cellToVertex.assign(arrayVolume, kNoVertex);
    }
};

// Places one vertex in every cell whose corners straddle zero and connects the vertices of
// the four cells around each sign-changing lattice edge. Only edges starting in
// extent.padded(-1) are meshed, so a chunk's padded extent meshes exactly the edges owned by
// the chunk. Values below zero are inside; quads face outward. Positions are global.
// extent must lie within sdf.extent(). The buffer is cleared first.
void surfaceNets(const procgen::Array3<float>& sdf, const procgen::Extent3i& extent, SurfaceNetsBuffer& buffer);

} // namespace meshing

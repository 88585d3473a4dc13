#pragma once

#include "meshing/pos_norm_mesh.h"
#include "procgen/array.h"
#include "procgen/extent.h"

namespace meshing
{

struct HeightMapMeshBuffer
{
    PosNormMesh mesh;

    HeightMapMeshBuffer()
    {
        mesh.positions.reserve(1024);
        mesh.normals.reserve(1024);
        mesh.indices.reserve(6144);
    }
};

// Emits a vertex (x, height, z) for every point of extent.padded(-1), with the normal taken
// from central differences, and two triangles per grid square between those vertices.
// extent must lie within heights.extent(). The buffer is cleared first.
void triangulateHeightMap(const procgen::Array2<float>& heights,
                          const procgen::Extent2i& extent,
                          HeightMapMeshBuffer& buffer);

} // namespace meshing

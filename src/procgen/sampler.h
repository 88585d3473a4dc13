#pragma once

#include "procgen/array.h"
#include "procgen/chunk_map.h"
#include "procgen/extent.h"

namespace procgen
{

// Writes source(p) into destination for every p in extent. The source is only read.
template <glm::length_t N, typename Source, typename Destination>
void copyExtent(const Extent<N>& extent, const Source& source, Destination& destination)
{
    extent.forEachPoint([&](const LatticePoint<N>& p) {
        destination.set(p, source(p));
    });
}

template <glm::length_t N, typename Field>
void sampleField(const Field& field, const Extent<N>& extent, ChunkMap<N, float>& map)
{
    copyExtent(extent, field, map);
}

// Materializes a padded chunk from the store. Cells the store never covered come back as its
// ambient value.
template <glm::length_t N>
[[nodiscard]] Array<N, float> samplePaddedChunk(const ChunkMapReader<N, float>& reader,
                                                const Extent<N>& paddedExtent)
{
    Array<N, float> padded(paddedExtent, 0.0f);
    copyExtent(paddedExtent, reader, padded);
    return padded;
}

} // namespace procgen

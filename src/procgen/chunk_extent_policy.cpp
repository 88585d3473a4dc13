#include "procgen/chunk_extent_policy.h"

namespace procgen
{

Extent3i volumetricChunkExtent(const Extent3i& chunkExtent) noexcept
{
    return chunkExtent.padded(1);
}

Extent2i heightFieldChunkExtent(const Extent2i& chunkExtent, const Extent2i& domain) noexcept
{
    return chunkExtent.padded(1).addToShape(glm::ivec2(1)).intersection(domain);
}

} // namespace procgen

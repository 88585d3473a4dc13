#pragma once

#include "procgen/extent.h"

namespace procgen
{

// One cell of border on every face so crossings on the chunk's faces can be detected.
[[nodiscard]] Extent3i volumetricChunkExtent(const Extent3i& chunkExtent) noexcept;

// One cell of border, one more row/column at the max corner, clipped to the domain.
// Clipping may leave the result asymmetric near the domain boundary.
[[nodiscard]] Extent2i heightFieldChunkExtent(const Extent2i& chunkExtent, const Extent2i& domain) noexcept;

} // namespace procgen

#include "procgen/height_maps.h"

#include <cmath>

namespace procgen
{

float WaveHeightMap::operator()(const glm::ivec2& p) const noexcept
{
    const float x = static_cast<float>(p.x);
    const float z = static_cast<float>(p.y);
    return kAmplitude * (1.0f + std::cos(kFrequency * x) + std::sin(kFrequency * z));
}

} // namespace procgen

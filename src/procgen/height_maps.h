#pragma once

#include <glm/vec2.hpp>

namespace procgen
{

struct WaveHeightMap
{
    static constexpr float kAmplitude = 10.0f;
    static constexpr float kFrequency = 0.1f;

    [[nodiscard]] float operator()(const glm::ivec2& p) const noexcept;
};

} // namespace procgen

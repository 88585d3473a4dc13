#pragma once
// signed_distance_fields.h
// Closed-form volumetric fields: negative inside, zero on the boundary, positive outside.

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace procgen
{

struct SphereSdf
{
    glm::vec3 center{0.0f};
    float radius{0.0f};

    [[nodiscard]] float operator()(const glm::ivec3& p) const noexcept;
};

// Zero-set is the pair of planes where (p . normal)^2 == thickness. Not a true distance.
struct PlaneSdf
{
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
    float thickness{0.0f};

    [[nodiscard]] float operator()(const glm::ivec3& p) const noexcept;
};

// Chebyshev distance to the center minus the half extent.
struct CubeSdf
{
    glm::vec3 center{0.0f};
    float halfExtent{0.0f};

    [[nodiscard]] float operator()(const glm::ivec3& p) const noexcept;
};

// Ring in the XZ plane around the origin.
struct TorusSdf
{
    float majorRadius{0.0f};
    float minorRadius{0.0f};

    [[nodiscard]] float operator()(const glm::ivec3& p) const noexcept;
};

} // namespace procgen

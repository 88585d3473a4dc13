#include "procgen/signed_distance_fields.h"

#include <algorithm>
#include <cmath>

#include <glm/geometric.hpp>

namespace procgen
{

float SphereSdf::operator()(const glm::ivec3& p) const noexcept
{
    return glm::distance(glm::vec3(p), center) - radius;
}

float PlaneSdf::operator()(const glm::ivec3& p) const noexcept
{
    const float d = glm::dot(glm::vec3(p), normal);
    return d * d - thickness;
}

float CubeSdf::operator()(const glm::ivec3& p) const noexcept
{
    const glm::vec3 diff = glm::vec3(p) - center;
    const float maxDim = std::max({std::abs(diff.x), std::abs(diff.y), std::abs(diff.z)});
    return maxDim - halfExtent;
}

float TorusSdf::operator()(const glm::ivec3& p) const noexcept
{
    const glm::vec3 pf(p);
    const glm::vec2 q(glm::length(glm::vec2(pf.x, pf.z)) - majorRadius, pf.y);
    return glm::length(q) - minorRadius;
}

} // namespace procgen

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/vec3.hpp>

namespace meshing
{

struct PosNormMesh
{
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> normals;
    std::vector<std::uint32_t> indices;

    // Keeps capacity so a reused buffer does not reallocate between chunks.
    void clear() noexcept
    {
        positions.clear();
        normals.clear();
        indices.clear();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return indices.empty();
    }

    [[nodiscard]] std::size_t triangleCount() const noexcept
    {
        return indices.size() / 3;
    }
};

} // namespace meshing

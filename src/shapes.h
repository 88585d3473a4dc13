#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include <glm/vec3.hpp>

#include "procgen/height_maps.h"
#include "procgen/signed_distance_fields.h"

enum class Sdf : std::uint8_t
{
    Cube = 0,
    Plane,
    Sphere,
    Torus
};

enum class HeightMap : std::uint8_t
{
    Wave = 0
};

using Shape = std::variant<Sdf, HeightMap>;

inline constexpr int kShapeCount = 5;

struct ShapeParameters
{
    procgen::CubeSdf cube{glm::vec3{0.0f}, 35.0f};
    procgen::PlaneSdf plane{glm::vec3{0.5f}, 1.0f};
    procgen::SphereSdf sphere{glm::vec3{0.0f}, 35.0f};
    procgen::TorusSdf torus{35.0f, 10.0f};
};

using SdfField = std::variant<procgen::CubeSdf, procgen::PlaneSdf, procgen::SphereSdf, procgen::TorusSdf>;
using HeightMapField = std::variant<procgen::WaveHeightMap>;

// Index order: cube, plane, sphere, torus, wave. Throws std::out_of_range for any other index.
[[nodiscard]] Shape chooseShape(int index);
[[nodiscard]] int shapeIndex(const Shape& shape) noexcept;
[[nodiscard]] int wrapShapeIndex(int index) noexcept;

[[nodiscard]] const char* shapeName(const Shape& shape) noexcept;
[[nodiscard]] std::optional<int> shapeIndexFromName(std::string_view name) noexcept;

[[nodiscard]] SdfField makeSdf(Sdf sdf, const ShapeParameters& parameters);
[[nodiscard]] HeightMapField makeHeightMap(HeightMap heightMap);

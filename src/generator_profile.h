#pragma once

#include <filesystem>
#include <limits>
#include <string_view>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "procgen/extent.h"
#include "shapes.h"

struct VolumeSamplingSettings
{
    procgen::Extent3i domain{glm::ivec3(-50), glm::ivec3(100)};
    glm::ivec3 chunkShape{16};
    // Outside every solid.
    float ambientValue{std::numeric_limits<float>::max()};
};

struct HeightMapSamplingSettings
{
    procgen::Extent2i domain{glm::ivec2(-50), glm::ivec2(100)};
    glm::ivec2 chunkShape{16};
    float ambientValue{0.0f};
};

struct GeneratorProfile
{
    int initialShapeIndex{0};
    VolumeSamplingSettings sdf{};
    HeightMapSamplingSettings heightMap{};
    ShapeParameters shapes{};

    // A missing file yields the defaults. Malformed or out-of-range values throw std::runtime_error.
    static GeneratorProfile load(const std::filesystem::path& path);
    static GeneratorProfile parse(std::string_view document, const std::filesystem::path& sourcePath);
};

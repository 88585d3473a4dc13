#include "shapes.h"

#include <array>
#include <cstddef>
#include <sstream>
#include <stdexcept>

namespace
{
constexpr std::array<const char*, kShapeCount> kShapeNames{"cube", "plane", "sphere", "torus", "wave"};
}

Shape chooseShape(int index)
{
    switch (index)
    {
        case 0:
            return Sdf::Cube;
        case 1:
            return Sdf::Plane;
        case 2:
            return Sdf::Sphere;
        case 3:
            return Sdf::Torus;
        case 4:
            return HeightMap::Wave;
        default:
            break;
    }

    std::ostringstream oss;
    oss << "Bad shape index " << index << " (expected 0.." << (kShapeCount - 1) << ")";
    throw std::out_of_range(oss.str());
}

int shapeIndex(const Shape& shape) noexcept
{
    if (const Sdf* sdf = std::get_if<Sdf>(&shape))
    {
        return static_cast<int>(*sdf);
    }
    return 4 + static_cast<int>(std::get<HeightMap>(shape));
}

int wrapShapeIndex(int index) noexcept
{
    int result = index % kShapeCount;
    if (result < 0)
    {
        result += kShapeCount;
    }
    return result;
}

const char* shapeName(const Shape& shape) noexcept
{
    return kShapeNames[static_cast<std::size_t>(shapeIndex(shape))];
}

std::optional<int> shapeIndexFromName(std::string_view name) noexcept
{
    for (std::size_t i = 0; i < kShapeNames.size(); ++i)
    {
        if (name == kShapeNames[i])
        {
            return static_cast<int>(i);
        }
    }
    return std::nullopt;
}

SdfField makeSdf(Sdf sdf, const ShapeParameters& parameters)
{
    switch (sdf)
    {
        case Sdf::Cube:
            return parameters.cube;
        case Sdf::Plane:
            return parameters.plane;
        case Sdf::Sphere:
            return parameters.sphere;
        case Sdf::Torus:
            return parameters.torus;
    }
    throw std::invalid_argument("Unknown Sdf kind");
}

HeightMapField makeHeightMap(HeightMap heightMap)
{
    switch (heightMap)
    {
        case HeightMap::Wave:
            return procgen::WaveHeightMap{};
    }
    throw std::invalid_argument("Unknown HeightMap kind");
}

#include "generator_profile.h"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <toml++/toml.h>

namespace
{
[[noreturn]] void throwInvalid(std::string_view key, const std::filesystem::path& filePath, std::string_view what)
{
    std::ostringstream oss;
    oss << "Value for '" << key << "' in " << filePath << ' ' << what;
    throw std::runtime_error(oss.str());
}

// Rejects NaN, infinities and doubles outside the float range.
float toFiniteFloat(double value, std::string_view key, const std::filesystem::path& filePath)
{
    if (!std::isfinite(value) || std::abs(value) > static_cast<double>(std::numeric_limits<float>::max()))
    {
        throwInvalid(key, filePath, "must be finite");
    }
    return static_cast<float>(value);
}

int toLatticeCoordinate(std::int64_t value, std::string_view key, const std::filesystem::path& filePath)
{
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
    {
        throwInvalid(key, filePath, "is out of range");
    }
    return static_cast<int>(value);
}

float readFloat(const toml::table& table, std::string_view key, float fallback, const std::filesystem::path& filePath)
{
    if (auto value = table[key].value<double>())
    {
        return toFiniteFloat(*value, key, filePath);
    }
    if (auto valueInt = table[key].value<std::int64_t>())
    {
        return static_cast<float>(*valueInt);
    }
    if (table.contains(key))
    {
        throwInvalid(key, filePath, "must be a number");
    }
    return fallback;
}

// Accepts either a scalar applied to every axis or an array with one entry per axis.
template <glm::length_t N, typename T>
glm::vec<N, T, glm::defaultp> readVector(const toml::table& table,
                                         std::string_view key,
                                         const glm::vec<N, T, glm::defaultp>& fallback,
                                         const std::filesystem::path& filePath)
{
    using Vector = glm::vec<N, T, glm::defaultp>;
    using Storage = std::conditional_t<std::is_integral_v<T>, std::int64_t, double>;

    const auto convert = [&](Storage value) -> T {
        if constexpr (std::is_integral_v<T>)
        {
            return toLatticeCoordinate(value, key, filePath);
        }
        else
        {
            return toFiniteFloat(value, key, filePath);
        }
    };

    if (!table.contains(key))
    {
        return fallback;
    }

    if (auto scalar = table[key].value<Storage>())
    {
        return Vector(convert(*scalar));
    }

    const toml::array* values = table[key].as_array();
    if (!values || values->size() != static_cast<std::size_t>(N))
    {
        std::ostringstream what;
        what << "must be a number or an array of " << N << " numbers";
        throwInvalid(key, filePath, what.str());
    }

    Vector result = fallback;
    for (glm::length_t i = 0; i < N; ++i)
    {
        auto component = (*values)[static_cast<std::size_t>(i)].value<Storage>();
        if (!component)
        {
            throwInvalid(key, filePath, "contains a non-numeric entry");
        }
        result[i] = convert(*component);
    }
    return result;
}

float readAmbient(const toml::table& table, float fallback, const std::filesystem::path& filePath)
{
    if (auto text = table["ambient"].value<std::string>())
    {
        if (*text == "max")
        {
            return std::numeric_limits<float>::max();
        }
        if (*text == "min")
        {
            return std::numeric_limits<float>::lowest();
        }
        throwInvalid("ambient", filePath, "must be a number, \"max\" or \"min\"");
    }
    return readFloat(table, "ambient", fallback, filePath);
}

template <glm::length_t N>
void applySamplingSettings(const toml::table& samplingTable,
                           procgen::Extent<N>& domain,
                           glm::vec<N, int, glm::defaultp>& chunkShape,
                           float& ambientValue,
                           const std::filesystem::path& filePath)
{
    using Point = glm::vec<N, int, glm::defaultp>;

    const Point domainMin = readVector<N, int>(samplingTable, "domain_min", domain.minimum, filePath);
    const Point domainSize = readVector<N, int>(samplingTable, "domain_size", domain.shape, filePath);
    const Point chunkSize = readVector<N, int>(samplingTable, "chunk_size", chunkShape, filePath);

    for (glm::length_t i = 0; i < N; ++i)
    {
        if (domainSize[i] <= 0)
        {
            throwInvalid("domain_size", filePath, "must be positive");
        }
        if (chunkSize[i] <= 0)
        {
            throwInvalid("chunk_size", filePath, "must be positive");
        }

        // Chunk keys and padded chunk extents reach one chunk (plus padding) past the domain.
        const std::int64_t margin = static_cast<std::int64_t>(chunkSize[i]) + 2;
        const std::int64_t lowest = static_cast<std::int64_t>(domainMin[i]) - margin;
        const std::int64_t highest = static_cast<std::int64_t>(domainMin[i]) + domainSize[i] + margin;
        if (lowest < std::numeric_limits<int>::min() || highest > std::numeric_limits<int>::max())
        {
            throwInvalid("domain_min", filePath, "puts the domain outside the lattice range");
        }
    }

    domain = procgen::Extent<N>::fromMinAndShape(domainMin, domainSize);
    chunkShape = chunkSize;
    ambientValue = readAmbient(samplingTable, ambientValue, filePath);
}

void applyShapeParameters(const toml::table& shapesTable, ShapeParameters& shapes, const std::filesystem::path& filePath)
{
    if (const toml::table* cube = shapesTable["cube"].as_table())
    {
        shapes.cube.center = readVector<3, float>(*cube, "center", shapes.cube.center, filePath);
        shapes.cube.halfExtent = readFloat(*cube, "radius", shapes.cube.halfExtent, filePath);
    }

    if (const toml::table* plane = shapesTable["plane"].as_table())
    {
        shapes.plane.normal = readVector<3, float>(*plane, "normal", shapes.plane.normal, filePath);
        shapes.plane.thickness = readFloat(*plane, "thickness", shapes.plane.thickness, filePath);
    }

    if (const toml::table* sphere = shapesTable["sphere"].as_table())
    {
        shapes.sphere.center = readVector<3, float>(*sphere, "center", shapes.sphere.center, filePath);
        shapes.sphere.radius = readFloat(*sphere, "radius", shapes.sphere.radius, filePath);
    }

    if (const toml::table* torus = shapesTable["torus"].as_table())
    {
        shapes.torus.majorRadius = readFloat(*torus, "major", shapes.torus.majorRadius, filePath);
        shapes.torus.minorRadius = readFloat(*torus, "minor", shapes.torus.minorRadius, filePath);
    }
}

GeneratorProfile profileFromTable(const toml::table& table, const std::filesystem::path& path)
{
    GeneratorProfile profile{};

    if (auto shapeName = table["initial_shape"].value<std::string>())
    {
        const std::optional<int> index = shapeIndexFromName(*shapeName);
        if (!index)
        {
            std::ostringstream oss;
            oss << "Unknown initial_shape '" << *shapeName << "' in " << path;
            throw std::runtime_error(oss.str());
        }
        profile.initialShapeIndex = *index;
    }

    if (const toml::table* sdfTable = table["sdf"].as_table())
    {
        applySamplingSettings<3>(*sdfTable, profile.sdf.domain, profile.sdf.chunkShape, profile.sdf.ambientValue, path);
    }

    if (const toml::table* heightMapTable = table["height_map"].as_table())
    {
        applySamplingSettings<2>(*heightMapTable,
                                 profile.heightMap.domain,
                                 profile.heightMap.chunkShape,
                                 profile.heightMap.ambientValue,
                                 path);
    }

    if (const toml::table* shapesTable = table["shapes"].as_table())
    {
        applyShapeParameters(*shapesTable, profile.shapes, path);
    }

    return profile;
}

} // namespace

GeneratorProfile GeneratorProfile::load(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path))
    {
        return GeneratorProfile{};
    }

    toml::table table = toml::parse_file(path.string());
    return profileFromTable(table, path);
}

GeneratorProfile GeneratorProfile::parse(std::string_view document, const std::filesystem::path& sourcePath)
{
    toml::table table = toml::parse(document, sourcePath.string());
    return profileFromTable(table, sourcePath);
}

// generator_profile_test.cpp
// TOML profile parsing: overrides, defaults and rejected values.

#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string_view>

#include "generator_profile.h"

static int fail(const char* msg)
{
    std::fprintf(stderr, "FAIL: %s\n", msg ? msg : "(null)");
    return 1;
}

static bool parseThrows(std::string_view document)
{
    try
    {
        (void)GeneratorProfile::parse(document, "inline.toml");
    }
    catch (const std::runtime_error&)
    {
        return true;
    }
    return false;
}

static int testDefaults()
{
    const GeneratorProfile profile = GeneratorProfile::parse("", "empty.toml");
    if (profile.initialShapeIndex != 0)
    {
        return fail("default initial shape is the cube");
    }
    if (profile.sdf.domain.minimum != glm::ivec3(-50) || profile.sdf.domain.shape != glm::ivec3(100))
    {
        return fail("default volume domain");
    }
    if (profile.sdf.chunkShape != glm::ivec3(16) || profile.heightMap.chunkShape != glm::ivec2(16))
    {
        return fail("default chunk shape");
    }
    if (profile.sdf.ambientValue != std::numeric_limits<float>::max() || profile.heightMap.ambientValue != 0.0f)
    {
        return fail("default ambient values");
    }
    if (profile.shapes.sphere.radius != 35.0f || profile.shapes.cube.halfExtent != 35.0f ||
        profile.shapes.plane.normal != glm::vec3(0.5f) || profile.shapes.torus.minorRadius != 10.0f)
    {
        return fail("default shape parameters");
    }
    return 0;
}

static int testOverrides()
{
    const GeneratorProfile profile = GeneratorProfile::parse(R"(
initial_shape = "torus"

[sdf]
domain_min = [-20, -10, -20]
domain_size = 40
chunk_size = [8, 16, 8]
ambient = "min"

[height_map]
domain_min = 0
domain_size = [64, 32]
ambient = 4.5

[shapes.sphere]
center = [1, 2.5, 3]
radius = 12

[shapes.torus]
major = 20.0
minor = 4.0
)",
                                                             "override.toml");

    if (profile.initialShapeIndex != 3)
    {
        return fail("initial_shape selects by name");
    }
    if (profile.sdf.domain.minimum != glm::ivec3(-20, -10, -20) || profile.sdf.domain.shape != glm::ivec3(40))
    {
        return fail("sdf domain from array and scalar");
    }
    if (profile.sdf.chunkShape != glm::ivec3(8, 16, 8))
    {
        return fail("sdf chunk size from array");
    }
    if (profile.sdf.ambientValue != std::numeric_limits<float>::lowest())
    {
        return fail("ambient \"min\"");
    }
    if (profile.heightMap.domain.minimum != glm::ivec2(0) || profile.heightMap.domain.shape != glm::ivec2(64, 32))
    {
        return fail("height map domain");
    }
    if (profile.heightMap.chunkShape != glm::ivec2(16))
    {
        return fail("unspecified chunk size keeps its default");
    }
    if (profile.heightMap.ambientValue != 4.5f)
    {
        return fail("numeric ambient");
    }
    if (profile.shapes.sphere.center != glm::vec3(1.0f, 2.5f, 3.0f) || profile.shapes.sphere.radius != 12.0f)
    {
        return fail("sphere parameters");
    }
    if (profile.shapes.torus.majorRadius != 20.0f || profile.shapes.torus.minorRadius != 4.0f)
    {
        return fail("torus parameters");
    }
    if (profile.shapes.cube.halfExtent != 35.0f)
    {
        return fail("untouched shapes keep their defaults");
    }
    return 0;
}

static int testRejectedValues()
{
    if (!parseThrows("initial_shape = \"dodecahedron\"\n"))
    {
        return fail("unknown initial shape");
    }
    if (!parseThrows("[sdf]\nchunk_size = 0\n"))
    {
        return fail("zero chunk size");
    }
    if (!parseThrows("[height_map]\ndomain_size = [10, -1]\n"))
    {
        return fail("negative domain size");
    }
    if (!parseThrows("[sdf]\ndomain_min = [1, 2]\n"))
    {
        return fail("wrong number of components");
    }
    if (!parseThrows("[sdf]\nambient = \"huge\"\n"))
    {
        return fail("unknown ambient keyword");
    }
    if (!parseThrows("[shapes.sphere]\nradius = \"big\"\n"))
    {
        return fail("non-numeric radius");
    }
    if (!parseThrows("[sdf\nchunk_size = 4\n"))
    {
        return fail("malformed document");
    }
    return 0;
}

static int testNonFiniteAndOutOfRangeValues()
{
    if (!parseThrows("[shapes.sphere]\ncenter = [nan, 0, 0]\n"))
    {
        return fail("NaN vector component");
    }
    if (!parseThrows("[shapes.plane]\nnormal = inf\n"))
    {
        return fail("infinite scalar broadcast to a vector");
    }
    if (!parseThrows("[shapes.sphere]\nradius = nan\n"))
    {
        return fail("NaN radius");
    }
    if (!parseThrows("[shapes.torus]\nminor = -inf\n"))
    {
        return fail("infinite radius");
    }
    if (!parseThrows("[shapes.cube]\nradius = 1e300\n"))
    {
        return fail("radius beyond float range");
    }
    if (!parseThrows("[height_map]\nambient = nan\n"))
    {
        return fail("NaN ambient");
    }
    if (!parseThrows("[sdf]\ndomain_size = 4294967396\n"))
    {
        return fail("domain size beyond int range");
    }
    if (!parseThrows("[height_map]\ndomain_min = [0, -4294967296]\n"))
    {
        return fail("domain minimum beyond int range");
    }
    if (!parseThrows("[sdf]\ndomain_min = 2147483600\ndomain_size = 100\n"))
    {
        return fail("domain reaching past the lattice maximum");
    }
    if (!parseThrows("[sdf]\ndomain_min = -2147483640\n"))
    {
        return fail("domain reaching past the lattice minimum");
    }

    const GeneratorProfile edge = GeneratorProfile::parse("[sdf]\ndomain_min = 1000000\nchunk_size = 32\n", "edge.toml");
    if (edge.sdf.domain.minimum != glm::ivec3(1000000) || edge.sdf.chunkShape != glm::ivec3(32))
    {
        return fail("large but representable domain is accepted");
    }
    return 0;
}

static int testLoadFromDisk()
{
    const GeneratorProfile missing = GeneratorProfile::load("does/not/exist/shapemesher.toml");
    if (missing.initialShapeIndex != 0 || missing.sdf.chunkShape != glm::ivec3(16))
    {
        return fail("missing profile falls back to defaults");
    }

    const GeneratorProfile shipped = GeneratorProfile::load("assets/shapemesher.toml");
    if (shipped.sdf.domain != missing.sdf.domain || shipped.heightMap.domain != missing.heightMap.domain ||
        shipped.sdf.ambientValue != missing.sdf.ambientValue || shipped.shapes.torus.majorRadius != 35.0f)
    {
        return fail("shipped profile matches the built-in defaults");
    }
    return 0;
}

int main()
{
    if (int rc = testDefaults())
    {
        return rc;
    }
    if (int rc = testOverrides())
    {
        return rc;
    }
    if (int rc = testRejectedValues())
    {
        return rc;
    }
    if (int rc = testNonFiniteAndOutOfRangeValues())
    {
        return rc;
    }
    if (int rc = testLoadFromDisk())
    {
        return rc;
    }

    std::printf("generator_profile_test: OK\n");
    return 0;
}

// mesh_generator_test.cpp
// End-to-end regeneration against a recording sink: geometry, shape cycling and handle bookkeeping.

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <set>
#include <stdexcept>
#include <variant>

#include <glm/geometric.hpp>

#include "generator_profile.h"
#include "mesh_generator.h"
#include "shapes.h"

static int fail(const char* msg)
{
    std::fprintf(stderr, "FAIL: %s\n", msg ? msg : "(null)");
    return 1;
}

// Keeps track of live handles and flags any despawn of a handle it never issued.
class RecordingSink : public MeshSink
{
public:
    MeshHandle spawn(const meshing::PosNormMesh& mesh) override
    {
        if (mesh.indices.empty() || mesh.indices.size() % 3 != 0 || mesh.normals.size() != mesh.positions.size())
        {
            ++malformedMeshes;
        }
        for (const std::uint32_t index : mesh.indices)
        {
            if (index >= mesh.positions.size())
            {
                ++malformedMeshes;
                break;
            }
        }

        for (std::size_t i = 0; i + 2 < mesh.indices.size(); i += 3)
        {
            const glm::vec3& a = mesh.positions[mesh.indices[i]];
            const glm::vec3& b = mesh.positions[mesh.indices[i + 1]];
            const glm::vec3& c = mesh.positions[mesh.indices[i + 2]];
            signedVolume += static_cast<double>(glm::dot(a, glm::cross(b, c))) / 6.0;
        }
        if (onSpawn)
        {
            onSpawn(mesh);
        }

        const MeshHandle handle = nextHandle++;
        live.insert(handle);
        ++spawned;
        return handle;
    }

    void despawn(MeshHandle handle) override
    {
        if (live.erase(handle) == 0)
        {
            ++unknownDespawns;
        }
        ++despawned;
        if (onDespawn)
        {
            onDespawn(handle);
        }
    }

    std::function<void(const meshing::PosNormMesh&)> onSpawn;
    std::function<void(MeshHandle)> onDespawn;
    std::set<MeshHandle> live;
    MeshHandle nextHandle{100};
    int spawned{0};
    int despawned{0};
    int malformedMeshes{0};
    int unknownDespawns{0};
    double signedVolume{0.0};
};

static GeneratorProfile smallProfile(int initialShape)
{
    GeneratorProfile profile{};
    profile.initialShapeIndex = initialShape;
    profile.sdf.domain = procgen::Extent3i::fromMinAndShape(glm::ivec3(-20), glm::ivec3(40));
    profile.sdf.chunkShape = glm::ivec3(8);
    profile.heightMap.domain = procgen::Extent2i::fromMinAndShape(glm::ivec2(-20), glm::ivec2(40));
    profile.heightMap.chunkShape = glm::ivec2(8);
    profile.shapes.cube.halfExtent = 12.0f;
    profile.shapes.sphere.radius = 12.0f;
    profile.shapes.torus.majorRadius = 10.0f;
    profile.shapes.torus.minorRadius = 4.0f;
    return profile;
}

static int testSphereEndToEnd()
{
    MeshGenerator generator(GeneratorProfile{2, {}, {}, {}});
    RecordingSink sink;

    int offSurface = 0;
    sink.onSpawn = [&](const meshing::PosNormMesh& mesh) {
        for (const glm::vec3& p : mesh.positions)
        {
            if (std::abs(glm::length(p) - 35.0f) > 1.0f)
            {
                ++offSurface;
            }
        }
    };

    if (!generator.update(ShapeRequest::None, sink))
    {
        return fail("first update generates");
    }
    if (generator.currentShape() != Shape{Sdf::Sphere})
    {
        return fail("initial shape is the sphere");
    }
    if (sink.malformedMeshes != 0 || sink.spawned == 0)
    {
        return fail("sphere chunks produce valid meshes");
    }
    if (offSurface != 0)
    {
        return fail("sphere vertices sit at the radius");
    }

    const double expected = 4.0 / 3.0 * 3.14159265358979 * 35.0 * 35.0 * 35.0;
    if (std::abs(sink.signedVolume - expected) > 0.05 * expected)
    {
        return fail("chunk meshes close into an outward-facing sphere");
    }

    const auto& summary = generator.lastSummary();
    if (!summary || summary->meshesEmitted != sink.spawned ||
        static_cast<std::size_t>(summary->meshesEmitted) != generator.state().chunkMeshHandles.size())
    {
        return fail("summary and handle list agree with the sink");
    }
    if (summary->chunksVisited < summary->meshesEmitted)
    {
        return fail("never more meshes than chunks");
    }

    const int spawnedBefore = sink.spawned;
    if (generator.update(ShapeRequest::None, sink) || sink.spawned != spawnedBefore)
    {
        return fail("no request, no regeneration");
    }
    return 0;
}

static int testWaveHeights()
{
    MeshGenerator generator(GeneratorProfile{4, {}, {}, {}});
    RecordingSink sink;

    int outOfRange = 0;
    int outsideDomain = 0;
    sink.onSpawn = [&](const meshing::PosNormMesh& mesh) {
        for (const glm::vec3& p : mesh.positions)
        {
            if (p.y < -10.001f || p.y > 30.001f)
            {
                ++outOfRange;
            }
            if (p.x < -50.0f || p.x > 49.0f || p.z < -50.0f || p.z > 49.0f)
            {
                ++outsideDomain;
            }
        }
        for (const glm::vec3& n : mesh.normals)
        {
            if (n.y <= 0.0f)
            {
                ++outOfRange;
            }
        }
    };

    (void)generator.regenerate(sink);
    if (sink.spawned == 0 || sink.malformedMeshes != 0)
    {
        return fail("wave produces valid chunk meshes");
    }
    if (outOfRange != 0)
    {
        return fail("wave heights within [-10, 30] and normals up");
    }
    if (outsideDomain != 0)
    {
        return fail("ambient samples outside the domain never become vertices");
    }
    return 0;
}

static int testEmptyDomain()
{
    GeneratorProfile profile = smallProfile(2);
    profile.sdf.domain = procgen::Extent3i::fromMinAndShape(glm::ivec3(1000), glm::ivec3(32));
    MeshGenerator generator(profile);
    RecordingSink sink;

    const GenerationSummary summary = generator.regenerate(sink);
    if (summary.chunksVisited == 0)
    {
        return fail("far domain is still sampled");
    }
    if (summary.meshesEmitted != 0 || sink.spawned != 0 || !generator.state().chunkMeshHandles.empty())
    {
        return fail("chunks without a surface emit nothing");
    }
    return 0;
}

static int testCyclingKeepsHandlesBalanced()
{
    MeshGenerator generator(smallProfile(0));
    RecordingSink sink;

    if (!generator.update(ShapeRequest::None, sink))
    {
        return fail("initial generation");
    }

    const ShapeRequest sequence[] = {ShapeRequest::Next,     ShapeRequest::Next,     ShapeRequest::Next,
                                     ShapeRequest::Next,     ShapeRequest::Next,     ShapeRequest::Previous,
                                     ShapeRequest::Previous, ShapeRequest::Next,     ShapeRequest::Previous,
                                     ShapeRequest::Previous, ShapeRequest::Previous, ShapeRequest::Next};
    int expectedIndex = 0;
    for (const ShapeRequest request : sequence)
    {
        expectedIndex = wrapShapeIndex(expectedIndex + (request == ShapeRequest::Next ? 1 : -1));
        if (!generator.update(request, sink))
        {
            return fail("shape change regenerates");
        }
        if (generator.state().currentShapeIndex != expectedIndex)
        {
            return fail("shape index wraps in both directions");
        }
        if (sink.live.size() != generator.state().chunkMeshHandles.size())
        {
            return fail("live meshes are exactly the current handles");
        }
        for (const MeshHandle handle : generator.state().chunkMeshHandles)
        {
            if (sink.live.count(handle) == 0)
            {
                return fail("every tracked handle is live in the sink");
            }
        }
        if (sink.spawned - sink.despawned != static_cast<int>(sink.live.size()))
        {
            return fail("every replaced mesh was despawned");
        }
        if (generator.generationState() != GenerationState::Idle)
        {
            return fail("generator idles between requests");
        }
    }
    if (sink.unknownDespawns != 0 || sink.malformedMeshes != 0)
    {
        return fail("no stray despawns or malformed meshes");
    }

    generator.clear(sink);
    if (!sink.live.empty() || !generator.state().chunkMeshHandles.empty())
    {
        return fail("clear despawns everything");
    }
    if (!generator.update(ShapeRequest::None, sink) || sink.live.empty())
    {
        return fail("update after clear regenerates");
    }
    return 0;
}

static int testShapeIndexing()
{
    if (wrapShapeIndex(-1) != 4 || wrapShapeIndex(5) != 0 || wrapShapeIndex(2) != 2)
    {
        return fail("wrapShapeIndex");
    }
    if (chooseShape(1) != Shape{Sdf::Plane} || chooseShape(4) != Shape{HeightMap::Wave})
    {
        return fail("chooseShape order");
    }
    for (int index = 0; index < kShapeCount; ++index)
    {
        const Shape shape = chooseShape(index);
        if (shapeIndex(shape) != index || shapeIndexFromName(shapeName(shape)) != index)
        {
            return fail("index, shape and name agree");
        }
    }

    bool threw = false;
    try
    {
        (void)chooseShape(kShapeCount);
    }
    catch (const std::out_of_range&)
    {
        threw = true;
    }
    if (!threw)
    {
        return fail("chooseShape rejects an out-of-range index");
    }

    threw = false;
    try
    {
        MeshGenerator generator(smallProfile(-1));
        (void)generator;
    }
    catch (const std::out_of_range&)
    {
        threw = true;
    }
    if (!threw)
    {
        return fail("generator rejects an out-of-range initial shape");
    }
    return 0;
}

static int testRequestsDuringRegenerationAreRejected()
{
    MeshGenerator generator(smallProfile(2));
    RecordingSink sink;

    int nestedUpdatesAccepted = 0;
    int nestedRegeneratesRejected = 0;
    sink.onSpawn = [&](const meshing::PosNormMesh&) {
        if (generator.generationState() != GenerationState::Regenerating)
        {
            return;
        }
        if (generator.update(ShapeRequest::Next, sink))
        {
            ++nestedUpdatesAccepted;
        }
        try
        {
            (void)generator.regenerate(sink);
        }
        catch (const std::logic_error&)
        {
            ++nestedRegeneratesRejected;
        }
    };

    (void)generator.regenerate(sink);
    if (nestedUpdatesAccepted != 0)
    {
        return fail("update during regeneration is rejected");
    }
    if (nestedRegeneratesRejected != sink.spawned || sink.spawned == 0)
    {
        return fail("regenerate during regeneration throws");
    }
    if (generator.currentShape() != Shape{Sdf::Sphere})
    {
        return fail("rejected request leaves the shape unchanged");
    }
    return 0;
}

static int testSinkFailureLeavesHandlesConsistent()
{
    MeshGenerator generator(smallProfile(0));
    RecordingSink sink;

    int spawnsUntilFailure = 2;
    sink.onSpawn = [&](const meshing::PosNormMesh&) {
        if (spawnsUntilFailure-- == 0)
        {
            throw std::runtime_error("sink out of space");
        }
    };

    bool threw = false;
    try
    {
        (void)generator.regenerate(sink);
    }
    catch (const std::runtime_error&)
    {
        threw = true;
    }
    if (!threw)
    {
        return fail("sink failure propagates");
    }
    if (generator.generationState() != GenerationState::Idle)
    {
        return fail("failed regeneration returns to idle");
    }
    if (generator.state().chunkMeshHandles.size() != sink.live.size())
    {
        return fail("meshes spawned before the failure stay tracked");
    }

    sink.onSpawn = nullptr;
    (void)generator.regenerate(sink);
    if (sink.unknownDespawns != 0 || sink.live.size() != generator.state().chunkMeshHandles.size())
    {
        return fail("retry despawns the partial result");
    }
    return 0;
}

static int testClearFromInsideDespawn()
{
    MeshGenerator generator(smallProfile(2));
    RecordingSink sink;
    (void)generator.regenerate(sink);
    const std::size_t firstGeneration = sink.live.size();
    if (firstGeneration == 0)
    {
        return fail("sphere produces meshes");
    }

    int nestedClearsRejected = 0;
    int nestedClearsAccepted = 0;
    sink.onDespawn = [&](MeshHandle) {
        try
        {
            generator.clear(sink);
            ++nestedClearsAccepted;
        }
        catch (const std::logic_error&)
        {
            ++nestedClearsRejected;
        }
    };

    (void)generator.regenerate(sink);
    if (nestedClearsRejected != static_cast<int>(firstGeneration) || nestedClearsAccepted != 0)
    {
        return fail("clear during regeneration throws");
    }
    if (sink.unknownDespawns != 0 || sink.live.size() != generator.state().chunkMeshHandles.size())
    {
        return fail("rejected clear leaves the new meshes tracked");
    }

    // Outside regeneration a nested clear is allowed but finds nothing left to despawn.
    const int despawnedBefore = sink.despawned;
    const std::size_t liveBefore = sink.live.size();
    generator.clear(sink);
    if (sink.despawned - despawnedBefore != static_cast<int>(liveBefore))
    {
        return fail("each handle is despawned exactly once");
    }
    if (!sink.live.empty() || sink.unknownDespawns != 0 || !generator.state().chunkMeshHandles.empty())
    {
        return fail("nested clear leaves no stray handles");
    }
    if (nestedClearsAccepted != static_cast<int>(liveBefore))
    {
        return fail("nested clear runs outside regeneration");
    }
    return 0;
}

int main()
{
    if (int rc = testSphereEndToEnd())
    {
        return rc;
    }
    if (int rc = testWaveHeights())
    {
        return rc;
    }
    if (int rc = testEmptyDomain())
    {
        return rc;
    }
    if (int rc = testCyclingKeepsHandlesBalanced())
    {
        return rc;
    }
    if (int rc = testShapeIndexing())
    {
        return rc;
    }
    if (int rc = testRequestsDuringRegenerationAreRejected())
    {
        return rc;
    }
    if (int rc = testSinkFailureLeavesHandlesConsistent())
    {
        return rc;
    }

    if (int rc = testClearFromInsideDespawn())
    {
        return rc;
    }

    std::printf("mesh_generator_test: OK\n");
    return 0;
}

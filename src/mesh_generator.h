#pragma once
// mesh_generator.h
// Samples the selected shape into chunks, extracts one mesh per non-empty chunk and hands the
// meshes to a MeshSink. Regeneration replaces exactly the previously emitted meshes.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "generator_profile.h"
#include "meshing/height_map_mesher.h"
#include "meshing/pos_norm_mesh.h"
#include "meshing/surface_nets.h"
#include "shapes.h"

using MeshHandle = std::uint32_t;

// Receives finished chunk meshes. The mesh reference is only valid for the duration of spawn.
class MeshSink
{
public:
    virtual ~MeshSink() = default;

    virtual MeshHandle spawn(const meshing::PosNormMesh& mesh) = 0;
    virtual void despawn(MeshHandle handle) = 0;
};

enum class ShapeRequest : std::uint8_t
{
    None = 0,
    Previous,
    Next
};

enum class GenerationState : std::uint8_t
{
    Idle = 0,
    Regenerating
};

struct MeshGeneratorState
{
    int currentShapeIndex{0};
    std::vector<MeshHandle> chunkMeshHandles;

    // Reused across chunks and regenerations.
    meshing::SurfaceNetsBuffer surfaceNetsBuffer;
    meshing::HeightMapMeshBuffer heightMapMeshBuffer;
};

struct GenerationSummary
{
    Shape shape{Sdf::Cube};
    int chunksVisited{0};
    int meshesEmitted{0};
    std::size_t vertexCount{0};
    std::size_t triangleCount{0};
    double elapsedMs{0.0};
};

class MeshGenerator
{
public:
    explicit MeshGenerator(GeneratorProfile profile);

    MeshGenerator(const MeshGenerator&) = delete;
    MeshGenerator& operator=(const MeshGenerator&) = delete;

    // Applies the request and regenerates when the shape changed or nothing was generated yet.
    // Returns true if a regeneration ran. A request made while regenerating is rejected.
    bool update(ShapeRequest request, MeshSink& sink);

    // Despawns the current meshes and builds the current shape again.
    GenerationSummary regenerate(MeshSink& sink);

    // Despawns every live mesh. The next update regenerates. Throws std::logic_error while regenerating.
    void clear(MeshSink& sink);

    [[nodiscard]] Shape currentShape() const;
    [[nodiscard]] const MeshGeneratorState& state() const noexcept { return state_; }
    [[nodiscard]] GenerationState generationState() const noexcept { return generationState_; }
    [[nodiscard]] const GeneratorProfile& profile() const noexcept { return profile_; }
    [[nodiscard]] const std::optional<GenerationSummary>& lastSummary() const noexcept { return lastSummary_; }

private:
    void despawnAll(MeshSink& sink);
    void generateChunkMeshesFromSdf(Sdf sdf, MeshSink& sink, GenerationSummary& summary);
    void generateChunkMeshesFromHeightMap(HeightMap heightMap, MeshSink& sink, GenerationSummary& summary);
    void emitChunkMesh(const meshing::PosNormMesh& mesh, MeshSink& sink, GenerationSummary& summary);

    GeneratorProfile profile_;
    MeshGeneratorState state_;
    GenerationState generationState_{GenerationState::Idle};
    bool generated_{false};
    std::optional<GenerationSummary> lastSummary_;
};

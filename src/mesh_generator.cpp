#include "mesh_generator.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <variant>

#include "procgen/array.h"
#include "procgen/chunk_extent_policy.h"
#include "procgen/chunk_map.h"
#include "procgen/sampler.h"

MeshGenerator::MeshGenerator(GeneratorProfile profile)
    : profile_(std::move(profile))
{
    state_.currentShapeIndex = shapeIndex(chooseShape(profile_.initialShapeIndex));
}

bool MeshGenerator::update(ShapeRequest request, MeshSink& sink)
{
    if (generationState_ == GenerationState::Regenerating)
    {
        std::cerr << "[MeshGenerator] Shape request rejected: regeneration in progress" << std::endl;
        return false;
    }

    bool newShapeRequested = false;
    switch (request)
    {
        case ShapeRequest::Previous:
            state_.currentShapeIndex = wrapShapeIndex(state_.currentShapeIndex - 1);
            newShapeRequested = true;
            break;
        case ShapeRequest::Next:
            state_.currentShapeIndex = wrapShapeIndex(state_.currentShapeIndex + 1);
            newShapeRequested = true;
            break;
        case ShapeRequest::None:
            break;
    }

    if (!newShapeRequested && generated_)
    {
        return false;
    }

    regenerate(sink);
    return true;
}

GenerationSummary MeshGenerator::regenerate(MeshSink& sink)
{
    if (generationState_ == GenerationState::Regenerating)
    {
        throw std::logic_error("MeshGenerator::regenerate called during regeneration");
    }

    const auto start = std::chrono::steady_clock::now();

    GenerationSummary summary{};
    summary.shape = currentShape();

    generationState_ = GenerationState::Regenerating;
    try
    {
        despawnAll(sink);

        if (const Sdf* sdf = std::get_if<Sdf>(&summary.shape))
        {
            generateChunkMeshesFromSdf(*sdf, sink, summary);
        }
        else
        {
            generateChunkMeshesFromHeightMap(std::get<HeightMap>(summary.shape), sink, summary);
        }
    }
    catch (...)
    {
        generationState_ = GenerationState::Idle;
        throw;
    }
    generationState_ = GenerationState::Idle;
    generated_ = true;

    const auto end = std::chrono::steady_clock::now();
    summary.elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();

    std::cout << "[MeshGenerator] Generated " << shapeName(summary.shape) << ": " << summary.chunksVisited
              << " chunks, " << summary.meshesEmitted << " meshes, " << summary.vertexCount << " vertices, "
              << summary.triangleCount << " triangles in " << std::fixed << std::setprecision(1)
              << summary.elapsedMs << " ms" << std::defaultfloat << std::endl;

    lastSummary_ = summary;
    return summary;
}

void MeshGenerator::clear(MeshSink& sink)
{
    if (generationState_ == GenerationState::Regenerating)
    {
        throw std::logic_error("MeshGenerator::clear called during regeneration");
    }

    despawnAll(sink);
    generated_ = false;
}

Shape MeshGenerator::currentShape() const
{
    return chooseShape(state_.currentShapeIndex);
}

void MeshGenerator::despawnAll(MeshSink& sink)
{
    // Detached before the loop; a sink calling clear() from despawn finds nothing left to release.
    std::vector<MeshHandle> handles;
    handles.swap(state_.chunkMeshHandles);
    for (const MeshHandle handle : handles)
    {
        sink.despawn(handle);
    }
}

void MeshGenerator::generateChunkMeshesFromSdf(Sdf sdf, MeshSink& sink, GenerationSummary& summary)
{
    const VolumeSamplingSettings& settings = profile_.sdf;

    procgen::ChunkMap3<float> map(settings.chunkShape, settings.ambientValue);
    std::visit([&](const auto& field) { procgen::sampleField(field, settings.domain, map); },
               makeSdf(sdf, profile_.shapes));

    const procgen::ChunkMapReader3<float> reader(map);
    meshing::SurfaceNetsBuffer& buffer = state_.surfaceNetsBuffer;
    for (const glm::ivec3& chunkKey : map.chunkKeys())
    {
        ++summary.chunksVisited;

        const procgen::Extent3i paddedChunkExtent = procgen::volumetricChunkExtent(map.extentForChunkAtKey(chunkKey));
        const procgen::Array3<float> paddedChunk = procgen::samplePaddedChunk(reader, paddedChunkExtent);
        meshing::surfaceNets(paddedChunk, paddedChunkExtent, buffer);

        if (buffer.mesh.indices.empty())
        {
            continue;
        }

        emitChunkMesh(buffer.mesh, sink, summary);
    }
}

void MeshGenerator::generateChunkMeshesFromHeightMap(HeightMap heightMap, MeshSink& sink, GenerationSummary& summary)
{
    const HeightMapSamplingSettings& settings = profile_.heightMap;

    procgen::ChunkMap2<float> map(settings.chunkShape, settings.ambientValue);
    std::visit([&](const auto& field) { procgen::sampleField(field, settings.domain, map); },
               makeHeightMap(heightMap));

    const procgen::ChunkMapReader2<float> reader(map);
    meshing::HeightMapMeshBuffer& buffer = state_.heightMapMeshBuffer;
    for (const glm::ivec2& chunkKey : map.chunkKeys())
    {
        ++summary.chunksVisited;

        // Samples outside the domain are ambient and must not end up in the mesh.
        const procgen::Extent2i paddedChunkExtent =
            procgen::heightFieldChunkExtent(map.extentForChunkAtKey(chunkKey), settings.domain);
        const procgen::Array2<float> paddedChunk = procgen::samplePaddedChunk(reader, paddedChunkExtent);
        meshing::triangulateHeightMap(paddedChunk, paddedChunkExtent, buffer);

        if (buffer.mesh.indices.empty())
        {
            continue;
        }

        emitChunkMesh(buffer.mesh, sink, summary);
    }
}

void MeshGenerator::emitChunkMesh(const meshing::PosNormMesh& mesh, MeshSink& sink, GenerationSummary& summary)
{
    state_.chunkMeshHandles.push_back(sink.spawn(mesh));
    ++summary.meshesEmitted;
    summary.vertexCount += mesh.positions.size();
    summary.triangleCount += mesh.triangleCount();
}

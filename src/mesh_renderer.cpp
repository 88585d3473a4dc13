#include "mesh_renderer.h"

#include <cstddef>
#include <cstdint>
#include <iostream>

namespace
{
struct Vertex
{
    glm::vec3 position;
    glm::vec3 normal;
};
}

MeshRenderer::~MeshRenderer()
{
    clear();
}

MeshHandle MeshRenderer::spawn(const meshing::PosNormMesh& mesh)
{
    std::vector<Vertex> vertices;
    vertices.reserve(mesh.positions.size());
    for (std::size_t i = 0; i < mesh.positions.size(); ++i)
    {
        vertices.push_back(Vertex{mesh.positions[i], mesh.normals[i]});
    }

    GpuMesh gpuMesh{};
    glGenVertexArrays(1, &gpuMesh.vao);
    glGenBuffers(1, &gpuMesh.vbo);
    glGenBuffers(1, &gpuMesh.ibo);

    glBindVertexArray(gpuMesh.vao);
    glBindBuffer(GL_ARRAY_BUFFER, gpuMesh.vbo);
    glBufferData(GL_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(vertices.size() * sizeof(Vertex)),
                 vertices.data(),
                 GL_STATIC_DRAW);

    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, gpuMesh.ibo);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(mesh.indices.size() * sizeof(std::uint32_t)),
                 mesh.indices.data(),
                 GL_STATIC_DRAW);

    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(Vertex),
                          reinterpret_cast<void*>(offsetof(Vertex, position)));
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(Vertex),
                          reinterpret_cast<void*>(offsetof(Vertex, normal)));
    glEnableVertexAttribArray(1);

    glBindVertexArray(0);

    gpuMesh.indexCount = static_cast<GLsizei>(mesh.indices.size());

    const MeshHandle handle = nextHandle_++;
    meshes_.emplace(handle, gpuMesh);
    return handle;
}

void MeshRenderer::despawn(MeshHandle handle)
{
    auto it = meshes_.find(handle);
    if (it == meshes_.end())
    {
        std::cerr << "[MeshRenderer] Despawn of unknown mesh handle " << handle << std::endl;
        return;
    }

    destroy(it->second);
    meshes_.erase(it);
}

MeshRenderData MeshRenderer::buildRenderData() const
{
    MeshRenderData data{};
    data.lightDirection = lightDirection_;
    data.baseColor = baseColor_;
    data.batches.reserve(meshes_.size());
    for (const auto& entry : meshes_)
    {
        data.batches.push_back(MeshRenderBatch{entry.second.vao, entry.second.indexCount});
    }
    return data;
}

void MeshRenderer::clear()
{
    for (auto& entry : meshes_)
    {
        destroy(entry.second);
    }
    meshes_.clear();
}

void MeshRenderer::destroy(GpuMesh& mesh) noexcept
{
    if (mesh.ibo != 0)
    {
        glDeleteBuffers(1, &mesh.ibo);
    }
    if (mesh.vbo != 0)
    {
        glDeleteBuffers(1, &mesh.vbo);
    }
    if (mesh.vao != 0)
    {
        glDeleteVertexArrays(1, &mesh.vao);
    }
    mesh = GpuMesh{};
}

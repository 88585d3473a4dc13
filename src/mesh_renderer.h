#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include <glad/glad.h>
#include <glm/glm.hpp>

#include "mesh_generator.h"

inline constexpr float kNearPlane = 0.1f;
inline constexpr float kFarPlane = 1000.0f;
inline constexpr float kEpsilon = 1e-6f;

struct MeshShaderUniformLocations
{
    GLint uViewProj{-1};
    GLint uLightDir{-1};
    GLint uCameraPos{-1};
    GLint uBaseColor{-1};
};

struct MeshRenderBatch
{
    GLuint vao{0};
    GLsizei indexCount{0};
};

struct MeshRenderData
{
    glm::vec3 lightDirection{0.0f};
    glm::vec3 baseColor{0.0f};
    std::vector<MeshRenderBatch> batches;
};

class MeshRenderer final : public MeshSink
{
public:
    MeshRenderer() = default;
    ~MeshRenderer() override;

    MeshRenderer(const MeshRenderer&) = delete;
    MeshRenderer& operator=(const MeshRenderer&) = delete;
    MeshRenderer(MeshRenderer&&) = delete;
    MeshRenderer& operator=(MeshRenderer&&) = delete;

    MeshHandle spawn(const meshing::PosNormMesh& mesh) override;
    void despawn(MeshHandle handle) override;

    [[nodiscard]] MeshRenderData buildRenderData() const;

    void clear();

private:
    struct GpuMesh
    {
        GLuint vao{0};
        GLuint vbo{0};
        GLuint ibo{0};
        GLsizei indexCount{0};
    };

    static void destroy(GpuMesh& mesh) noexcept;

    std::unordered_map<MeshHandle, GpuMesh> meshes_;
    MeshHandle nextHandle_{1};
    const glm::vec3 lightDirection_{glm::normalize(glm::vec3(0.5f, -1.0f, 0.2f))};
    const glm::vec3 baseColor_{0.72f, 0.74f, 0.78f};
};

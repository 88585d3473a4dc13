#pragma once

#include "mesh_renderer.h"

void renderMeshGeometry(GLuint shaderProgram,
                        const glm::mat4& viewProj,
                        const glm::vec3& cameraPos,
                        const MeshShaderUniformLocations& uniforms,
                        const MeshRenderData& renderData);

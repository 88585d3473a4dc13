#include "renderer.h"

#include <glad/glad.h>
#include <glm/gtc/type_ptr.hpp>

void renderMeshGeometry(GLuint shaderProgram,
                        const glm::mat4& viewProj,
                        const glm::vec3& cameraPos,
                        const MeshShaderUniformLocations& uniforms,
                        const MeshRenderData& renderData)
{
    glUseProgram(shaderProgram);
    if (uniforms.uViewProj >= 0)
    {
        glUniformMatrix4fv(uniforms.uViewProj, 1, GL_FALSE, glm::value_ptr(viewProj));
    }
    if (uniforms.uLightDir >= 0)
    {
        glUniform3fv(uniforms.uLightDir, 1, glm::value_ptr(renderData.lightDirection));
    }
    if (uniforms.uCameraPos >= 0)
    {
        glUniform3fv(uniforms.uCameraPos, 1, glm::value_ptr(cameraPos));
    }
    if (uniforms.uBaseColor >= 0)
    {
        glUniform3fv(uniforms.uBaseColor, 1, glm::value_ptr(renderData.baseColor));
    }

    for (const MeshRenderBatch& batch : renderData.batches)
    {
        if (batch.indexCount == 0)
        {
            continue;
        }

        glBindVertexArray(batch.vao);
        glDrawElements(GL_TRIANGLES, batch.indexCount, GL_UNSIGNED_INT, nullptr);
    }

    glBindVertexArray(0);
    glUseProgram(0);
}

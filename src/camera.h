#pragma once

#include <glm/glm.hpp>

// Orbits a target point; yaw and pitch in degrees.
class Camera
{
public:
    glm::vec3 target{0.0f, 0.0f, 0.0f};
    float distance{150.0f};
    float yaw{-90.0f};
    float pitch{25.0f};
    float mouseSensitivity{0.25f};
    float zoomSpeed{8.0f};
    float minDistance{10.0f};
    float maxDistance{600.0f};

    const glm::vec3& position() const noexcept;

    glm::mat4 viewMatrix() const;

    void processMouse(float xoffset, float yoffset);
    void processZoom(float offset);
    void updateVectors();

private:
    glm::vec3 position_{0.0f, 0.0f, 150.0f};
    glm::vec3 front_{0.0f, 0.0f, -1.0f};
    glm::vec3 up_{0.0f, 1.0f, 0.0f};
    glm::vec3 worldUp_{0.0f, 1.0f, 0.0f};
};

#include "camera.h"

#include <algorithm>
#include <cmath>

#include <glm/gtc/matrix_transform.hpp>

#include "mesh_renderer.h"

const glm::vec3& Camera::position() const noexcept
{
    return position_;
}

glm::mat4 Camera::viewMatrix() const
{
    return glm::lookAt(position_, target, up_);
}

void Camera::processMouse(float xoffset, float yoffset)
{
    xoffset *= mouseSensitivity;
    yoffset *= mouseSensitivity;

    yaw += xoffset;
    pitch += yoffset;
    pitch = std::clamp(pitch, -89.0f, 89.0f);
    updateVectors();
}

void Camera::processZoom(float offset)
{
    distance = std::clamp(distance - offset * zoomSpeed, minDistance, maxDistance);
    updateVectors();
}

void Camera::updateVectors()
{
    const float yawRad = glm::radians(yaw);
    const float pitchRad = glm::radians(pitch);

    // Direction from the target towards the eye.
    glm::vec3 offset;
    offset.x = std::cos(yawRad) * std::cos(pitchRad);
    offset.y = std::sin(pitchRad);
    offset.z = std::sin(yawRad) * std::cos(pitchRad);

    position_ = target + distance * glm::normalize(offset);
    front_ = glm::normalize(target - position_);

    glm::vec3 right = glm::cross(front_, worldUp_);
    if (glm::length(right) < kEpsilon)
    {
        right = glm::vec3(1.0f, 0.0f, 0.0f);
    }
    else
    {
        right = glm::normalize(right);
    }
    up_ = glm::normalize(glm::cross(right, front_));
}

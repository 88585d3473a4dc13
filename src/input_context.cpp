#include "input_context.h"

#include <glad/glad.h>
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include "camera.h"

void framebufferSizeCallback(GLFWwindow*, int width, int height)
{
    glViewport(0, 0, width, height);
}

void mouseCallback(GLFWwindow* window, double xpos, double ypos)
{
    auto* input = static_cast<InputContext*>(glfwGetWindowUserPointer(window));
    if (input == nullptr || input->camera == nullptr)
    {
        return;
    }

    if (input->firstMouse)
    {
        input->lastX = static_cast<float>(xpos);
        input->lastY = static_cast<float>(ypos);
        input->firstMouse = false;
    }

    const float xoffset = static_cast<float>(xpos) - input->lastX;
    const float yoffset = static_cast<float>(ypos) - input->lastY;

    input->lastX = static_cast<float>(xpos);
    input->lastY = static_cast<float>(ypos);

    // Orbit only while dragging.
    if (input->leftMousePressed)
    {
        input->camera->processMouse(xoffset, yoffset);
    }
}

void scrollCallback(GLFWwindow* window, double /*xoffset*/, double yoffset)
{
    auto* input = static_cast<InputContext*>(glfwGetWindowUserPointer(window));
    if (input == nullptr || input->camera == nullptr)
    {
        return;
    }

    input->camera->processZoom(static_cast<float>(yoffset));
}

void mouseButtonCallback(GLFWwindow* window, int button, int action, int /*mods*/)
{
    auto* input = static_cast<InputContext*>(glfwGetWindowUserPointer(window));
    if (input == nullptr)
    {
        return;
    }

    if (button == GLFW_MOUSE_BUTTON_LEFT)
    {
        input->leftMousePressed = (action == GLFW_PRESS);
    }
}

ShapeRequest computeShapeRequest(GLFWwindow* window, InputContext& inputContext)
{
    const bool leftCurrentlyPressed = (glfwGetKey(window, GLFW_KEY_LEFT) == GLFW_PRESS);
    const bool leftJustPressed = leftCurrentlyPressed && !inputContext.leftArrowPressed;
    inputContext.leftArrowPressed = leftCurrentlyPressed;

    const bool rightCurrentlyPressed = (glfwGetKey(window, GLFW_KEY_RIGHT) == GLFW_PRESS);
    const bool rightJustPressed = rightCurrentlyPressed && !inputContext.rightArrowPressed;
    inputContext.rightArrowPressed = rightCurrentlyPressed;

    const bool rCurrentlyPressed = (glfwGetKey(window, GLFW_KEY_R) == GLFW_PRESS);
    inputContext.regenerateRequested = rCurrentlyPressed && !inputContext.rKeyPressed;
    inputContext.rKeyPressed = rCurrentlyPressed;

    if (leftJustPressed && !rightJustPressed)
    {
        return ShapeRequest::Previous;
    }
    if (rightJustPressed && !leftJustPressed)
    {
        return ShapeRequest::Next;
    }
    return ShapeRequest::None;
}

#pragma once

#include "mesh_generator.h"

struct GLFWwindow;

class Camera;

struct InputContext
{
    Camera* camera{nullptr};
    float lastX{0.0f};
    float lastY{0.0f};
    bool firstMouse{true};
    bool leftMousePressed{false};
    bool leftArrowPressed{false};
    bool rightArrowPressed{false};
    bool rKeyPressed{false};
    bool regenerateRequested{false};
};

void framebufferSizeCallback(GLFWwindow* window, int width, int height);
void mouseCallback(GLFWwindow* window, double xpos, double ypos);
void scrollCallback(GLFWwindow* window, double xoffset, double yoffset);
void mouseButtonCallback(GLFWwindow* window, int button, int action, int mods);

// Left/right arrow presses step through the shape catalogue; holding both does nothing.
ShapeRequest computeShapeRequest(GLFWwindow* window, InputContext& inputContext);

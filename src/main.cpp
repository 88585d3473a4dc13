#include <glad/glad.h>
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include "camera.h"
#include "generator_profile.h"
#include "input_context.h"
#include "mesh_generator.h"
#include "mesh_renderer.h"
#include "renderer.h"

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace
{
std::mutex gCrashLogMutex;
std::filesystem::path gCrashLogPath;

void appendCrashLog(std::string message);

void crashSignalHandler(int signalValue)
{
    const char* name = "unknown";
    switch (signalValue)
    {
        case SIGABRT:
            name = "SIGABRT";
            break;
#ifdef SIGSEGV
        case SIGSEGV:
            name = "SIGSEGV";
            break;
#endif
#ifdef SIGILL
        case SIGILL:
            name = "SIGILL";
            break;
#endif
#ifdef SIGFPE
        case SIGFPE:
            name = "SIGFPE";
            break;
#endif
#ifdef SIGTERM
        case SIGTERM:
            name = "SIGTERM";
            break;
#endif
    }
    appendCrashLog(std::string("signal: ") + name);
    std::_Exit(EXIT_FAILURE);
}

void appendCrashLog(std::string message)
{
    if (gCrashLogPath.empty())
    {
        return;
    }

    std::lock_guard<std::mutex> lock(gCrashLogMutex);

    std::ofstream out(gCrashLogPath, std::ios::app);
    if (!out)
    {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const std::time_t timestamp = std::chrono::system_clock::to_time_t(now);
    std::tm timeInfo{};
    if (std::tm* local = std::localtime(&timestamp))
    {
        timeInfo = *local;
    }
    out << std::put_time(&timeInfo, "%Y-%m-%d %H:%M:%S") << " - " << message << '\n';
    out.flush();
}

void initializeCrashLogging(const std::filesystem::path& logPath)
{
    gCrashLogPath = logPath;

    // Ensure the log file exists so later appends succeed even if the program dies immediately.
    {
        std::ofstream out(gCrashLogPath, std::ios::app);
    }

    std::signal(SIGABRT, crashSignalHandler);
#ifdef SIGSEGV
    std::signal(SIGSEGV, crashSignalHandler);
#endif
#ifdef SIGILL
    std::signal(SIGILL, crashSignalHandler);
#endif
#ifdef SIGFPE
    std::signal(SIGFPE, crashSignalHandler);
#endif
#ifdef SIGTERM
    std::signal(SIGTERM, crashSignalHandler);
#endif

    std::set_terminate([]
    {
        if (auto current = std::current_exception())
        {
            try
            {
                std::rethrow_exception(current);
            }
            catch (const std::exception& e)
            {
                appendCrashLog(std::string("terminate: ") + e.what());
            }
            catch (...)
            {
                appendCrashLog("terminate: unknown exception");
            }
        }
        else
        {
            appendCrashLog("terminate: no active exception");
        }
        std::abort();
    });
}

[[nodiscard]] GLuint compileShader(GLenum type, const char* source)
{
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    GLint success = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (success == GL_FALSE)
    {
        GLint logLength = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);

        std::string infoLog;
        if (logLength > 0)
        {
            infoLog.resize(static_cast<size_t>(logLength));
            GLsizei written = 0;
            glGetShaderInfoLog(shader, logLength, &written, infoLog.data());
            infoLog.resize(static_cast<size_t>(written));
        }
        if (infoLog.empty())
        {
            infoLog = "unknown error";
        }

        glDeleteShader(shader);
        throw std::runtime_error("Shader compilation failed: " + infoLog);
    }

    return shader;
}

[[nodiscard]] GLuint createProgram(const char* vertexSrc, const char* fragmentSrc)
{
    GLuint vertexShader = compileShader(GL_VERTEX_SHADER, vertexSrc);
    GLuint fragmentShader = compileShader(GL_FRAGMENT_SHADER, fragmentSrc);

    GLuint program = glCreateProgram();
    glAttachShader(program, vertexShader);
    glAttachShader(program, fragmentShader);
    glLinkProgram(program);

    GLint success = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (success == GL_FALSE)
    {
        GLint logLength = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLength);

        std::string infoLog;
        if (logLength > 0)
        {
            infoLog.resize(static_cast<size_t>(logLength));
            GLsizei written = 0;
            glGetProgramInfoLog(program, logLength, &written, infoLog.data());
            infoLog.resize(static_cast<size_t>(written));
        }
        if (infoLog.empty())
        {
            infoLog = "unknown error";
        }

        glDeleteProgram(program);
        glDeleteShader(vertexShader);
        glDeleteShader(fragmentShader);
        throw std::runtime_error("Program linkage failed: " + infoLog);
    }

    glDetachShader(program, vertexShader);
    glDetachShader(program, fragmentShader);
    glDeleteShader(vertexShader);
    glDeleteShader(fragmentShader);

    return program;
}

void updateWindowTitle(GLFWwindow* window, const MeshGenerator& generator)
{
    std::ostringstream title;
    title << "ShapeMesher - " << shapeName(generator.currentShape());
    if (const auto& summary = generator.lastSummary())
    {
        title << " (" << summary->meshesEmitted << " chunk meshes, " << summary->triangleCount << " triangles)";
    }
    glfwSetWindowTitle(window, title.str().c_str());
}

int runViewer(const std::filesystem::path& profilePath)
{
    MeshGenerator generator(GeneratorProfile::load(profilePath));

    if (glfwInit() != GLFW_TRUE)
    {
        std::cerr << "Failed to initialize GLFW" << std::endl;
        return EXIT_FAILURE;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    constexpr int kInitialWidth = 1280;
    constexpr int kInitialHeight = 720;

    GLFWwindow* window = glfwCreateWindow(kInitialWidth, kInitialHeight, "ShapeMesher", nullptr, nullptr);
    if (window == nullptr)
    {
        std::cerr << "Failed to create GLFW window" << std::endl;
        glfwTerminate();
        return EXIT_FAILURE;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress)))
    {
        std::cerr << "Failed to initialize GLAD" << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return EXIT_FAILURE;
    }

    glEnable(GL_DEPTH_TEST);
    glEnable(GL_CULL_FACE);
    glCullFace(GL_BACK);
    glFrontFace(GL_CCW);

    glfwSetFramebufferSizeCallback(window, framebufferSizeCallback);

    Camera camera;
    camera.updateVectors();

    InputContext inputContext;
    inputContext.camera = &camera;

    glfwSetWindowUserPointer(window, &inputContext);
    glfwSetCursorPosCallback(window, mouseCallback);
    glfwSetScrollCallback(window, scrollCallback);
    glfwSetMouseButtonCallback(window, mouseButtonCallback);

    const char* vertexShaderSrc = R"(#version 330 core
layout (location = 0) in vec3 aPos;
layout (location = 1) in vec3 aNormal;

uniform mat4 uViewProj;

out vec3 vNormal;
out vec3 vWorldPos;

void main()
{
    vNormal = aNormal;
    vWorldPos = aPos;
    gl_Position = uViewProj * vec4(aPos, 1.0);
}
)";

    const char* fragmentShaderSrc = R"(#version 330 core
out vec4 FragColor;

in vec3 vNormal;
in vec3 vWorldPos;

uniform vec3 uLightDir;
uniform vec3 uCameraPos;
uniform vec3 uBaseColor;

void main()
{
    vec3 normal = normalize(vNormal);
    vec3 lightDir = normalize(-uLightDir);
    vec3 viewDir = normalize(uCameraPos - vWorldPos);
    float diff = max(dot(normal, lightDir), 0.0);
    float ambient = 0.35;
    vec3 halfDir = normalize(lightDir + viewDir);
    float specular = pow(max(dot(normal, halfDir), 0.0), 32.0);

    vec3 color = uBaseColor * (ambient + diff) + vec3(0.1) * specular;
    FragColor = vec4(color, 1.0);
}
)";

    GLuint shaderProgram = 0;
    try
    {
        shaderProgram = createProgram(vertexShaderSrc, fragmentShaderSrc);
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Shader compilation failed: " << ex.what() << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return EXIT_FAILURE;
    }

    MeshShaderUniformLocations meshUniforms{};
    meshUniforms.uViewProj = glGetUniformLocation(shaderProgram, "uViewProj");
    meshUniforms.uLightDir = glGetUniformLocation(shaderProgram, "uLightDir");
    meshUniforms.uCameraPos = glGetUniformLocation(shaderProgram, "uCameraPos");
    meshUniforms.uBaseColor = glGetUniformLocation(shaderProgram, "uBaseColor");

    std::cout << "Controls: left/right arrows cycle shapes, R regenerates, drag to orbit, scroll to zoom"
              << std::endl;

    {
        MeshRenderer meshRenderer;

        while (!glfwWindowShouldClose(window))
        {
            glfwPollEvents();

            if (glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS)
            {
                glfwSetWindowShouldClose(window, GLFW_TRUE);
            }

            const ShapeRequest request = computeShapeRequest(window, inputContext);
            if (generator.update(request, meshRenderer))
            {
                updateWindowTitle(window, generator);
            }
            else if (inputContext.regenerateRequested)
            {
                generator.regenerate(meshRenderer);
                updateWindowTitle(window, generator);
            }

            int framebufferWidth = 0;
            int framebufferHeight = 0;
            glfwGetFramebufferSize(window, &framebufferWidth, &framebufferHeight);
            const float aspect = framebufferHeight > 0
                                     ? static_cast<float>(framebufferWidth) / static_cast<float>(framebufferHeight)
                                     : 1.0f;

            const glm::mat4 projection = glm::perspective(glm::radians(60.0f), aspect, kNearPlane, kFarPlane);
            const glm::mat4 viewProj = projection * camera.viewMatrix();

            glClearColor(0.53f, 0.81f, 0.92f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

            renderMeshGeometry(shaderProgram, viewProj, camera.position(), meshUniforms, meshRenderer.buildRenderData());

            glfwSwapBuffers(window);
        }

        generator.clear(meshRenderer);
    }

    glDeleteProgram(shaderProgram);

    glfwDestroyWindow(window);
    glfwTerminate();
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv)
{
    std::filesystem::path exePath;
    if (argc > 0 && argv[0] != nullptr)
    {
        std::error_code ec;
        exePath = std::filesystem::canonical(argv[0], ec);
        if (ec)
        {
            exePath = std::filesystem::absolute(argv[0], ec);
            if (ec)
            {
                exePath.clear();
            }
        }
    }

    std::filesystem::path exeDirectory = exePath.parent_path();
    if (exeDirectory.empty())
    {
        exeDirectory = std::filesystem::current_path();
    }

    std::filesystem::path logPath = exeDirectory / "shapemesher_crash.log";

#ifndef NDEBUG
    std::cout << "Crash log path: " << logPath << '\n';
#endif

    initializeCrashLogging(logPath);

    const std::filesystem::path profilePath = argc > 1 ? std::filesystem::path(argv[1])
                                                       : std::filesystem::path("assets/shapemesher.toml");

    try
    {
        return runViewer(profilePath);
    }
    catch (const std::exception& e)
    {
        appendCrashLog(std::string("uncaught exception: ") + e.what());
        std::cerr << "Unhandled exception: " << e.what() << '\n';
    }
    catch (...)
    {
        appendCrashLog("uncaught exception: unknown exception");
        std::cerr << "Unhandled non-standard exception" << std::endl;
    }

    return EXIT_FAILURE;
}

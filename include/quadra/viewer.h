#pragma once

#include <quadra/camera.h>
#include <quadra/canvas-batch.h>
#include <quadra/config.h>
#include <quadra/result.hpp>
#include <quadra/scene.h>
#include <quadra/user-input.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct GLFWwindow;

namespace quadra {

class WebGPUContext;
class CanvasRenderer;

// Scene viewer: a GLFW window redrawing the scene every frame through the
// GPU pipeline, or a one-shot software render to PNG with --headless.
class Viewer {
public:
    using Ptr = std::shared_ptr<Viewer>;

    static Result<Ptr> create(int argc, char* argv[]) noexcept;

    ~Viewer();

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;

    Result<void> run() noexcept;
    void shutdown() noexcept;

private:
    Viewer() = default;

    Result<void> init(int argc, char* argv[]) noexcept;
    Result<void> parseArgs(int argc, char* argv[]) noexcept;
    void initLogging() noexcept;
    Result<void> initScene() noexcept;

    Result<void> runHeadless() noexcept;

    Result<void> initWindow() noexcept;
    Result<void> initGraphics() noexcept;
    Result<void> renderFrame() noexcept;
    void handleResize(int width, int height) noexcept;

    void onKey(int key, int action) noexcept;
    void onMouseMove(double x, double y) noexcept;
    void onMouseButton(int button, int action) noexcept;
    void onScroll(double xoffset, double yoffset) noexcept;

    Config::Ptr _config;
    GraphicsConfig _graphics;
    bool _verbose = false;
    std::string _scenePath;
    std::optional<std::string> _headlessOutput;
    std::optional<uint32_t> _widthArg;
    std::optional<uint32_t> _heightArg;

    Scene _scene;
    std::unique_ptr<CanvasBatch> _batch;
    Camera _camera;
    UserInput _input;
    double _lastFrameTime = 0.0;

    GLFWwindow* _window = nullptr;
    std::shared_ptr<WebGPUContext> _ctx;
    std::unique_ptr<CanvasRenderer> _renderer;

    uint32_t _width = 0;
    uint32_t _height = 0;
    uint64_t _frameCount = 0;
};

} // namespace quadra

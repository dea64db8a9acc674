#include <quadra/viewer.h>
#include <quadra/canvas-renderer.h>
#include <quadra/software-rasterizer.h>
#include <quadra/webgpu-context.h>
#include <quadra/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <GLFW/glfw3.h>
#include <iostream>

namespace quadra {

Result<Viewer::Ptr> Viewer::create(int argc, char* argv[]) noexcept {
    auto viewer = Ptr(new Viewer());
    if (auto res = viewer->init(argc, argv); !res) {
        return Err<Ptr>("Failed to initialize Viewer", res);
    }
    return Ok(viewer);
}

Viewer::~Viewer() {
    shutdown();
}

Result<void> Viewer::init(int argc, char* argv[]) noexcept {
    if (auto res = parseArgs(argc, argv); !res) {
        return res;
    }
    initLogging();

    if (auto res = initScene(); !res) {
        return res;
    }

    _batch = std::make_unique<CanvasBatch>(_config->canvasBatchConfig());

    // Command line beats the scene's own size, which beats the config
    _width = _widthArg ? *_widthArg : (_scene.width ? _scene.width : _graphics.width);
    _height = _heightArg ? *_heightArg : (_scene.height ? _scene.height : _graphics.height);
    if (_width == 0 || _height == 0) {
        return Err<void>("Viewer: output size must be positive, got " + std::to_string(_width) +
                         "x" + std::to_string(_height));
    }

    _camera.setReference(_graphics.referenceHeight);
    _camera.setSpeed(_graphics.cameraSpeed);
    _camera.update({static_cast<float>(_width), static_cast<float>(_height)});
    return Ok();
}

Result<void> Viewer::parseArgs(int argc, char* argv[]) noexcept {
    args::ArgumentParser parser("quadra - 2D canvas renderer",
                                "Renders a YAML scene of images and rounded rectangles.");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::ValueFlag<std::string> configFile(parser, "path", "Config file path", {'c', "config"});
    args::ValueFlag<uint32_t> widthArg(parser, "width", "Output width in pixels", {'W', "width"});
    args::ValueFlag<uint32_t> heightArg(parser, "height", "Output height in pixels",
                                        {'H', "height"});
    args::ValueFlag<std::string> headlessArg(
        parser, "out.png", "Render with the software rasterizer to a PNG and exit",
        {"headless"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});
    args::Positional<std::string> sceneArg(parser, "scene", "Scene YAML (built-in demo if absent)");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return Err<void>("Help requested");
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return Err<void>(std::string("Parse error: ") + e.what());
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        return Err<void>(std::string("Invalid argument: ") + e.what());
    }

    YAML::Node cmdOverrides;
    if (verboseFlag) {
        cmdOverrides["logging"]["level"] = "debug";
    }

    std::string configPath = configFile ? args::get(configFile) : "";
    auto configResult = Config::create(configPath, cmdOverrides);
    if (!configResult) {
        return Err<void>("Failed to create config", configResult);
    }
    _config = *configResult;
    _graphics = _config->graphicsConfig();

    _verbose = verboseFlag;
    _scenePath = sceneArg ? args::get(sceneArg) : "";
    if (headlessArg) _headlessOutput = args::get(headlessArg);
    if (widthArg) _widthArg = args::get(widthArg);
    if (heightArg) _heightArg = args::get(heightArg);
    return Ok();
}

void Viewer::initLogging() noexcept {
    std::string level = _config->logLevel();
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::cfg::load_env_levels();
    if (_verbose) {
        spdlog::set_level(spdlog::level::debug);
    }
    ydebug("Viewer: log level {}", level);
}

Result<void> Viewer::initScene() noexcept {
    auto sceneRes = _scenePath.empty() ? defaultScene() : loadScene(_scenePath);
    if (!sceneRes) {
        return Err<void>("Failed to load scene", sceneRes);
    }
    _scene = std::move(*sceneRes);
    yinfo("Viewer: scene '{}' with {} elements", _scenePath.empty() ? "demo" : _scenePath,
          _scene.items.size());
    return Ok();
}

Result<void> Viewer::run() noexcept {
    if (_headlessOutput) {
        return runHeadless();
    }

    if (auto res = initWindow(); !res) {
        return res;
    }
    if (auto res = initGraphics(); !res) {
        return res;
    }

    _lastFrameTime = glfwGetTime();
    while (!glfwWindowShouldClose(_window)) {
        glfwPollEvents();

        double now = glfwGetTime();
        float dt = static_cast<float>(now - _lastFrameTime);
        _lastFrameTime = now;

        _camera.control(_input, dt);
        if (_input.mouse.left.click) {
            Vec2 world = _input.mouse.position(_camera);
            ydebug("Viewer: click at ({}, {}) -> world ({:.1f}, {:.1f})", _input.mouse.raw.x,
                   _input.mouse.raw.y, world.x, world.y);
        }

        auto res = renderFrame();
        _input.endFrame();
        if (!res) {
            return Err<void>("Viewer: frame " + std::to_string(_frameCount), res);
        }
        _frameCount++;
    }
    yinfo("Viewer: window closed after {} frames", _frameCount);
    return Ok();
}

//-----------------------------------------------------------------------------
// Headless
//-----------------------------------------------------------------------------

Result<void> Viewer::runHeadless() noexcept {
    _batch->clear();
    if (auto res = _scene.submit(*_batch); !res) {
        return Err<void>("Viewer: scene submit failed", res);
    }

    Framebuffer framebuffer(_width, _height, _scene.background);
    SoftwareRasterizer rasterizer;
    if (auto res = rasterizer.draw(*_batch, _camera.transform(), framebuffer); !res) {
        return Err<void>("Viewer: software render failed", res);
    }
    yinfo("Viewer: rasterized {} instances, {} fragments", rasterizer.stats().instances,
          rasterizer.stats().fragments);

    if (auto res = framebuffer.savePng(*_headlessOutput); !res) {
        return res;
    }
    return Ok();
}

//-----------------------------------------------------------------------------
// Windowed
//-----------------------------------------------------------------------------

Result<void> Viewer::initWindow() noexcept {
    if (!glfwInit()) {
        return Err<void>("Failed to initialize GLFW");
    }

    // No OpenGL context, WebGPU draws to the surface
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    GLFWmonitor* monitor = nullptr;
    if (_graphics.mode == WindowMode::Fullscreen) {
        monitor = glfwGetPrimaryMonitor();
    } else if (_graphics.mode == WindowMode::Borderless) {
        glfwWindowHint(GLFW_DECORATED, GLFW_FALSE);
    }

    _window = glfwCreateWindow(static_cast<int>(_width), static_cast<int>(_height),
                               _graphics.title.c_str(), monitor, nullptr);
    if (!_window) {
        glfwTerminate();
        return Err<void>("Failed to create window");
    }

    glfwSetWindowUserPointer(_window, this);
    glfwSetFramebufferSizeCallback(_window, [](GLFWwindow* w, int newWidth, int newHeight) {
        auto* viewer = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (viewer) {
            viewer->handleResize(newWidth, newHeight);
        }
    });
    glfwSetKeyCallback(_window, [](GLFWwindow* w, int key, int, int action, int) {
        auto* viewer = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (viewer) {
            viewer->onKey(key, action);
        }
    });
    glfwSetCursorPosCallback(_window, [](GLFWwindow* w, double x, double y) {
        auto* viewer = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (viewer) {
            viewer->onMouseMove(x, y);
        }
    });
    glfwSetMouseButtonCallback(_window, [](GLFWwindow* w, int button, int action, int) {
        auto* viewer = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (viewer) {
            viewer->onMouseButton(button, action);
        }
    });
    glfwSetScrollCallback(_window, [](GLFWwindow* w, double xoffset, double yoffset) {
        auto* viewer = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (viewer) {
            viewer->onScroll(xoffset, yoffset);
        }
    });

    int fbWidth = 0, fbHeight = 0;
    glfwGetFramebufferSize(_window, &fbWidth, &fbHeight);
    if (fbWidth > 0 && fbHeight > 0) {
        _width = static_cast<uint32_t>(fbWidth);
        _height = static_cast<uint32_t>(fbHeight);
        _camera.update({static_cast<float>(_width), static_cast<float>(_height)});
    }
    return Ok();
}

Result<void> Viewer::initGraphics() noexcept {
    auto ctxResult = WebGPUContext::create(_window, _width, _height, _graphics.vsync);
    if (!ctxResult) {
        return Err<void>("Failed to initialize WebGPU", ctxResult);
    }
    _ctx = *ctxResult;

    CanvasRenderer::Config rendererConfig;
    rendererConfig.batch = _config->canvasBatchConfig();
    rendererConfig.textureLayerSize = _config->textureLayerSize();
    auto rendererResult = CanvasRenderer::create(*_ctx, rendererConfig);
    if (!rendererResult) {
        return Err<void>("Failed to create canvas renderer", rendererResult);
    }
    _renderer = std::move(*rendererResult);
    return Ok();
}

void Viewer::handleResize(int width, int height) noexcept {
    if (width <= 0 || height <= 0) return;
    _width = static_cast<uint32_t>(width);
    _height = static_cast<uint32_t>(height);
    _camera.update({static_cast<float>(_width), static_cast<float>(_height)});
    if (_ctx) {
        _ctx->resize(_width, _height);
    }
}

void Viewer::onKey(int key, int action) noexcept {
    if (action == GLFW_REPEAT) return;
    bool down = action == GLFW_PRESS;
    switch (key) {
        case GLFW_KEY_W:
            _input.onKey(Key::W, down);
            break;
        case GLFW_KEY_A:
            _input.onKey(Key::A, down);
            break;
        case GLFW_KEY_S:
            _input.onKey(Key::S, down);
            break;
        case GLFW_KEY_D:
            _input.onKey(Key::D, down);
            break;
        case GLFW_KEY_ESCAPE:
            if (down) glfwSetWindowShouldClose(_window, GLFW_TRUE);
            break;
        default:
            break;
    }
}

void Viewer::onMouseMove(double x, double y) noexcept {
    // Cursor arrives in window coordinates; the camera works in framebuffer pixels
    int winWidth = 0, winHeight = 0;
    glfwGetWindowSize(_window, &winWidth, &winHeight);
    double sx = winWidth > 0 ? static_cast<double>(_width) / winWidth : 1.0;
    double sy = winHeight > 0 ? static_cast<double>(_height) / winHeight : 1.0;
    _input.onMouseMove(x * sx, y * sy);
}

void Viewer::onMouseButton(int button, int action) noexcept {
    bool down = action == GLFW_PRESS;
    if (button == GLFW_MOUSE_BUTTON_LEFT) {
        _input.onMouseButton(MouseButton::Left, down);
    } else if (button == GLFW_MOUSE_BUTTON_RIGHT) {
        _input.onMouseButton(MouseButton::Right, down);
    }
}

void Viewer::onScroll(double xoffset, double yoffset) noexcept {
    _input.onScroll(xoffset, yoffset);
}

Result<void> Viewer::renderFrame() noexcept {
    auto viewRes = _ctx->getCurrentTextureView();
    if (!viewRes) {
        // Surface is outdated or lost while resizing; try again next frame
        ydebug("Viewer: skipping frame: {}", error_msg(viewRes));
        return Ok();
    }

    _batch->clear();
    if (auto res = _scene.submit(*_batch); !res) {
        return Err<void>("Viewer: scene submit failed", res);
    }
    _renderer->bind(_camera.transform());

    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = WGPU_STR("canvas frame");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_ctx->getDevice(), &encoderDesc);
    if (!encoder) {
        return Err<void>("Viewer: failed to create command encoder");
    }

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = *viewRes;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    WGPU_COLOR_ATTACHMENT_CLEAR(colorAttachment, _scene.background.x, _scene.background.y,
                                _scene.background.z, _scene.background.w);

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    if (!pass) {
        wgpuCommandEncoderRelease(encoder);
        return Err<void>("Viewer: failed to begin render pass");
    }

    auto drawRes = _renderer->draw(pass, *_batch);
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);
    if (!drawRes) {
        wgpuCommandEncoderRelease(encoder);
        return drawRes;
    }

    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    if (!cmdBuffer) {
        wgpuCommandEncoderRelease(encoder);
        return Err<void>("Viewer: failed to finish command encoder");
    }

    wgpuQueueSubmit(_ctx->getQueue(), 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
    wgpuCommandEncoderRelease(encoder);

    _ctx->present();
    WGPU_DEVICE_TICK(_ctx->getDevice());
    return Ok();
}

void Viewer::shutdown() noexcept {
    _renderer.reset();
    _ctx.reset();
    if (_window) {
        glfwDestroyWindow(_window);
        _window = nullptr;
        glfwTerminate();
    }
}

} // namespace quadra

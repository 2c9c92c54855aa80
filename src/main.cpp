/*
 * main.cpp
 *
 * Purpose:
 *   Application entry point and frame loop for the day/night globe.
 *   Responsibilities include:
 *     - GLFW / GLAD initialization and window lifecycle
 *     - Asset root discovery
 *     - Wiring renderer, controls, input and engine
 *     - Optional initial location from the command line ("lat,lng[,label]")
 *     - Window-title clock refreshed once per second
 *     - Per-frame: timers, staged init, engine tick, view update, hover, draw
 *
 * Threading:
 *   - Everything below runs on the main thread. Texture decoding inside GlobeRenderer is the only
 *     work that runs elsewhere, joined by the init sequence.
 */

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include "core/Clock.h"
#include "core/Config.h"
#include "core/Controls.h"
#include "core/Input.h"
#include "core/Location.h"
#include "core/TimerQueue.h"
#include "engine/GlobeEngine.h"
#include "render/GlobeRenderer.h"

static const char* kWindowTitle = "Day/Night Globe";

/*
 * Attempts to locate the project assets directory by walking up from CWD.
 *
 * Returns:
 *   Path to ".../assets" if found; empty path otherwise.
 */
static std::filesystem::path FindAssetsRoot() {
    namespace fs = std::filesystem;
    fs::path p = fs::current_path();
    for (int i = 0; i < 8; ++i) {
        fs::path cand = p / "assets";
        if (fs::exists(cand) && fs::is_directory(cand)) return cand;
        if (!p.has_parent_path() || p.parent_path() == p) break;
        p = p.parent_path();
    }
    return {};
}

// "<title> - YYYY-MM-DD HH:MM:SS" in local time.
static std::string TitleWithClock(std::int64_t nowMs) {
    std::time_t t = static_cast<std::time_t>(nowMs / 1000);
    char buf[32] = {0};
    if (const std::tm* lt = std::localtime(&t)) {
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", lt);
    }
    return std::string(kWindowTitle) + " - " + buf;
}

/*
 * Program entry point.
 *
 * High-level flow:
 *   1) Initialize GLFW + create OpenGL context, load GL functions via GLAD
 *   2) Locate assets
 *   3) Build renderer (staged init), controls, input bridge and engine
 *   4) Run the frame loop until the window closes or initialization fails
 *   5) Shut the engine down, then release GL resources before the context goes away
 */
int main(int argc, char** argv) {
    if (!glfwInit()) return -1;

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow* window = glfwCreateWindow(1280, 720, kWindowTitle, nullptr, nullptr);
    if (!window) { glfwTerminate(); return -1; }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // VSync on

    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress)) {
        std::cerr << "[Main] Failed to init GLAD\n";
        glfwDestroyWindow(window);
        glfwTerminate();
        return -1;
    }

    glEnable(GL_DEPTH_TEST);

    auto assetsRoot = FindAssetsRoot();
    if (assetsRoot.empty()) {
        std::cerr << "[Main] Failed to locate assets directory. CWD=" << std::filesystem::current_path() << "\n";
        glfwDestroyWindow(window);
        glfwTerminate();
        return -1;
    }

    int exitCode = 0;
    {
        GlobeConfig config;
        SystemClock clock;
        TimerQueue timers;

        GlobeRenderer renderer(config, clock, assetsRoot);
        Controls controls;
        Input input(window, controls);
        GlobeEngine engine(renderer, clock, timers, config);

        input.setResizeHandler([&engine](int w, int h) { engine.notifyResize(w, h); });
        GlobeController controller = engine.start(&controls);

        int fbW = 0, fbH = 0;
        glfwGetFramebufferSize(window, &fbW, &fbH);
        engine.notifyResize(fbW, fbH);

        if (argc > 1) {
            if (auto loc = ParseLocation(argv[1])) {
                std::cerr << "[Main] showing " << loc->label << "\n";
                controller.showLocation(*loc);
            } else {
                std::cerr << "[Main] ignoring location argument\n";
            }
        }

        // Repeating 1 s timer; the copy scheduled each time refers back to this function object.
        std::function<void()> refreshTitle;
        refreshTitle = [&]() {
            glfwSetWindowTitle(window, TitleWithClock(clock.nowMs()).c_str());
            timers.schedule(clock.nowMs() + 1000, refreshTitle);
        };
        refreshTitle();

        std::cerr << "[Main] assets=" << assetsRoot.string() << "\n";

        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();
            if (input.keyDown(GLFW_KEY_ESCAPE)) glfwSetWindowShouldClose(window, 1);

            timers.runDue(clock.nowMs());

            if (renderer.advanceInit() == StepStatus::Failed) {
                std::cerr << "[Main] globe initialization failed at '" << renderer.initStep() << "'\n";
                exitCode = -1;
                break;
            }

            engine.tick();
            renderer.update();

            int winW = 0, winH = 0;
            glfwGetWindowSize(window, &winW, &winH);
            renderer.hover(input.cursorX(), input.cursorY(), winW, winH);

            renderer.render();
            glfwSwapBuffers(window);
        }

        engine.shutdown();
        timers.clear();
        std::cerr << "[Main] shutdown\n";
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return exitCode;
}

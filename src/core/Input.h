/*
 * Input.h
 *
 * Purpose:
 *   Declares the Input bridge between GLFW window callbacks and the globe's Controls.
 *   Mouse buttons, cursor motion and the scroll wheel become Controls gestures; framebuffer size
 *   changes are forwarded to a resize handler.
 *
 * Design notes:
 *   - Avoids including GLFW headers in this header to prevent indirect inclusion of OpenGL headers,
 *     which can conflict with glad's include order. Uses a forward declaration of GLFWwindow instead.
 *   - Installs itself as the GLFW window user pointer; one Input per window.
 *
 * Usage:
 *   - Construct with a valid GLFWwindow* and the Controls to drive.
 *   - setResizeHandler() before the first resize is expected.
 *   - cursorX()/cursorY() give the last cursor position for hover picking.
 */

#pragma once

#include <functional>
#include <utility>

// Forward declaration only: including GLFW headers here may indirectly include OpenGL headers and break glad.
struct GLFWwindow;
class Controls;

class Input {
public:
    using ResizeHandler = std::function<void(int width, int height)>;

    Input(GLFWwindow* window, Controls& controls);
    ~Input();

    Input(const Input&) = delete;
    Input& operator=(const Input&) = delete;

    void setResizeHandler(ResizeHandler handler) { m_onResize = std::move(handler); }

    // Immediate keyboard state query (GLFW key code).
    bool keyDown(int glfwKey) const;

    double cursorX() const { return m_cursorX; }
    double cursorY() const { return m_cursorY; }

private:
    GLFWwindow* m_window = nullptr;
    Controls& m_controls;
    ResizeHandler m_onResize;

    double m_cursorX = 0.0;
    double m_cursorY = 0.0;

    // GLFW C-style callbacks; forward to the instance stored in the window user pointer.
    static void MouseButtonCallback(GLFWwindow* window, int button, int action, int mods);
    static void CursorPosCallback(GLFWwindow* window, double x, double y);
    static void ScrollCallback(GLFWwindow* window, double xoffset, double yoffset);
    static void FramebufferSizeCallback(GLFWwindow* window, int w, int h);
};

/*
 * Input.cpp
 *
 * Purpose:
 *   Implements the GLFW -> Controls bridge.
 *
 * Key behaviors:
 *   - Left button drives rotation, right button drives pan; other buttons are ignored.
 *   - Cursor motion is forwarded on every event; Controls ignores it when no drag is active.
 *   - Framebuffer size events go to the resize handler unfiltered (zero on minimize); the
 *     receiver decides what to ignore.
 */

#include "core/Input.h"
#include "core/Controls.h"
#include <GLFW/glfw3.h>

static Input* FromWindow(GLFWwindow* window) {
    return reinterpret_cast<Input*>(glfwGetWindowUserPointer(window));
}

Input::Input(GLFWwindow* window, Controls& controls) : m_window(window), m_controls(controls) {
    glfwSetWindowUserPointer(m_window, this);
    glfwSetMouseButtonCallback(m_window, Input::MouseButtonCallback);
    glfwSetCursorPosCallback(m_window, Input::CursorPosCallback);
    glfwSetScrollCallback(m_window, Input::ScrollCallback);
    glfwSetFramebufferSizeCallback(m_window, Input::FramebufferSizeCallback);

    glfwGetCursorPos(m_window, &m_cursorX, &m_cursorY);
}

Input::~Input() {
    glfwSetMouseButtonCallback(m_window, nullptr);
    glfwSetCursorPosCallback(m_window, nullptr);
    glfwSetScrollCallback(m_window, nullptr);
    glfwSetFramebufferSizeCallback(m_window, nullptr);
    glfwSetWindowUserPointer(m_window, nullptr);
}

bool Input::keyDown(int glfwKey) const {
    return glfwGetKey(m_window, glfwKey) == GLFW_PRESS;
}

void Input::MouseButtonCallback(GLFWwindow* window, int button, int action, int /*mods*/) {
    Input* self = FromWindow(window);
    if (!self) return;

    PointerButton b;
    if (button == GLFW_MOUSE_BUTTON_LEFT) b = PointerButton::Primary;
    else if (button == GLFW_MOUSE_BUTTON_RIGHT) b = PointerButton::Secondary;
    else return;

    if (action == GLFW_PRESS) self->m_controls.pointerDown(b, self->m_cursorX, self->m_cursorY);
    else if (action == GLFW_RELEASE) self->m_controls.pointerUp(b);
}

void Input::CursorPosCallback(GLFWwindow* window, double x, double y) {
    Input* self = FromWindow(window);
    if (!self) return;

    self->m_cursorX = x;
    self->m_cursorY = y;
    self->m_controls.pointerMove(x, y);
}

void Input::ScrollCallback(GLFWwindow* window, double /*xoffset*/, double yoffset) {
    Input* self = FromWindow(window);
    if (!self) return;
    self->m_controls.wheel(yoffset);
}

void Input::FramebufferSizeCallback(GLFWwindow* window, int w, int h) {
    Input* self = FromWindow(window);
    if (!self || !self->m_onResize) return;
    self->m_onResize(w, h);
}

#include "gl_window.h"

#include <GLFW/glfw3.h>

#include <iostream>
#include <stdexcept>

#include "iris/config.hpp"

GlWindow::GlWindow(int width, int height, const std::string& title) {
  if (!glfwInit()) {
    throw std::runtime_error("GLFW init failed");
  }
  // Legacy compatibility context: only glDrawPixels is needed.
  glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_API);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);

  window_ = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
  if (!window_) {
    glfwTerminate();
    throw std::runtime_error("GLFW window creation failed");
  }
  glfwMakeContextCurrent(window_);
  glfwSwapInterval(1);  // one tick per display refresh

  glfwSetWindowUserPointer(window_, this);
  glfwSetScrollCallback(window_, [](GLFWwindow* win, double /*dx*/, double dy) {
    auto* self = static_cast<GlWindow*>(glfwGetWindowUserPointer(win));
    if (self && self->on_scroll && dy != 0.0) self->on_scroll(dy);
  });
  glfwSetMouseButtonCallback(window_, [](GLFWwindow* win, int button, int action, int /*mods*/) {
    auto* self = static_cast<GlWindow*>(glfwGetWindowUserPointer(win));
    if (!self || button != GLFW_MOUSE_BUTTON_LEFT) return;
    self->dragging_ = action == GLFW_PRESS;
    glfwGetCursorPos(win, &self->lastX_, &self->lastY_);
  });
  glfwSetCursorPosCallback(window_, [](GLFWwindow* win, double x, double y) {
    auto* self = static_cast<GlWindow*>(glfwGetWindowUserPointer(win));
    if (!self || !self->dragging_) return;
    const double dx = x - self->lastX_;
    const double dy = y - self->lastY_;
    self->lastX_ = x;
    self->lastY_ = y;
    if (self->on_drag) self->on_drag(dx, dy);
  });
  glfwSetDropCallback(window_, [](GLFWwindow* win, int count, const char** paths) {
    auto* self = static_cast<GlWindow*>(glfwGetWindowUserPointer(win));
    // Only the last dropped file matters; earlier ones would be superseded.
    if (self && self->on_drop && count > 0) self->on_drop(paths[count - 1]);
  });
  glfwSetKeyCallback(window_, [](GLFWwindow* win, int key, int /*scancode*/, int action,
                                 int /*mods*/) {
    if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS) glfwSetWindowShouldClose(win, GLFW_TRUE);
  });
}

GlWindow::~GlWindow() {
  if (window_) glfwDestroyWindow(window_);
  glfwTerminate();
}

bool GlWindow::shouldClose() const { return glfwWindowShouldClose(window_); }

void GlWindow::pollEvents() { glfwPollEvents(); }

void GlWindow::setTitle(const std::string& title) { glfwSetWindowTitle(window_, title.c_str()); }

std::pair<std::uint32_t, std::uint32_t> GlWindow::framebufferSize() const {
  int fbw = 0, fbh = 0;
  glfwGetFramebufferSize(window_, &fbw, &fbh);
  // Minimized windows report 0; the viewport skips those ticks.
  return {static_cast<std::uint32_t>(fbw > 0 ? fbw : 0),
          static_cast<std::uint32_t>(fbh > 0 ? fbh : 0)};
}

std::uint32_t GlWindow::windowHeight() const {
  int w = 0, h = 0;
  glfwGetWindowSize(window_, &w, &h);
  return static_cast<std::uint32_t>(h > 0 ? h : 0);
}

void GlWindow::present(const iris::PixelBuffer& frame) {
  const auto [fbw, fbh] = framebufferSize();
  glViewport(0, 0, static_cast<GLsizei>(fbw), static_cast<GLsizei>(fbh));
  glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT);

  // Rows are top-first and padded to the copy alignment.
  glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
  glPixelStorei(GL_UNPACK_ROW_LENGTH, static_cast<GLint>(frame.rowStride / 4));
  glRasterPos2f(-1.0f, 1.0f);
  glPixelZoom(1.0f, -1.0f);
  glDrawPixels(static_cast<GLsizei>(frame.width), static_cast<GLsizei>(frame.height), GL_RGBA,
               GL_UNSIGNED_BYTE, frame.bytes.data());
  glPixelStorei(GL_UNPACK_ROW_LENGTH, 0);

  glfwSwapBuffers(window_);
  if (iris::verboseLogging()) {
    std::cout << "Present " << frame.width << "x" << frame.height << " stride " << frame.rowStride
              << std::endl;
  }
}

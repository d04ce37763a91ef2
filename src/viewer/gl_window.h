#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

#include "iris/image.hpp"

struct GLFWwindow;

// GLFW window with a plain OpenGL context that shows read-back frames. The
// viewport core never touches this context; it only receives pixels.
class GlWindow {
 public:
  GlWindow(int width, int height, const std::string& title);
  ~GlWindow();
  GlWindow(const GlWindow&) = delete;
  GlWindow& operator=(const GlWindow&) = delete;

  // Input hooks, invoked from pollEvents().
  std::function<void(double)> on_scroll;              // wheel steps, > 0 is away from user
  std::function<void(double, double)> on_drag;        // left-button drag delta, window coords
  std::function<void(const std::filesystem::path&)> on_drop;

  bool shouldClose() const;
  void pollEvents();
  void setTitle(const std::string& title);

  std::pair<std::uint32_t, std::uint32_t> framebufferSize() const;
  std::uint32_t windowHeight() const;

  // Draws frame 1:1 into the lower-left of the framebuffer and swaps.
  void present(const iris::PixelBuffer& frame);

 private:
  GLFWwindow* window_ = nullptr;
  bool dragging_ = false;
  double lastX_ = 0.0;
  double lastY_ = 0.0;
};

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "iris/viewport.hpp"
#include "viewer/gl_window.h"

using std::cout;
using std::string;

namespace fs = std::filesystem;

static void print_usage(const char* argv0) {
  cout << "iris_viewer — GPU image viewport\n";
  cout << "\nUsage:\n";
  cout << "  " << argv0 << " [image]\n\n";
  cout << "Drop a file on the window to open it. Wheel zooms, left drag pans, Esc quits.\n";
  cout << "\nEnvironment:\n";
  cout << "  IRIS_BACKEND=vulkan|metal|d3d12|d3d11|opengl|null|auto\n";
  cout << "  IRIS_LOW_POWER=1          prefer the low-power adapter\n";
  cout << "  IRIS_VIEWPORT_VERBOSE=1   print diagnostics\n";
}

static string expandUserPath(string path) {
  if (!path.empty() && path[0] == '~') {
    const char* home = std::getenv("HOME");
    if (home && (path.size() == 1 || path[1] == '/' || path[1] == '\\')) {
      return string(home) + path.substr(1);
    }
  }
  return path;
}

int main(int argc, char** argv) {
  if (argc > 2 || (argc == 2 && string(argv[1]) == "--help")) {
    print_usage(argv[0]);
    return argc == 2 ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  try {
    const iris::ViewportConfig config = iris::ViewportConfig::fromEnvironment();

    GlWindow window(1200, 800, "Iris");
    iris::Viewport viewport([&window](const iris::PixelBuffer& frame) { window.present(frame); },
                            config);

    const auto open = [&](const fs::path& path) {
      viewport.loadImage(path);
      window.setTitle("Iris - " + path.filename().string());
    };

    window.on_scroll = [&](double dy) { viewport.camera().zoomBy(dy > 0 ? 1.1f : 0.9f); };
    window.on_drag = [&](double dx, double dy) {
      viewport.camera().panByPixels(static_cast<float>(dx), static_cast<float>(dy),
                                    window.windowHeight());
    };
    window.on_drop = open;

    if (argc == 2) {
      std::error_code ec;
      fs::path resolved = fs::absolute(expandUserPath(argv[1]), ec);
      if (iris::verboseLogging()) {
        cout << "CWD: " << fs::current_path().string() << "\n";
        cout << "Requested path: " << argv[1] << "\n";
      }
      open(ec ? fs::path(argv[1]) : resolved);
    }

    while (!window.shouldClose()) {
      window.pollEvents();
      const auto [width, height] = window.framebufferSize();
      const auto before = viewport.frameCount();
      viewport.onTick(width, height);
      if (viewport.frameCount() == before) {
        // Nothing swapped (GPU still starting or window minimized).
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
    }
    return EXIT_SUCCESS;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return EXIT_FAILURE;
  }
}

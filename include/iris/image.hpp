#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace iris {

// Tightly packed RGBA8 pixels, row-major, top row first.
struct DecodedImage {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::vector<std::uint8_t> rgba;
};

class DecodeError : public std::runtime_error {
 public:
  DecodeError(const std::filesystem::path& path, const std::string& what)
      : std::runtime_error("decode '" + path.string() + "': " + what), path_(path) {}

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

// Reads and decodes an image file with OpenCV. Any channel layout or bit depth
// OpenCV understands is normalized to RGBA8. Throws DecodeError on failure.
DecodedImage decodeImageFile(const std::filesystem::path& path);

// Synchronous decoder; runs off the GPU thread.
using DecodeFn = std::function<DecodedImage(const std::filesystem::path&)>;

enum class PixelFormat { RGBA8 };

// One read-back frame. rowStride may exceed width * 4 because of the GPU copy
// alignment; only the first width * 4 bytes of each row are image data.
struct PixelBuffer {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  PixelFormat format = PixelFormat::RGBA8;
  std::uint32_t rowStride = 0;
  std::vector<std::uint8_t> bytes;
};

// Display surface fed once per rendered frame.
using PresentFn = std::function<void(const PixelBuffer&)>;

}  // namespace iris

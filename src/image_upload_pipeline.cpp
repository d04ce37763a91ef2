#include "iris/image_upload_pipeline.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

#include "iris/config.hpp"

namespace iris {

namespace {

void validate(const DecodedImage& image, const std::filesystem::path& path) {
  if (image.width == 0 || image.height == 0) {
    throw DecodeError(path, "decoder returned an empty image");
  }
  if (image.rgba.size() != static_cast<std::size_t>(image.width) * image.height * 4) {
    throw DecodeError(path, "decoder returned a truncated pixel buffer");
  }
}

}  // namespace

ImageUploadPipeline::ImageUploadPipeline(TaskRunner& runner, DecodeFn decode, InstallFn install)
    : runner_(runner), decode_(std::move(decode)), install_(std::move(install)) {
  if (!decode_) throw std::invalid_argument("ImageUploadPipeline: decoder is empty");
  if (!install_) throw std::invalid_argument("ImageUploadPipeline: install callback is empty");
}

std::uint64_t ImageUploadPipeline::load(const std::filesystem::path& path) {
  const std::uint64_t token = ++latest_;

  // The worker gets a copy of the decoder and never touches GPU state.
  auto channel = std::make_shared<std::future<DecodedImage>>(
      std::async(std::launch::async, decode_, path));

  if (verboseLogging()) {
    std::cout << "Load #" << token << " started: " << path.string() << std::endl;
  }

  runner_.post([this, token, path, channel]() {
    if (channel->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      return Poll::Pending;
    }
    complete_(token, path, *channel);
    return Poll::Ready;
  });
  return token;
}

void ImageUploadPipeline::complete_(std::uint64_t token, const std::filesystem::path& path,
                                    std::future<DecodedImage>& result) {
  DecodedImage image;
  try {
    image = result.get();
    validate(image, path);
  } catch (const std::exception& e) {
    // Recoverable: the current image stays on screen.
    ++failed_;
    std::cerr << "Failed to decode image: " << e.what() << "\n";
    return;
  }

  if (token != latest_) {
    ++discarded_;
    if (verboseLogging()) {
      std::cout << "Load #" << token << " superseded by #" << latest_ << ", dropped" << std::endl;
    }
    return;
  }

  const std::uint32_t width = image.width;
  const std::uint32_t height = image.height;
  try {
    install_(std::move(image));
  } catch (const std::invalid_argument& e) {
    // The renderer refused it (e.g. over the texture size limit); keep the current image.
    ++failed_;
    std::cerr << "Failed to install image " << path.string() << " (" << width << "x" << height
              << "): " << e.what() << "\n";
    return;
  }
  accepted_ = token;
  if (verboseLogging()) {
    std::cout << "Load #" << token << " accepted: " << path.string() << std::endl;
  }
}

}  // namespace iris

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>

#include "iris/image.hpp"
#include "iris/task_runner.hpp"

namespace iris {

// Decodes on a worker thread and hands the pixels back to the runner's thread
// through a one-shot future. Only the most recently issued load is installed;
// a completion for an older request is dropped.
class ImageUploadPipeline {
 public:
  // install runs on the runner's thread and receives ownership of the pixels.
  // It may throw std::invalid_argument to reject an image; that counts as a failure.
  using InstallFn = std::function<void(DecodedImage)>;

  ImageUploadPipeline(TaskRunner& runner, DecodeFn decode, InstallFn install);

  // Starts decoding path and returns the request token. Never blocks.
  std::uint64_t load(const std::filesystem::path& path);

  std::uint64_t latestToken() const { return latest_; }
  // Last request handed to install without being rejected; 0 until then.
  // The install callback may defer the upload, so this is not proof of display.
  std::uint64_t acceptedToken() const { return accepted_; }
  std::uint64_t failedCount() const { return failed_; }
  std::uint64_t discardedCount() const { return discarded_; }

 private:
  void complete_(std::uint64_t token, const std::filesystem::path& path,
                 std::future<DecodedImage>& result);

  TaskRunner& runner_;
  DecodeFn decode_;
  InstallFn install_;
  std::uint64_t latest_ = 0;
  std::uint64_t accepted_ = 0;
  std::uint64_t failed_ = 0;
  std::uint64_t discarded_ = 0;
};

}  // namespace iris

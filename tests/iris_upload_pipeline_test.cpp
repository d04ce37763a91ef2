#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "iris/image_upload_pipeline.hpp"
#include "iris/task_runner.hpp"

using iris::DecodedImage;
using iris::ImageUploadPipeline;
using iris::TaskRunner;

namespace {

DecodedImage solid(std::uint32_t w, std::uint32_t h) {
  DecodedImage img;
  img.width = w;
  img.height = h;
  img.rgba.assign(static_cast<std::size_t>(w) * h * 4, 200);
  return img;
}

// Runs runner passes until pred holds or a few seconds pass.
bool pumpUntil(TaskRunner& runner, const std::function<bool()>& pred) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    runner.runPending();
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

// Decoder whose results are held back until release(name) is called. Gates
// that are never released open when the decoder is destroyed.
class GatedDecoder {
 public:
  explicit GatedDecoder(const std::map<std::string, DecodedImage>& images)
      : state_(std::make_shared<State>()) {
    for (const auto& [name, image] : images) {
      state_->waits[name] = gates_[name].get_future().share();
      state_->images[name] = image;
    }
  }

  iris::DecodeFn fn() const {
    return [state = state_](const std::filesystem::path& path) {
      const std::string name = path.string();
      state->waits.at(name).wait();
      return state->images.at(name);
    };
  }

  void release(const std::string& name) { gates_.at(name).set_value(); }

 private:
  struct State {
    std::map<std::string, std::shared_future<void>> waits;
    std::map<std::string, DecodedImage> images;
  };
  std::shared_ptr<State> state_;
  std::map<std::string, std::promise<void>> gates_;
};

}  // namespace

TEST(UploadPipeline, InstallsDecodedImageOnRunnerThread) {
  TaskRunner runner;
  const auto runnerThread = std::this_thread::get_id();
  std::vector<std::uint32_t> installed;
  std::thread::id installThread;
  ImageUploadPipeline pipeline(
      runner, [](const std::filesystem::path&) { return solid(4, 2); },
      [&](DecodedImage img) {
        installThread = std::this_thread::get_id();
        installed.push_back(img.width);
      });

  EXPECT_EQ(pipeline.load("a.png"), 1u);
  EXPECT_TRUE(installed.empty());
  ASSERT_TRUE(pumpUntil(runner, [&] { return runner.idle(); }));

  EXPECT_EQ(installed, (std::vector<std::uint32_t>{4}));
  EXPECT_EQ(installThread, runnerThread);
  EXPECT_EQ(pipeline.acceptedToken(), 1u);
  EXPECT_EQ(pipeline.failedCount(), 0u);
}

TEST(UploadPipeline, LaterLoadWinsWhenDecodesFinishInOrder) {
  TaskRunner runner;
  GatedDecoder decoder({{"a", solid(40, 20)}, {"b", solid(10, 30)}});
  std::vector<std::uint32_t> installed;
  ImageUploadPipeline pipeline(runner, decoder.fn(),
                               [&](DecodedImage img) { installed.push_back(img.width); });

  pipeline.load("a");
  pipeline.load("b");
  EXPECT_EQ(pipeline.latestToken(), 2u);

  decoder.release("a");
  ASSERT_TRUE(pumpUntil(runner, [&] { return pipeline.discardedCount() == 1; }));
  decoder.release("b");
  ASSERT_TRUE(pumpUntil(runner, [&] { return runner.idle(); }));

  EXPECT_EQ(installed, (std::vector<std::uint32_t>{10}));
  EXPECT_EQ(pipeline.acceptedToken(), 2u);
}

TEST(UploadPipeline, StaleDecodeFinishingLastIsDropped) {
  TaskRunner runner;
  GatedDecoder decoder({{"a", solid(40, 20)}, {"b", solid(10, 30)}});
  std::vector<std::uint32_t> installed;
  ImageUploadPipeline pipeline(runner, decoder.fn(),
                               [&](DecodedImage img) { installed.push_back(img.width); });

  pipeline.load("a");
  pipeline.load("b");

  decoder.release("b");
  ASSERT_TRUE(pumpUntil(runner, [&] { return pipeline.acceptedToken() == 2; }));
  decoder.release("a");
  ASSERT_TRUE(pumpUntil(runner, [&] { return runner.idle(); }));

  EXPECT_EQ(installed, (std::vector<std::uint32_t>{10}));
  EXPECT_EQ(pipeline.discardedCount(), 1u);
}

TEST(UploadPipeline, DecodeFailureKeepsCurrentImage) {
  TaskRunner runner;
  std::vector<std::uint32_t> installed;
  ImageUploadPipeline pipeline(
      runner,
      [](const std::filesystem::path& path) -> DecodedImage {
        if (path == "bad") throw iris::DecodeError(path, "corrupt");
        return solid(8, 8);
      },
      [&](DecodedImage img) { installed.push_back(img.width); });

  pipeline.load("good");
  ASSERT_TRUE(pumpUntil(runner, [&] { return runner.idle(); }));
  pipeline.load("bad");
  ASSERT_TRUE(pumpUntil(runner, [&] { return runner.idle(); }));

  EXPECT_EQ(installed, (std::vector<std::uint32_t>{8}));
  EXPECT_EQ(pipeline.failedCount(), 1u);
  EXPECT_EQ(pipeline.acceptedToken(), 1u);
}

TEST(UploadPipeline, EmptyOrTruncatedResultCountsAsFailure) {
  TaskRunner runner;
  int installs = 0;
  ImageUploadPipeline pipeline(
      runner,
      [](const std::filesystem::path& path) {
        DecodedImage img = solid(4, 4);
        if (path == "empty") img = DecodedImage{};
        if (path == "short") img.rgba.resize(10);
        return img;
      },
      [&](DecodedImage) { ++installs; });

  pipeline.load("empty");
  ASSERT_TRUE(pumpUntil(runner, [&] { return runner.idle(); }));
  pipeline.load("short");
  ASSERT_TRUE(pumpUntil(runner, [&] { return runner.idle(); }));

  EXPECT_EQ(installs, 0);
  EXPECT_EQ(pipeline.failedCount(), 2u);
}

TEST(UploadPipeline, RejectedInstallCountsAsFailure) {
  TaskRunner runner;
  std::vector<std::uint32_t> installed;
  ImageUploadPipeline pipeline(
      runner,
      [](const std::filesystem::path& path) {
        return path == "huge" ? solid(64, 1) : solid(8, 8);
      },
      [&](DecodedImage img) {
        if (img.width > 32) throw std::invalid_argument("too large");
        installed.push_back(img.width);
      });

  pipeline.load("good");
  ASSERT_TRUE(pumpUntil(runner, [&] { return runner.idle(); }));
  pipeline.load("huge");
  ASSERT_TRUE(pumpUntil(runner, [&] { return runner.idle(); }));

  EXPECT_EQ(installed, (std::vector<std::uint32_t>{8}));
  EXPECT_EQ(pipeline.failedCount(), 1u);
  EXPECT_EQ(pipeline.acceptedToken(), 1u);
  EXPECT_EQ(pipeline.latestToken(), 2u);
}

TEST(UploadPipeline, RejectsMissingCallbacks) {
  TaskRunner runner;
  EXPECT_THROW(ImageUploadPipeline(runner, nullptr, [](DecodedImage) {}), std::invalid_argument);
  EXPECT_THROW(ImageUploadPipeline(runner, iris::decodeImageFile, nullptr),
               std::invalid_argument);
}

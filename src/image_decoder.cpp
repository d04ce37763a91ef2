#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <cstring>
#include <iostream>
#include <system_error>

#include "iris/config.hpp"
#include "iris/image.hpp"

namespace iris {

namespace {

// Any depth -> 8-bit, any channel count -> RGBA.
cv::Mat toRGBA8(const cv::Mat& src) {
  cv::Mat img8;
  switch (src.depth()) {
    case CV_8U:
      img8 = src;
      break;
    case CV_16U:
      src.convertTo(img8, CV_8U, 1.0 / 257.0);
      break;
    case CV_32F:
    case CV_64F:
      src.convertTo(img8, CV_8U, 255.0);
      break;
    default:
      src.convertTo(img8, CV_8U);
      break;
  }

  cv::Mat rgba;
  switch (img8.channels()) {
    case 1:
      cv::cvtColor(img8, rgba, cv::COLOR_GRAY2RGBA);
      break;
    case 3:
      cv::cvtColor(img8, rgba, cv::COLOR_BGR2RGBA);
      break;
    case 4:
      cv::cvtColor(img8, rgba, cv::COLOR_BGRA2RGBA);
      break;
    default:
      return {};
  }
  return rgba;
}

}  // namespace

DecodedImage decodeImageFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw DecodeError(path, "not a regular file");
  }

  cv::Mat src;
  try {
    src = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    throw DecodeError(path, e.what());
  }
  if (src.empty()) {
    throw DecodeError(path, "unsupported or corrupt image");
  }

  cv::Mat rgba = toRGBA8(src);
  if (rgba.empty()) {
    throw DecodeError(path, "unsupported channel count " + std::to_string(src.channels()));
  }
  if (!rgba.isContinuous()) rgba = rgba.clone();

  DecodedImage out;
  out.width = static_cast<std::uint32_t>(rgba.cols);
  out.height = static_cast<std::uint32_t>(rgba.rows);
  out.rgba.resize(rgba.total() * rgba.elemSize());
  std::memcpy(out.rgba.data(), rgba.data, out.rgba.size());

  if (verboseLogging()) {
    std::cout << "Decoded " << path.string() << " (" << out.width << "x" << out.height << ", "
              << src.channels() << " channels)" << std::endl;
  }
  return out;
}

}  // namespace iris

#ifndef DOCOCR_TEST_IMAGES_HPP
#define DOCOCR_TEST_IMAGES_HPP

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <filesystem>
#include <string>

namespace dococr {
namespace testing {

/**
 * @brief White page with several lines of black text
 */
inline cv::Mat createTextPage(int width = 800, int height = 600) {
  cv::Mat page(height, width, CV_8UC3, cv::Scalar(255, 255, 255));

  // Lines of equal length keep the text block rectangular
  for (int line = 0; line < 5; ++line) {
    std::string text = "SCANNED DOCUMENT LINE " + std::to_string(line + 1);
    cv::putText(page, text, cv::Point(100, 150 + line * 60),
                cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 0, 0), 2);
  }
  return page;
}

/**
 * @brief White page with a block of horizontal black bars
 */
inline cv::Mat createBarPage(int width = 600, int height = 600) {
  cv::Mat page(height, width, CV_8UC1, cv::Scalar(255));
  for (int row = 0; row < 6; ++row) {
    int y = 180 + row * 45;
    cv::rectangle(page, cv::Rect(150, y, 300, 18), cv::Scalar(0), cv::FILLED);
  }
  return page;
}

/**
 * @brief Rotate counter-clockwise about the centre, filling with white
 */
inline cv::Mat rotatePage(const cv::Mat &page, double degrees) {
  cv::Point2f center(page.cols / 2.0f, page.rows / 2.0f);
  cv::Mat rotation = cv::getRotationMatrix2D(center, degrees, 1.0);
  cv::Mat rotated;
  cv::warpAffine(page, rotated, rotation, page.size(), cv::INTER_CUBIC,
                 cv::BORDER_CONSTANT, cv::Scalar::all(255));
  return rotated;
}

/**
 * @brief Path for a scratch file in the system temp directory
 */
inline std::string tempPath(const std::string &name) {
  return (std::filesystem::temp_directory_path() / ("dococr_" + name))
      .string();
}

/**
 * @brief Write an image to the temp directory and return its path
 */
inline std::string writeTempImage(const std::string &name,
                                  const cv::Mat &image) {
  std::string path = tempPath(name);
  cv::imwrite(path, image);
  return path;
}

/**
 * @brief True if two images have the same size, type and pixels
 */
inline bool identical(const cv::Mat &a, const cv::Mat &b) {
  if (a.size() != b.size() || a.type() != b.type()) {
    return false;
  }
  cv::Mat diff;
  cv::absdiff(a, b, diff);
  return cv::countNonZero(diff.reshape(1)) == 0;
}

/**
 * @brief True if every pixel is 0 or 255
 */
inline bool isBinary(const cv::Mat &image) {
  cv::Mat zero = image == 0;
  cv::Mat full = image == 255;
  return cv::countNonZero(zero) + cv::countNonZero(full) ==
         static_cast<int>(image.total());
}

} // namespace testing
} // namespace dococr

#endif // DOCOCR_TEST_IMAGES_HPP

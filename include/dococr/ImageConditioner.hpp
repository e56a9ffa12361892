#ifndef DOCOCR_IMAGE_CONDITIONER_HPP
#define DOCOCR_IMAGE_CONDITIONER_HPP

#include "dococr/RecognitionOptions.hpp"

#include <opencv2/core.hpp>

#include <string>

namespace dococr {

/**
 * @brief Turns a scanned or photographed page into a binary image for OCR
 *
 * Steps, in order: grayscale, optional deskew, optional CLAHE, optional blur,
 * and Gaussian adaptive thresholding. The output is inverted: text pixels are
 * 255 and background pixels are 0.
 *
 * Example usage:
 * @code
 * dococr::RecognitionOptions options;
 * options.blurType = dococr::BlurType::Median;
 * cv::Mat binary = dococr::ImageConditioner().condition("page.png", options);
 * @endcode
 */
class ImageConditioner {
public:
  /**
   * @brief Load an image file and condition it
   * @param imagePath Path to a PNG, JPEG, BMP or TIFF file
   * @param options Preprocessing switches and parameters
   * @return Single-channel binary image (values 0 and 255 only)
   * @throws ImageLoadError if the file cannot be read or decoded
   * @throws RecognitionError if any conditioning step fails
   */
  cv::Mat condition(const std::string &imagePath,
                    const RecognitionOptions &options) const;

  /**
   * @brief Condition an image that is already in memory
   * @param image 1, 3 (BGR) or 4 (BGRA) channel 8-bit image
   * @param options Preprocessing switches and parameters
   * @return Single-channel binary image (values 0 and 255 only)
   * @throws RecognitionError if any conditioning step fails
   */
  cv::Mat condition(const cv::Mat &image,
                    const RecognitionOptions &options) const;

  /**
   * @brief Convert to single-channel grayscale
   */
  static cv::Mat toGrayscale(const cv::Mat &image);

private:
  cv::Mat applyBlur(const cv::Mat &gray,
                    const RecognitionOptions &options) const;
};

} // namespace dococr

#endif // DOCOCR_IMAGE_CONDITIONER_HPP

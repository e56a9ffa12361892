#include "dococr/ImageConditioner.hpp"

#include "dococr/Errors.hpp"
#include "dococr/SkewCorrector.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <iostream>
#include <stdexcept>

namespace dococr {

cv::Mat ImageConditioner::condition(const std::string &imagePath,
                                    const RecognitionOptions &options) const {
  cv::Mat image;
  try {
    image = cv::imread(imagePath, cv::IMREAD_COLOR);
  } catch (const cv::Exception &e) {
    std::cerr << "Error decoding " << imagePath << ": " << e.what()
              << std::endl;
    throw ImageLoadError(imagePath);
  }

  if (image.empty()) {
    throw ImageLoadError(imagePath);
  }

  return condition(image, options);
}

cv::Mat ImageConditioner::condition(const cv::Mat &image,
                                    const RecognitionOptions &options) const {
  try {
    if (image.empty()) {
      throw std::invalid_argument("Input image is empty");
    }

    cv::Mat current = toGrayscale(image);

    if (options.applyDeskew) {
      current = deskew(current, options.deskewMinAngle).image;
    }

    if (options.applyClahe) {
      cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(
          options.claheClipLimit,
          cv::Size(options.claheTileGrid, options.claheTileGrid));
      cv::Mat equalized;
      clahe->apply(current, equalized);
      current = equalized;
    }

    current = applyBlur(current, options);

    // Inverted so that text ends up white on black
    cv::Mat binary;
    cv::adaptiveThreshold(current, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                          cv::THRESH_BINARY_INV, options.adaptiveBlockSize,
                          options.adaptiveBias);
    return binary;
  } catch (const std::exception &e) {
    std::cerr << "Error during image preprocessing: " << e.what()
              << std::endl;
    throw RecognitionError("Image preprocessing failed",
                           std::current_exception());
  }
}

cv::Mat ImageConditioner::toGrayscale(const cv::Mat &image) {
  cv::Mat gray;

  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image.clone();
  }

  if (gray.depth() != CV_8U) {
    cv::Mat converted;
    gray.convertTo(converted, CV_8U);
    gray = converted;
  }

  return gray;
}

cv::Mat ImageConditioner::applyBlur(const cv::Mat &gray,
                                    const RecognitionOptions &options) const {
  const int kernel = options.blurKernelSize;
  cv::Mat blurred;

  switch (options.blurType) {
  case BlurType::Gaussian:
    cv::GaussianBlur(gray, blurred, cv::Size(kernel, kernel), 0);
    return blurred;
  case BlurType::Median:
    cv::medianBlur(gray, blurred, kernel);
    return blurred;
  case BlurType::None:
    return gray;
  default:
    std::cerr << "Warning: Unknown blur type "
              << static_cast<int>(options.blurType) << ". Skipping blur."
              << std::endl;
    return gray;
  }
}

} // namespace dococr

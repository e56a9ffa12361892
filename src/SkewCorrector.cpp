#include "dococr/SkewCorrector.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

// Define M_PI if not already defined (Windows)
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace dococr {

double rectangleAngle(const cv::RotatedRect &rect) {
  cv::Point2f corners[4];
  rect.points(corners);

  // Any edge works: adjacent edges differ by 90 degrees
  cv::Point2f edge = corners[1] - corners[0];
  double edgeAngle = std::atan2(edge.y, edge.x) * 180.0 / M_PI;

  double angle = std::fmod(-edgeAngle, 90.0);
  if (angle >= 0.0) {
    angle -= 90.0;
  }
  return angle;
}

std::optional<double> estimateSkewAngle(const cv::Mat &gray) {
  cv::Mat inverted;
  cv::bitwise_not(gray, inverted);

  cv::Mat thresh;
  cv::threshold(inverted, thresh, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);

  std::vector<cv::Point> coords;
  cv::findNonZero(thresh, coords);
  if (coords.empty()) {
    return std::nullopt;
  }

  double angle = rectangleAngle(cv::minAreaRect(coords));

  if (angle < -45.0) {
    return -(90.0 + angle);
  }
  return -angle;
}

DeskewOutcome deskew(const cv::Mat &gray, double minAngle) {
  try {
    std::optional<double> angle = estimateSkewAngle(gray);
    if (!angle) {
      std::cerr << "Deskew: no text pixels found, skipping rotation."
                << std::endl;
      return {DeskewOutcome::Status::Unchanged, gray, 0.0};
    }

    std::ostringstream angleText;
    angleText << std::fixed << std::setprecision(2) << *angle;
    std::cerr << "Deskew: estimated angle = " << angleText.str() << " degrees"
              << std::endl;

    if (std::abs(*angle) <= minAngle) {
      return {DeskewOutcome::Status::Unchanged, gray, *angle};
    }

    cv::Point2f center(gray.cols / 2.0f, gray.rows / 2.0f);
    cv::Mat rotation = cv::getRotationMatrix2D(center, *angle, 1.0);

    cv::Mat rotated;
    cv::warpAffine(gray, rotated, rotation, gray.size(), cv::INTER_CUBIC,
                   cv::BORDER_REPLICATE);

    return {DeskewOutcome::Status::Corrected, rotated, *angle};
  } catch (const std::exception &e) {
    std::cerr << "Warning: deskew failed: " << e.what()
              << ". Continuing with the original image." << std::endl;
    return {DeskewOutcome::Status::Unchanged, gray, 0.0};
  }
}

} // namespace dococr

#ifndef DOCOCR_SKEW_CORRECTOR_HPP
#define DOCOCR_SKEW_CORRECTOR_HPP

#include <opencv2/core.hpp>

#include <optional>

namespace dococr {

/**
 * @brief Result of a deskew attempt
 *
 * Deskewing is best effort: when the skew is negligible, no content is found
 * or estimation fails, the input buffer is handed back untouched with status
 * Unchanged.
 */
struct DeskewOutcome {
  enum class Status {
    Corrected, ///< image is a rotated copy of the input
    Unchanged  ///< image is the input buffer itself
  };

  Status status;
  cv::Mat image;      ///< Buffer to continue the pipeline with
  double angle = 0.0; ///< Estimated correction in degrees (0 if none found)

  bool corrected() const { return status == Status::Corrected; }
};

/**
 * @brief Angle of a rotated rectangle in the legacy [-90, 0) convention
 *
 * OpenCV changed the range reported by cv::minAreaRect in 4.5.1. This derives
 * the angle from the corner points so the result does not depend on the
 * OpenCV version.
 */
double rectangleAngle(const cv::RotatedRect &rect);

/**
 * @brief Estimate the rotation that aligns the text of a grayscale page
 *
 * Dark pixels are isolated with Otsu thresholding on the inverted image and
 * enclosed in a minimum area rectangle. A positive result is a
 * counter-clockwise correction.
 *
 * @param gray Single-channel 8-bit image, dark text on light background
 * @return Correction angle in (-45, 45] degrees, or std::nullopt when the
 *         image has no candidate text pixels
 */
std::optional<double> estimateSkewAngle(const cv::Mat &gray);

/**
 * @brief Estimate skew and rotate the page back to horizontal
 *
 * The rotation is about the image centre with cubic interpolation and
 * replicated borders, and preserves the image size. Never throws.
 *
 * @param gray Single-channel 8-bit image
 * @param minAngle Corrections with absolute value at or below this are skipped
 */
DeskewOutcome deskew(const cv::Mat &gray, double minAngle = 0.5);

} // namespace dococr

#endif // DOCOCR_SKEW_CORRECTOR_HPP

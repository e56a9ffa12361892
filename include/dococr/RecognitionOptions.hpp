#ifndef DOCOCR_RECOGNITION_OPTIONS_HPP
#define DOCOCR_RECOGNITION_OPTIONS_HPP

#include <optional>
#include <string>

namespace dococr {

/// Language code for which spell correction is available
constexpr const char *kEnglishLanguage = "eng";

/**
 * @brief Noise suppression applied before binarization
 */
enum class BlurType {
  None,     ///< No blur
  Gaussian, ///< 5x5 Gaussian kernel, sigma derived from the kernel size
  Median    ///< 5x5 median filter
};

/**
 * @brief Configuration options for a recognition request
 *
 * The first block mirrors the engine and preprocessing settings a user picks;
 * the second block holds tuning constants that default to the calibrated
 * values and rarely need changing.
 */
struct RecognitionOptions {
  std::string language = kEnglishLanguage; ///< Engine language ("eng", "ind+eng")
  int pageSegMode = 3;                     ///< Page segmentation mode (0-13)
  int engineMode = 3;                      ///< Engine mode (0-3)
  std::optional<std::string> tessdataDir;  ///< Language data override
  bool applyDeskew = true;                 ///< Estimate and correct rotation
  bool applyClahe = true;                  ///< Local contrast equalization
  bool applySpellcheck = true;             ///< Dictionary correction (eng only)
  BlurType blurType = BlurType::Gaussian;  ///< Blur before binarization

  int minConfidence = 35;       ///< Words below this confidence are dropped
  int adaptiveBlockSize = 11;   ///< Neighbourhood size for binarization (odd)
  double adaptiveBias = 4.0;    ///< Subtracted from the weighted local mean
  double claheClipLimit = 2.0;  ///< CLAHE contrast limit
  int claheTileGrid = 8;        ///< CLAHE tiles per side
  int blurKernelSize = 5;       ///< Gaussian/median kernel size (odd)
  double deskewMinAngle = 0.5;  ///< Skew at or below this is left alone

  /**
   * @brief Check every field against its allowed range
   * @throws std::invalid_argument naming the first offending field
   */
  void validate() const;
};

/**
 * @brief Parse a blur name ("None", "Gaussian", "Median", any case)
 *
 * Unknown names fall back to BlurType::None and log a warning.
 */
BlurType parseBlurType(const std::string &name);

/**
 * @brief Canonical name of a blur type
 */
std::string blurTypeName(BlurType type);

/**
 * @brief Human readable description of a page segmentation mode
 * @return Description, or an empty string when mode is outside 0-13
 */
std::string pageSegModeDescription(int mode);

/**
 * @brief Human readable description of an engine mode
 * @return Description, or an empty string when mode is outside 0-3
 */
std::string engineModeDescription(int mode);

} // namespace dococr

#endif // DOCOCR_RECOGNITION_OPTIONS_HPP

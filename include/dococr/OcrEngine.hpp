#ifndef DOCOCR_OCR_ENGINE_HPP
#define DOCOCR_OCR_ENGINE_HPP

#include "dococr/RecognitionOptions.hpp"

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

namespace dococr {

/**
 * @brief Settings handed to the OCR engine for one invocation
 */
struct EngineConfig {
  int engineMode = 3;                     ///< --oem
  int pageSegMode = 3;                    ///< --psm
  std::string language = kEnglishLanguage; ///< -l
  std::optional<std::string> tessdataDir; ///< --tessdata-dir, '/' separated

  /**
   * @brief Render as a command-line style configuration string
   * @return e.g. "--oem 3 --psm 3 -l eng --tessdata-dir /opt/tessdata"
   */
  std::string toString() const;

  bool operator==(const EngineConfig &other) const;
  bool operator!=(const EngineConfig &other) const { return !(*this == other); }
};

/**
 * @brief Build the engine configuration for a recognition request
 *
 * The data directory override is only added when options.tessdataDir names
 * an existing directory; anything else is ignored without error.
 */
EngineConfig buildEngineConfig(const RecognitionOptions &options);

/**
 * @brief Per-word engine output as parallel columns
 *
 * Cells are kept as the engine reported them, so a malformed value only
 * affects its own row.
 */
struct WordTable {
  std::vector<std::string> text;       ///< Recognized token per row
  std::vector<std::string> confidence; ///< Confidence per row ("0"-"100", "-1")
  std::vector<cv::Rect> boxes;         ///< Bounding box per row

  size_t size() const { return text.size(); }
};

/**
 * @brief Parse Tesseract TSV output into a WordTable
 *
 * Accepts output with or without the "level page_num ..." header row. Rows
 * with fewer than 12 columns keep empty cells for the missing values.
 */
WordTable parseTsv(const std::string &tsv);

/**
 * @brief Interface of the external OCR engine
 */
class OcrEngine {
public:
  virtual ~OcrEngine() = default;

  /**
   * @brief Recognize words in an image
   * @param image Conditioned image
   * @param config Engine settings
   * @return One row per detected element, in engine order
   * @throws EngineNotFoundError if the engine or its language data is missing
   */
  virtual WordTable recognizeWords(const cv::Mat &image,
                                   const EngineConfig &config) = 0;
};

} // namespace dococr

#endif // DOCOCR_OCR_ENGINE_HPP

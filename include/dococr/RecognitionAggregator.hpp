#ifndef DOCOCR_RECOGNITION_AGGREGATOR_HPP
#define DOCOCR_RECOGNITION_AGGREGATOR_HPP

#include "dococr/OcrEngine.hpp"
#include "dococr/RecognitionOptions.hpp"

#include <opencv2/core.hpp>

#include <string>

namespace dococr {

/**
 * @brief Join the confident words of an engine table into one string
 *
 * A row is kept when its confidence parses, is at least minConfidence, and
 * its trimmed text is non-empty. Kept tokens are joined with single spaces in
 * table order. Rows whose cells cannot be read are logged and skipped.
 */
std::string aggregateWords(const WordTable &table, int minConfidence);

/**
 * @brief Runs the OCR engine on a conditioned image and aggregates its words
 */
class RecognitionAggregator {
public:
  explicit RecognitionAggregator(OcrEngine &engine);

  /**
   * @brief Recognize the conditioned image and return the raw text
   * @throws EngineNotFoundError if the engine is unavailable
   */
  std::string recognize(const cv::Mat &conditioned,
                        const RecognitionOptions &options);

private:
  OcrEngine &m_engine;
};

} // namespace dococr

#endif // DOCOCR_RECOGNITION_AGGREGATOR_HPP

#ifndef DOCOCR_OCR_PIPELINE_HPP
#define DOCOCR_OCR_PIPELINE_HPP

#include "dococr/Dictionary.hpp"
#include "dococr/ImageConditioner.hpp"
#include "dococr/OcrEngine.hpp"
#include "dococr/RecognitionOptions.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <string>
#include <utility>

namespace dococr {

/**
 * @brief Text extracted from one image
 *
 * width() and height() are those of the conditioned image that was given to
 * the OCR engine, not of the input file.
 */
class OcrResult {
public:
  OcrResult(std::string text, int width, int height)
      : m_text(std::move(text)), m_width(width), m_height(height) {}

  const std::string &text() const { return m_text; }
  int width() const { return m_width; }
  int height() const { return m_height; }

private:
  std::string m_text;
  int m_width;
  int m_height;
};

/**
 * @brief Result of OcrPipeline::recognize
 */
struct RecognitionOutput {
  OcrResult result;    ///< Final text and conditioned dimensions
  cv::Mat conditioned; ///< Binary image sent to the engine, for previews
};

/**
 * @brief Image to text: conditioning, OCR, aggregation and spell correction
 *
 * Each call owns its buffers; one pipeline runs one request at a time on
 * the calling thread.
 *
 * Example usage:
 * @code
 * auto engine = std::make_shared<dococr::TesseractEngine>();
 * dococr::OcrPipeline pipeline(engine);
 * dococr::RecognitionOptions options;
 * options.applySpellcheck = false;
 * auto output = pipeline.recognize("scan.jpg", options);
 * std::cout << output.result.text() << std::endl;
 * @endcode
 */
class OcrPipeline {
public:
  /**
   * @brief Constructor
   * @param engine OCR engine to run on conditioned images
   * @param dictionary English dictionary, or nullptr to disable correction
   */
  explicit OcrPipeline(std::shared_ptr<OcrEngine> engine,
                       std::shared_ptr<const Dictionary> dictionary = nullptr);

  /**
   * @brief Recognize the text of an image file
   * @throws std::invalid_argument if the options are invalid
   * @throws ImageLoadError if the image cannot be read or decoded
   * @throws EngineNotFoundError if the OCR engine is not available
   * @throws RecognitionError for any other failure, wrapping its cause
   */
  RecognitionOutput recognize(const std::string &imagePath,
                              const RecognitionOptions &options);

  /**
   * @brief Recognize the text of an image already in memory
   */
  RecognitionOutput recognize(const cv::Mat &image,
                              const RecognitionOptions &options);

private:
  RecognitionOutput recognizeConditioned(const cv::Mat &conditioned,
                                         const RecognitionOptions &options);

  std::string postprocess(const std::string &rawText,
                          const RecognitionOptions &options) const;

  std::shared_ptr<OcrEngine> m_engine;
  std::shared_ptr<const Dictionary> m_dictionary;
  ImageConditioner m_conditioner;
};

} // namespace dococr

#endif // DOCOCR_OCR_PIPELINE_HPP

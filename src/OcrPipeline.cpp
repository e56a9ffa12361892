#include "dococr/OcrPipeline.hpp"

#include "dococr/Errors.hpp"
#include "dococr/RecognitionAggregator.hpp"
#include "dococr/TextCorrector.hpp"

#include <iostream>
#include <stdexcept>

namespace dococr {

OcrPipeline::OcrPipeline(std::shared_ptr<OcrEngine> engine,
                         std::shared_ptr<const Dictionary> dictionary)
    : m_engine(std::move(engine)), m_dictionary(std::move(dictionary)) {
  if (!m_engine) {
    throw std::invalid_argument("OcrPipeline requires an OCR engine");
  }
}

RecognitionOutput OcrPipeline::recognize(const std::string &imagePath,
                                         const RecognitionOptions &options) {
  options.validate();

  std::cerr << "Performing OCR on: " << imagePath << " with lang='"
            << options.language << "', psm=" << options.pageSegMode
            << ", oem=" << options.engineMode << ", blur='"
            << blurTypeName(options.blurType) << "'" << std::endl;

  // Throws ImageLoadError or RecognitionError only
  cv::Mat conditioned = m_conditioner.condition(imagePath, options);
  return recognizeConditioned(conditioned, options);
}

RecognitionOutput OcrPipeline::recognize(const cv::Mat &image,
                                         const RecognitionOptions &options) {
  options.validate();

  cv::Mat conditioned = m_conditioner.condition(image, options);
  return recognizeConditioned(conditioned, options);
}

RecognitionOutput
OcrPipeline::recognizeConditioned(const cv::Mat &conditioned,
                                  const RecognitionOptions &options) {
  try {
    RecognitionAggregator aggregator(*m_engine);
    std::string rawText = aggregator.recognize(conditioned, options);

    OcrResult result(postprocess(rawText, options), conditioned.cols,
                     conditioned.rows);
    return {std::move(result), conditioned};
  } catch (const EngineNotFoundError &e) {
    std::cerr << "OCR engine not found: " << e.what() << std::endl;
    throw;
  } catch (const std::exception &e) {
    std::cerr << "Error during OCR processing: " << e.what() << std::endl;
    throw RecognitionError("An unexpected error occurred during OCR",
                           std::current_exception());
  }
}

std::string OcrPipeline::postprocess(const std::string &rawText,
                                     const RecognitionOptions &options) const {
  if (!options.applySpellcheck) {
    std::cerr << "Skipping spell check." << std::endl;
    return rawText;
  }
  if (!m_dictionary) {
    std::cerr << "Warning: spell check requested but no dictionary is "
                 "loaded. Skipping spell check."
              << std::endl;
    return rawText;
  }

  TextCorrector corrector(*m_dictionary);
  return corrector.correct(rawText, options.language).text;
}

} // namespace dococr

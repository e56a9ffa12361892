#include "dococr/RecognitionAggregator.hpp"

#include <iostream>
#include <stdexcept>
#include <vector>

namespace dococr {

namespace {

std::string trim(const std::string &text) {
  const char *whitespace = " \t\n\r\f\v";
  size_t start = text.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(whitespace);
  return text.substr(start, end - start + 1);
}

} // namespace

std::string aggregateWords(const WordTable &table, int minConfidence) {
  std::vector<std::string> kept;

  for (size_t i = 0; i < table.size(); ++i) {
    try {
      float confidence = std::stof(table.confidence.at(i));
      std::string word = trim(table.text.at(i));

      if (confidence >= static_cast<float>(minConfidence) && !word.empty()) {
        kept.push_back(word);
      }
    } catch (const std::logic_error &e) {
      // std::stof and at() report bad cells as invalid_argument/out_of_range
      std::cerr << "Warning: Skipping box index " << i
                << " due to data error: " << e.what() << std::endl;
    }
  }

  std::cerr << "Processed " << kept.size() << " words with confidence >= "
            << minConfidence << "%" << std::endl;

  std::string joined;
  for (const auto &word : kept) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += word;
  }
  return trim(joined);
}

RecognitionAggregator::RecognitionAggregator(OcrEngine &engine)
    : m_engine(engine) {}

std::string RecognitionAggregator::recognize(const cv::Mat &conditioned,
                                             const RecognitionOptions &options) {
  EngineConfig config = buildEngineConfig(options);
  std::cerr << "Running OCR with config: " << config.toString() << std::endl;

  WordTable table = m_engine.recognizeWords(conditioned, config);
  if (table.size() == 0) {
    std::cerr << "OCR engine returned no text boxes." << std::endl;
  }

  return aggregateWords(table, options.minConfidence);
}

} // namespace dococr

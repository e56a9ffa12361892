#include "dococr/RecognitionOptions.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace dococr {

namespace {

const std::array<const char *, 14> kPageSegModes = {
    "Orientation and script detection (OSD) only.",
    "Automatic page segmentation with OSD.",
    "Automatic page segmentation, but no OSD, or OCR.",
    "Fully automatic page segmentation, but no OSD. (Default)",
    "Assume a single column of text of variable sizes.",
    "Assume a single uniform block of vertically aligned text.",
    "Assume a single uniform block of text.",
    "Treat the image as a single text line.",
    "Treat the image as a single word.",
    "Treat the image as a single word in a circle.",
    "Treat the image as a single character.",
    "Sparse text. Find as much text as possible in no particular order.",
    "Sparse text with OSD.",
    "Raw line. Treat the image as a single text line, bypassing "
    "Tesseract-specific hacks."};

const std::array<const char *, 4> kEngineModes = {
    "Legacy engine only.", "Neural nets LSTM engine only.",
    "Legacy + LSTM engines.", "Default, based on what is available."};

void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::invalid_argument("Invalid recognition options: " + message);
  }
}

} // namespace

void RecognitionOptions::validate() const {
  require(!language.empty(), "language must not be empty");
  require(pageSegMode >= 0 && pageSegMode <= 13,
          "page segmentation mode must be in 0-13, got " +
              std::to_string(pageSegMode));
  require(engineMode >= 0 && engineMode <= 3,
          "engine mode must be in 0-3, got " + std::to_string(engineMode));
  require(minConfidence >= 0 && minConfidence <= 100,
          "minimum confidence must be in 0-100, got " +
              std::to_string(minConfidence));
  require(adaptiveBlockSize >= 3 && adaptiveBlockSize % 2 == 1,
          "adaptive block size must be odd and at least 3, got " +
              std::to_string(adaptiveBlockSize));
  require(blurKernelSize >= 3 && blurKernelSize % 2 == 1,
          "blur kernel size must be odd and at least 3, got " +
              std::to_string(blurKernelSize));
  require(claheClipLimit > 0.0, "CLAHE clip limit must be positive");
  require(claheTileGrid > 0, "CLAHE tile grid must be positive");
  require(deskewMinAngle >= 0.0, "deskew threshold must not be negative");
}

BlurType parseBlurType(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "gaussian") {
    return BlurType::Gaussian;
  }
  if (lower == "median") {
    return BlurType::Median;
  }
  if (lower != "none") {
    std::cerr << "Warning: Unknown blur type '" << name
              << "'. Skipping blur." << std::endl;
  }
  return BlurType::None;
}

std::string blurTypeName(BlurType type) {
  switch (type) {
  case BlurType::Gaussian:
    return "Gaussian";
  case BlurType::Median:
    return "Median";
  case BlurType::None:
  default:
    return "None";
  }
}

std::string pageSegModeDescription(int mode) {
  if (mode < 0 || mode >= static_cast<int>(kPageSegModes.size())) {
    return "";
  }
  return kPageSegModes[mode];
}

std::string engineModeDescription(int mode) {
  if (mode < 0 || mode >= static_cast<int>(kEngineModes.size())) {
    return "";
  }
  return kEngineModes[mode];
}

} // namespace dococr

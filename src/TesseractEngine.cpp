#include "dococr/TesseractEngine.hpp"

#include "dococr/Errors.hpp"

#include <opencv2/imgproc.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace dococr {

namespace {

// Where distribution packages install language data; used when no data path
// is configured and libtesseract falls back to its compiled-in default.
const char *const kDefaultTessdataDirs[] = {
    "/usr/share/tesseract-ocr/5/tessdata",
    "/usr/share/tesseract-ocr/4.00/tessdata",
    "/usr/share/tessdata",
    "/usr/local/share/tessdata",
    "/opt/homebrew/share/tessdata",
};

bool holdsTrainedData(const std::filesystem::path &directory) {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    return false;
  }
  for (std::filesystem::directory_iterator it(directory, ec), end;
       !ec && it != end; it.increment(ec)) {
    if (it->path().extension() == ".traineddata") {
      return true;
    }
  }
  return false;
}

/**
 * @brief Whether a usable language data directory exists
 *
 * Tesseract accepts either the tessdata directory itself or its parent.
 */
bool languageDataAvailable(const char *dataPath) {
  if (dataPath != nullptr) {
    std::filesystem::path directory(dataPath);
    return holdsTrainedData(directory) ||
           holdsTrainedData(directory / "tessdata");
  }
  for (const char *directory : kDefaultTessdataDirs) {
    if (holdsTrainedData(directory)) {
      return true;
    }
  }
  return false;
}

} // namespace

TesseractEngine::TesseractEngine()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()) {}

TesseractEngine::TesseractEngine(const std::string &defaultDataPath)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()),
      m_defaultDataPath(defaultDataPath) {}

TesseractEngine::~TesseractEngine() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

TesseractEngine::TesseractEngine(TesseractEngine &&other) noexcept
    : m_tesseract(std::move(other.m_tesseract)),
      m_defaultDataPath(std::move(other.m_defaultDataPath)),
      m_activeConfig(std::move(other.m_activeConfig)) {
  other.m_activeConfig.reset();
}

TesseractEngine &TesseractEngine::operator=(TesseractEngine &&other) noexcept {
  if (this != &other) {
    if (m_tesseract) {
      m_tesseract->End();
    }
    m_tesseract = std::move(other.m_tesseract);
    m_defaultDataPath = std::move(other.m_defaultDataPath);
    m_activeConfig = std::move(other.m_activeConfig);
    other.m_activeConfig.reset();
  }
  return *this;
}

WordTable TesseractEngine::recognizeWords(const cv::Mat &image,
                                          const EngineConfig &config) {
  if (image.empty()) {
    throw std::runtime_error("Input image is empty");
  }

  initialize(config);
  m_tesseract->SetPageSegMode(
      static_cast<tesseract::PageSegMode>(config.pageSegMode));

  setImage(image);
  if (m_tesseract->Recognize(nullptr) != 0) {
    throw std::runtime_error("Tesseract recognition failed");
  }

  std::unique_ptr<char[]> tsv(m_tesseract->GetTSVText(0));
  if (!tsv) {
    return WordTable();
  }
  return parseTsv(tsv.get());
}

std::vector<std::string>
TesseractEngine::availableLanguages(const EngineConfig &config) {
  initialize(config);

  std::vector<std::string> languages;
  m_tesseract->GetAvailableLanguagesAsVector(&languages);
  return languages;
}

std::string TesseractEngine::version() {
  return tesseract::TessBaseAPI::Version();
}

void TesseractEngine::initialize(const EngineConfig &config) {
  if (m_activeConfig && *m_activeConfig == config) {
    return;
  }

  if (!m_tesseract) {
    m_tesseract = std::make_unique<tesseract::TessBaseAPI>();
  }
  if (m_activeConfig) {
    m_tesseract->End();
    m_activeConfig.reset();
  }

  const char *dataPath = resolveDataPath(config);
  int result = m_tesseract->Init(
      dataPath, config.language.c_str(),
      static_cast<tesseract::OcrEngineMode>(config.engineMode));

  if (result != 0) {
    std::cerr << "Failed to initialize Tesseract with language: "
              << config.language << std::endl;
    const std::string where =
        dataPath ? " with data path '" + std::string(dataPath) + "'"
                 : std::string();
    if (!languageDataAvailable(dataPath)) {
      throw EngineNotFoundError(
          "Tesseract language data could not be found" + where +
          ". Make sure Tesseract and its language data are installed.");
    }
    throw std::runtime_error("Tesseract could not load language '" +
                             config.language + "' (engine mode " +
                             std::to_string(config.engineMode) + ")" + where);
  }

  m_activeConfig = config;
}

const char *TesseractEngine::resolveDataPath(const EngineConfig &config) const {
  if (config.tessdataDir) {
    return config.tessdataDir->c_str();
  }
  if (!m_defaultDataPath.empty()) {
    return m_defaultDataPath.c_str();
  }
  const char *envPath = std::getenv("TESSDATA_PREFIX");
  if (envPath != nullptr && *envPath != '\0') {
    return envPath;
  }
  return nullptr;
}

void TesseractEngine::setImage(const cv::Mat &image) {
  cv::Mat gray;

  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image.isContinuous() ? image : image.clone();
  }

  m_tesseract->SetImage(gray.data, gray.cols, gray.rows, 1,
                        static_cast<int>(gray.step));
}

} // namespace dococr

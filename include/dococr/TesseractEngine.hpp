#ifndef DOCOCR_TESSERACT_ENGINE_HPP
#define DOCOCR_TESSERACT_ENGINE_HPP

#include "dococr/OcrEngine.hpp"

#include <tesseract/baseapi.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dococr {

/**
 * @brief OcrEngine backed by the Tesseract C++ API
 *
 * The language data directory is resolved per call, first match wins:
 * the --tessdata-dir of the EngineConfig, the data path given to the
 * constructor, the TESSDATA_PREFIX environment variable, and finally the
 * default compiled into libtesseract.
 *
 * The underlying TessBaseAPI is initialised lazily and only re-initialised
 * when the engine mode, language or data directory changes.
 */
class TesseractEngine : public OcrEngine {
public:
  TesseractEngine();

  /**
   * @brief Constructor with an explicit default data path
   * @param defaultDataPath tessdata directory used when the config has none
   */
  explicit TesseractEngine(const std::string &defaultDataPath);

  ~TesseractEngine() override;

  // Disable copy operations (Tesseract API is not copyable)
  TesseractEngine(const TesseractEngine &) = delete;
  TesseractEngine &operator=(const TesseractEngine &) = delete;

  TesseractEngine(TesseractEngine &&other) noexcept;
  TesseractEngine &operator=(TesseractEngine &&other) noexcept;

  /**
   * @brief Run Tesseract and return its word level TSV output as a table
   * @throws EngineNotFoundError if no language data directory can be found
   * @throws std::runtime_error if the requested language or engine mode
   *         cannot be loaded, or recognition itself fails
   */
  WordTable recognizeWords(const cv::Mat &image,
                           const EngineConfig &config) override;

  /**
   * @brief Languages installed in the data directory the config resolves to
   * @throws EngineNotFoundError if no language data directory can be found
   * @throws std::runtime_error if Tesseract cannot be initialised
   */
  std::vector<std::string> availableLanguages(const EngineConfig &config);

  /**
   * @brief Get the Tesseract version string
   */
  static std::string version();

private:
  void initialize(const EngineConfig &config);
  void setImage(const cv::Mat &image);
  const char *resolveDataPath(const EngineConfig &config) const;

  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
  std::string m_defaultDataPath;
  std::optional<EngineConfig> m_activeConfig; ///< Config of the last Init
};

} // namespace dococr

#endif // DOCOCR_TESSERACT_ENGINE_HPP

#ifndef DOCOCR_ERRORS_HPP
#define DOCOCR_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>

namespace dococr {

/**
 * @brief The input image is missing, unreadable or cannot be decoded
 */
class ImageLoadError : public std::runtime_error {
public:
  explicit ImageLoadError(const std::string &imagePath)
      : std::runtime_error("Failed to load image: " + imagePath),
        m_imagePath(imagePath) {}

  const std::string &imagePath() const { return m_imagePath; }

private:
  std::string m_imagePath;
};

/**
 * @brief The OCR engine (or its language data) could not be located
 *
 * Raised separately from RecognitionError so that callers can tell the user
 * to install the engine instead of reporting a generic failure.
 */
class EngineNotFoundError : public std::runtime_error {
public:
  explicit EngineNotFoundError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Any other failure during conditioning or engine invocation
 *
 * Keeps the original exception so it can be rethrown or inspected.
 */
class RecognitionError : public std::runtime_error {
public:
  RecognitionError(const std::string &message, std::exception_ptr cause)
      : std::runtime_error(message + describe(cause)), m_cause(cause) {}

  std::exception_ptr cause() const { return m_cause; }

private:
  static std::string describe(std::exception_ptr cause) {
    if (!cause) {
      return "";
    }
    try {
      std::rethrow_exception(cause);
    } catch (const std::exception &e) {
      return std::string(": ") + e.what();
    } catch (...) {
      return ": unknown error";
    }
  }

  std::exception_ptr m_cause;
};

} // namespace dococr

#endif // DOCOCR_ERRORS_HPP

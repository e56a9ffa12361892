#ifndef DOCOCR_TEXT_CORRECTOR_HPP
#define DOCOCR_TEXT_CORRECTOR_HPP

#include "dococr/Dictionary.hpp"

#include <string>

namespace dococr {

/**
 * @brief Result of a spell correction pass
 */
struct CorrectionOutcome {
  enum class Status {
    Corrected, ///< at least one word was replaced
    Unchanged  ///< text is the input, untouched
  };

  Status status;
  std::string text;

  bool corrected() const { return status == Status::Corrected; }
};

/**
 * @brief Dictionary based spelling correction of recognized text
 *
 * Only English text is corrected. Every unknown word is looked up once and
 * its correction replaces all whole-word, case-insensitive occurrences in
 * the text, keeping the upper/capitalised shape of each occurrence.
 * Failures are logged and leave the text unchanged.
 */
class TextCorrector {
public:
  explicit TextCorrector(const Dictionary &dictionary);

  CorrectionOutcome correct(const std::string &text,
                            const std::string &language) const;

private:
  const Dictionary &m_dictionary;
};

/**
 * @brief Replace whole-word occurrences of word, ignoring case
 *
 * Words are runs of ASCII letters, digits, underscores and non-ASCII (UTF-8)
 * bytes.
 * An all upper-case occurrence gets an upper-case replacement, a capitalised
 * one a capitalised replacement; others get the replacement as given.
 */
std::string replaceWholeWord(const std::string &text, const std::string &word,
                             const std::string &replacement);

} // namespace dococr

#endif // DOCOCR_TEXT_CORRECTOR_HPP

#include "dococr/TextCorrector.hpp"

#include "dococr/RecognitionOptions.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <utility>
#include <vector>

namespace dococr {

namespace {

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::string toUpper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

bool isAllUpper(const std::string &text) {
  bool hasLetter = false;
  for (unsigned char c : text) {
    if (std::islower(c)) {
      return false;
    }
    hasLetter = hasLetter || std::isupper(c);
  }
  return hasLetter;
}

std::string matchCase(const std::string &occurrence,
                      const std::string &replacement) {
  if (occurrence.size() > 1 && isAllUpper(occurrence)) {
    return toUpper(replacement);
  }
  if (!occurrence.empty() &&
      std::isupper(static_cast<unsigned char>(occurrence[0]))) {
    std::string capitalised = replacement;
    if (!capitalised.empty()) {
      capitalised[0] = static_cast<char>(
          std::toupper(static_cast<unsigned char>(capitalised[0])));
    }
    return capitalised;
  }
  return replacement;
}

// Bytes of multi-byte UTF-8 sequences count as letters, so accented words
// stay whole.
bool isWordByte(char c) {
  unsigned char byte = static_cast<unsigned char>(c);
  return byte >= 0x80 || std::isalnum(byte) || byte == '_';
}

/**
 * @brief Split text into maximal runs of word bytes
 * @return [begin, end) offsets of every word
 */
std::vector<std::pair<size_t, size_t>> wordSpans(const std::string &text) {
  std::vector<std::pair<size_t, size_t>> spans;
  size_t i = 0;
  while (i < text.size()) {
    if (!isWordByte(text[i])) {
      ++i;
      continue;
    }
    size_t begin = i;
    while (i < text.size() && isWordByte(text[i])) {
      ++i;
    }
    spans.emplace_back(begin, i);
  }
  return spans;
}

} // namespace

std::string replaceWholeWord(const std::string &text, const std::string &word,
                             const std::string &replacement) {
  const std::string target = toLower(word);

  std::string result;
  size_t last = 0;
  for (const auto &span : wordSpans(text)) {
    std::string occurrence = text.substr(span.first, span.second - span.first);
    if (toLower(occurrence) != target) {
      continue;
    }
    result.append(text, last, span.first - last);
    result += matchCase(occurrence, replacement);
    last = span.second;
  }
  result.append(text, last, std::string::npos);
  return result;
}

TextCorrector::TextCorrector(const Dictionary &dictionary)
    : m_dictionary(dictionary) {}

CorrectionOutcome TextCorrector::correct(const std::string &text,
                                         const std::string &language) const {
  if (language != kEnglishLanguage) {
    std::cerr << "Skipping spell check: not available for language '"
              << language << "'." << std::endl;
    return {CorrectionOutcome::Status::Unchanged, text};
  }

  try {
    const std::string lower = toLower(text);

    std::set<std::string> words;
    for (const auto &span : wordSpans(lower)) {
      std::string word = lower.substr(span.first, span.second - span.first);
      if (!isNumber(word)) {
        words.insert(word);
      }
    }
    if (words.empty()) {
      return {CorrectionOutcome::Status::Unchanged, text};
    }

    std::set<std::string> misspelled = m_dictionary.unknown(words);
    std::cerr << "Found " << misspelled.size()
              << " potentially unknown words." << std::endl;

    std::string corrected = text;
    bool changed = false;
    for (const auto &word : misspelled) {
      std::optional<std::string> suggestion = m_dictionary.correction(word);
      if (!suggestion || *suggestion == word) {
        continue;
      }
      std::cerr << "Correcting '" << word << "' -> '" << *suggestion << "'"
                << std::endl;
      corrected = replaceWholeWord(corrected, word, *suggestion);
      changed = true;
    }

    if (!changed) {
      return {CorrectionOutcome::Status::Unchanged, text};
    }
    return {CorrectionOutcome::Status::Corrected, corrected};
  } catch (const std::exception &e) {
    std::cerr << "Error during spell checking: " << e.what()
              << ". Returning original text." << std::endl;
    return {CorrectionOutcome::Status::Unchanged, text};
  }
}

} // namespace dococr

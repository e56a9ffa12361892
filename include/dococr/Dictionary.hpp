#ifndef DOCOCR_DICTIONARY_HPP
#define DOCOCR_DICTIONARY_HPP

#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace dococr {

/**
 * @brief Spelling dictionary used by the text corrector
 */
class Dictionary {
public:
  virtual ~Dictionary() = default;

  /**
   * @brief Subset of the given lower-case words that are not known
   */
  virtual std::set<std::string>
  unknown(const std::set<std::string> &words) const = 0;

  /**
   * @brief Best single correction for a lower-case word
   * @return The correction, or std::nullopt if there is no candidate
   */
  virtual std::optional<std::string>
  correction(const std::string &word) const = 0;
};

/**
 * @brief True if the word parses completely as a decimal number
 *
 * Numbers are never spell checked.
 */
bool isNumber(const std::string &word);

/**
 * @brief Word frequency dictionary with edit distance based correction
 *
 * Candidates are the known words one edit away (delete, transpose, replace,
 * insert over a-z), or two edits away when there are none. The most frequent
 * candidate wins; ties go to the lexicographically smaller word. Words more
 * than three characters longer than the longest known word get no correction.
 */
class FrequencyDictionary : public Dictionary {
public:
  FrequencyDictionary() = default;

  /**
   * @brief Load a dictionary file
   *
   * Each line holds a word, optionally followed by whitespace and a
   * frequency count (default 1). Words are lower-cased; repeated words add
   * up their counts.
   *
   * @throws std::runtime_error if the file cannot be opened
   */
  static FrequencyDictionary load(const std::string &filePath);

  /**
   * @brief Add a word, or increase the frequency of a known one
   */
  void addWord(const std::string &word, long frequency = 1);

  bool contains(const std::string &word) const;
  long frequency(const std::string &word) const;
  size_t size() const { return m_frequencies.size(); }
  size_t longestWord() const { return m_longestWord; }

  std::set<std::string>
  unknown(const std::set<std::string> &words) const override;

  std::optional<std::string>
  correction(const std::string &word) const override;

private:
  static std::set<std::string> edits1(const std::string &word);
  std::optional<std::string>
  mostFrequent(const std::set<std::string> &candidates) const;

  std::unordered_map<std::string, long> m_frequencies;
  size_t m_longestWord = 0; ///< length of the longest known word
};

} // namespace dococr

#endif // DOCOCR_DICTIONARY_HPP

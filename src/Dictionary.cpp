#include "dococr/Dictionary.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace dococr {

namespace {

const std::string kLetters = "abcdefghijklmnopqrstuvwxyz";
const size_t kMaxLengthSlack = 3;

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

} // namespace

bool isNumber(const std::string &word) {
  if (word.empty()) {
    return false;
  }
  unsigned char first = static_cast<unsigned char>(word[0]);
  if (!std::isdigit(first) && first != '-' && first != '+' && first != '.') {
    return false;
  }
  // strtod also reads hexadecimal
  if (word.find_first_of("xXpP") != std::string::npos) {
    return false;
  }
  char *end = nullptr;
  std::strtod(word.c_str(), &end);
  return end == word.c_str() + word.size();
}

FrequencyDictionary FrequencyDictionary::load(const std::string &filePath) {
  std::ifstream file(filePath);
  if (!file.is_open()) {
    throw std::runtime_error("Could not open dictionary file: " + filePath);
  }

  FrequencyDictionary dictionary;
  std::string line;
  while (std::getline(file, line)) {
    std::istringstream fields(line);
    std::string word;
    long count = 1;
    if (!(fields >> word)) {
      continue;
    }
    if (!(fields >> count) || count <= 0) {
      count = 1;
    }
    dictionary.addWord(word, count);
  }
  return dictionary;
}

void FrequencyDictionary::addWord(const std::string &word, long frequency) {
  if (word.empty()) {
    return;
  }
  m_frequencies[toLower(word)] += frequency;
  m_longestWord = std::max(m_longestWord, word.size());
}

bool FrequencyDictionary::contains(const std::string &word) const {
  return m_frequencies.count(word) > 0;
}

long FrequencyDictionary::frequency(const std::string &word) const {
  auto it = m_frequencies.find(word);
  return it == m_frequencies.end() ? 0 : it->second;
}

std::set<std::string>
FrequencyDictionary::unknown(const std::set<std::string> &words) const {
  std::set<std::string> result;
  for (const auto &word : words) {
    if (!isNumber(word) && !contains(word)) {
      result.insert(word);
    }
  }
  return result;
}

std::optional<std::string>
FrequencyDictionary::correction(const std::string &word) const {
  if (isNumber(word) || contains(word)) {
    return word;
  }
  // Two edits cannot bridge a longer gap to any known word
  if (word.size() > m_longestWord + kMaxLengthSlack) {
    return std::nullopt;
  }

  std::set<std::string> first = edits1(word);
  if (auto best = mostFrequent(first)) {
    return best;
  }

  std::set<std::string> second;
  for (const auto &edit : first) {
    for (auto &candidate : edits1(edit)) {
      if (contains(candidate)) {
        second.insert(candidate);
      }
    }
  }
  return mostFrequent(second);
}

std::set<std::string> FrequencyDictionary::edits1(const std::string &word) {
  std::set<std::string> edits;

  for (size_t i = 0; i <= word.size(); ++i) {
    std::string left = word.substr(0, i);
    std::string right = word.substr(i);

    if (!right.empty()) {
      edits.insert(left + right.substr(1));
    }
    if (right.size() > 1) {
      edits.insert(left + right[1] + right[0] + right.substr(2));
    }
    for (char c : kLetters) {
      if (!right.empty()) {
        edits.insert(left + c + right.substr(1));
      }
      edits.insert(left + c + right);
    }
  }

  return edits;
}

std::optional<std::string>
FrequencyDictionary::mostFrequent(const std::set<std::string> &candidates) const {
  std::optional<std::string> best;
  long bestFrequency = 0;

  // std::set iterates in order, so the first of equal counts is kept
  for (const auto &candidate : candidates) {
    long count = frequency(candidate);
    if (count > bestFrequency) {
      bestFrequency = count;
      best = candidate;
    }
  }
  return best;
}

} // namespace dococr

#include "dococr/Dictionary.hpp"

#include "test_images.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <set>
#include <stdexcept>

using dococr::FrequencyDictionary;

namespace {

FrequencyDictionary smallDictionary() {
  FrequencyDictionary dictionary;
  dictionary.addWord("the", 1000);
  dictionary.addWord("quick", 50);
  dictionary.addWord("brown", 40);
  dictionary.addWord("fox", 30);
  dictionary.addWord("then", 200);
  dictionary.addWord("ten", 100);
  return dictionary;
}

} // namespace

TEST(FrequencyDictionaryTest, ReportsUnknownWords) {
  FrequencyDictionary dictionary = smallDictionary();
  std::set<std::string> unknown =
      dictionary.unknown({"teh", "quick", "qick", "fox"});
  EXPECT_EQ(unknown, (std::set<std::string>{"qick", "teh"}));
}

TEST(FrequencyDictionaryTest, KnownWordIsItsOwnCorrection) {
  FrequencyDictionary dictionary = smallDictionary();
  EXPECT_EQ(dictionary.correction("brown"), "brown");
}

TEST(FrequencyDictionaryTest, PrefersMostFrequentSingleEdit) {
  FrequencyDictionary dictionary = smallDictionary();
  // "teh" is one edit from "the" (transpose), "ten" (replace)
  EXPECT_EQ(dictionary.correction("teh"), "the");
  EXPECT_EQ(dictionary.correction("qick"), "quick");
}

TEST(FrequencyDictionaryTest, FallsBackToTwoEdits) {
  FrequencyDictionary dictionary = smallDictionary();
  EXPECT_EQ(dictionary.correction("brwnn"), "brown");
}

TEST(FrequencyDictionaryTest, NoCandidateGivesNothing) {
  FrequencyDictionary dictionary = smallDictionary();
  EXPECT_FALSE(dictionary.correction("zzzzzzzz").has_value());
}

TEST(FrequencyDictionaryTest, TiesResolveAlphabetically) {
  FrequencyDictionary dictionary;
  dictionary.addWord("bat", 5);
  dictionary.addWord("cat", 5);
  EXPECT_EQ(dictionary.correction("aat"), "bat");
}

TEST(FrequencyDictionaryTest, LoadsWordListAndCounts) {
  std::string path = dococr::testing::tempPath("dictionary.txt");
  {
    std::ofstream file(path);
    file << "The 120\n"
         << "quick\n"
         << "\n"
         << "the 30\n"
         << "Fox 7\n";
  }

  FrequencyDictionary dictionary = FrequencyDictionary::load(path);
  EXPECT_EQ(dictionary.size(), 3u);
  EXPECT_EQ(dictionary.frequency("the"), 150);
  EXPECT_EQ(dictionary.frequency("quick"), 1);
  EXPECT_TRUE(dictionary.contains("fox"));
  EXPECT_FALSE(dictionary.contains("Fox"));

  std::remove(path.c_str());
}

TEST(FrequencyDictionaryTest, MissingFileThrows) {
  EXPECT_THROW(
      FrequencyDictionary::load(dococr::testing::tempPath("no_such_dict.txt")),
      std::runtime_error);
}

TEST(FrequencyDictionaryTest, NumbersAreNeverUnknown) {
  FrequencyDictionary dictionary;
  dictionary.addWord("a", 10);
  dictionary.addWord("at", 10);

  EXPECT_EQ(dictionary.unknown({"7", "12", "2024", "1e5", "ab"}),
            (std::set<std::string>{"ab"}));
  EXPECT_EQ(dictionary.correction("7"), "7");
  EXPECT_EQ(dictionary.correction("12"), "12");
}

TEST(FrequencyDictionaryTest, RecognisesNumbers) {
  EXPECT_TRUE(dococr::isNumber("2024"));
  EXPECT_TRUE(dococr::isNumber("3.5"));
  EXPECT_TRUE(dococr::isNumber("1e5"));
  EXPECT_FALSE(dococr::isNumber(""));
  EXPECT_FALSE(dococr::isNumber("12th"));
  EXPECT_FALSE(dococr::isNumber("nan"));
  EXPECT_FALSE(dococr::isNumber("inf"));
  EXPECT_FALSE(dococr::isNumber("0x1f"));
}

TEST(FrequencyDictionaryTest, TracksLongestWord) {
  FrequencyDictionary dictionary;
  EXPECT_EQ(dictionary.longestWord(), 0u);
  dictionary.addWord("cat");
  dictionary.addWord("dog");
  EXPECT_EQ(dictionary.longestWord(), 3u);
  dictionary.addWord("horse");
  EXPECT_EQ(dictionary.longestWord(), 5u);
}

TEST(FrequencyDictionaryTest, OverlongWordsGetNoCorrection) {
  FrequencyDictionary dictionary;
  dictionary.addWord("cat", 10);

  // Within two edits and within the length limit
  EXPECT_EQ(dictionary.correction("catxx"), "cat");
  EXPECT_FALSE(dictionary.correction("catxxxx").has_value());
  EXPECT_FALSE(
      dictionary.correction("qwrtplkjhgfdszxcvbnmqwrtplkjh").has_value());
}

#include "dococr/TextCorrector.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using dococr::CorrectionOutcome;
using dococr::FrequencyDictionary;
using dococr::TextCorrector;

namespace {

FrequencyDictionary englishWords() {
  FrequencyDictionary dictionary;
  for (const char *word : {"the", "quick", "brown", "fox", "jumps", "over",
                           "lazy", "dog", "a", "and", "saw", "is", "this",
                           "test"}) {
    dictionary.addWord(word, 10);
  }
  dictionary.addWord("the", 1000);
  return dictionary;
}

class ThrowingDictionary : public dococr::Dictionary {
public:
  std::set<std::string>
  unknown(const std::set<std::string> &words) const override {
    return words;
  }

  std::optional<std::string>
  correction(const std::string &) const override {
    throw std::runtime_error("dictionary backend unavailable");
  }
};

} // namespace

TEST(TextCorrectorTest, CorrectsMisspelledWords) {
  FrequencyDictionary dictionary = englishWords();
  TextCorrector corrector(dictionary);

  CorrectionOutcome outcome = corrector.correct("Teh qick brown fox", "eng");
  EXPECT_TRUE(outcome.corrected());
  EXPECT_EQ(outcome.text, "The quick brown fox");
}

TEST(TextCorrectorTest, CorrectTextIsUnchanged) {
  FrequencyDictionary dictionary = englishWords();
  TextCorrector corrector(dictionary);

  const std::string text = "The quick brown fox jumps over the lazy dog.";
  CorrectionOutcome outcome = corrector.correct(text, "eng");
  EXPECT_FALSE(outcome.corrected());
  EXPECT_EQ(outcome.text, text);
}

TEST(TextCorrectorTest, NonEnglishIsNeverTouched) {
  FrequencyDictionary dictionary = englishWords();
  TextCorrector corrector(dictionary);

  for (const char *language : {"ind", "ind+eng", "deu", "ENG"}) {
    CorrectionOutcome outcome = corrector.correct("Teh qick brown fox", language);
    EXPECT_EQ(outcome.status, CorrectionOutcome::Status::Unchanged) << language;
    EXPECT_EQ(outcome.text, "Teh qick brown fox") << language;
  }
}

TEST(TextCorrectorTest, ReplacesEveryOccurrence) {
  FrequencyDictionary dictionary = englishWords();
  TextCorrector corrector(dictionary);

  CorrectionOutcome outcome =
      corrector.correct("teh dog saw TEH fox and Teh dog", "eng");
  EXPECT_EQ(outcome.text, "the dog saw THE fox and The dog");
}

TEST(TextCorrectorTest, OnlyWholeWordsAreReplaced) {
  FrequencyDictionary dictionary = englishWords();
  TextCorrector corrector(dictionary);

  // "tehxyzq" is an unknown token with no candidate within two edits
  CorrectionOutcome outcome = corrector.correct("teh tehxyzq", "eng");
  EXPECT_EQ(outcome.text, "the tehxyzq");
}

TEST(TextCorrectorTest, TextWithoutWordsIsUnchanged) {
  FrequencyDictionary dictionary = englishWords();
  TextCorrector corrector(dictionary);

  EXPECT_EQ(corrector.correct("", "eng").text, "");
  EXPECT_EQ(corrector.correct(" -- !! ", "eng").text, " -- !! ");
}

TEST(TextCorrectorTest, NumbersAreNeverCorrected) {
  FrequencyDictionary dictionary;
  for (const char *word : {"a", "at", "invoice", "total", "page", "is"}) {
    dictionary.addWord(word, 10);
  }
  TextCorrector corrector(dictionary);

  const std::string text = "Invoice 7 total 12 page 2024";
  CorrectionOutcome outcome = corrector.correct(text, "eng");
  EXPECT_FALSE(outcome.corrected());
  EXPECT_EQ(outcome.text, text);

  outcome = corrector.correct("Invoice 7 totl 12", "eng");
  EXPECT_EQ(outcome.text, "Invoice 7 total 12");
}

TEST(TextCorrectorTest, AccentedWordsStayWhole) {
  FrequencyDictionary dictionary;
  for (const char *word : {"my", "is", "attached", "here"}) {
    dictionary.addWord(word, 10);
  }
  TextCorrector corrector(dictionary);

  const std::string text = "My r\xC3\xA9sum\xC3\xA9 is attached here";
  CorrectionOutcome outcome = corrector.correct(text, "eng");
  EXPECT_FALSE(outcome.corrected());
  EXPECT_EQ(outcome.text, text);
}

TEST(TextCorrectorTest, DictionaryFailureKeepsOriginalText) {
  ThrowingDictionary dictionary;
  TextCorrector corrector(dictionary);

  CorrectionOutcome outcome = corrector.correct("Teh qick brown fox", "eng");
  EXPECT_FALSE(outcome.corrected());
  EXPECT_EQ(outcome.text, "Teh qick brown fox");
}

TEST(ReplaceWholeWordTest, MatchesCaseShape) {
  EXPECT_EQ(dococr::replaceWholeWord("Recieve recieve RECIEVE", "recieve",
                                     "receive"),
            "Receive receive RECEIVE");
}

TEST(ReplaceWholeWordTest, LeavesPartialMatches) {
  EXPECT_EQ(dococr::replaceWholeWord("cat catalog bobcat cat.", "cat", "dog"),
            "dog catalog bobcat dog.");
}

TEST(ReplaceWholeWordTest, AccentedLettersAreWordCharacters) {
  const std::string text = "r\xC3\xA9sum\xC3\xA9 sum";
  EXPECT_EQ(dococr::replaceWholeWord(text, "sum", "some"),
            "r\xC3\xA9sum\xC3\xA9 some");
  EXPECT_EQ(dococr::replaceWholeWord("caf\xC3\xA9 cafe", "cafe", "cake"),
            "caf\xC3\xA9 cake");
}

/**
 * @file test_translator.cpp
 * @brief Unit tests for Translator
 */

#include "translator.hpp"

#include <string>

#include "gtest/gtest.h"

using namespace colormorse;

namespace {

std::string Translate(const char* code) {
  auto symbols = parse_code_string(code);
  EXPECT_TRUE(symbols.has_value()) << code;
  return symbols ? Translator::translate(*symbols) : std::string();
}

TEST(TranslatorTest, SingleLetters) {
  EXPECT_EQ("A", Translate(".-"));
  EXPECT_EQ("G", Translate("--."));
  EXPECT_EQ("S", Translate("..."));
}

TEST(TranslatorTest, LettersSplitAtSymbolGap) {
  EXPECT_EQ("SOS", Translate("... --- ..."));
}

TEST(TranslatorTest, WordsSplitAtWordGap) {
  EXPECT_EQ("HI MOM", Translate(".... ..|-- --- --"));
}

TEST(TranslatorTest, RepeatedGapsAreHarmless) {
  EXPECT_EQ("ET", Translate(".   -"));
  EXPECT_EQ("E T", Translate(". | -"));
}

TEST(TranslatorTest, LeadingAndTrailingGapsTrimmed) {
  EXPECT_EQ("E", Translate("  |. ||   "));
}

TEST(TranslatorTest, UnknownCodeBecomesEmptyLetter) {
  EXPECT_EQ("", Translate("......"));
  EXPECT_EQ("AB", Translate(".- ...... -..."));
  EXPECT_EQ("A B", Translate(".-|......|-..."));
}

TEST(TranslatorTest, UnknownCodeWritesNothingToStderr) {
  auto symbols = parse_code_string(".-|......");
  ASSERT_TRUE(symbols.has_value());

  ::testing::internal::CaptureStderr();
  const std::string text = Translator::translate(*symbols);
  EXPECT_EQ("", ::testing::internal::GetCapturedStderr());
  EXPECT_EQ("A", text);
}

TEST(TranslatorTest, EmptyStream) {
  EXPECT_EQ("", Translator::translate(SymbolStream{}));
  EXPECT_EQ("", Translate("   ||  "));
}

TEST(TranslatorTest, TranslationIsStable) {
  auto symbols = parse_code_string("-.-. --.-|-.. -..-");
  ASSERT_TRUE(symbols.has_value());

  const std::string first = Translator::translate(*symbols);
  const std::string second = Translator::translate(*symbols);
  EXPECT_EQ("CQ DX", first);
  EXPECT_EQ(first, second);
}

}  // namespace

/**
 * @file test_symbol_stream.cpp
 * @brief Unit tests for SymbolStream and its text renderings
 */

#include "symbol_stream.hpp"

#include "gtest/gtest.h"

using namespace colormorse;

namespace {

TEST(SymbolStreamTest, AppendKeepsOrder) {
  SymbolStream s;
  s.append(Symbol::Dash);
  s.append(Symbol::Dot);
  s.append(Symbol::SymbolGap, 2);
  s.append(Symbol::WordGap);

  ASSERT_EQ(5u, s.size());
  EXPECT_EQ(Symbol::Dash, s[0]);
  EXPECT_EQ(Symbol::Dot, s[1]);
  EXPECT_EQ(Symbol::SymbolGap, s[2]);
  EXPECT_EQ(Symbol::SymbolGap, s[3]);
  EXPECT_EQ(Symbol::WordGap, s[4]);
}

TEST(SymbolStreamTest, TrailingGapRunCountsBothGapKinds) {
  SymbolStream s;
  EXPECT_EQ(0u, s.trailing_gap_run());

  s.append(Symbol::SymbolGap);
  s.append(Symbol::Dot);
  EXPECT_EQ(0u, s.trailing_gap_run());

  s.append(Symbol::SymbolGap, 2);
  s.append(Symbol::WordGap);
  EXPECT_EQ(3u, s.trailing_gap_run());
}

TEST(SymbolStreamTest, CodeStringRendering) {
  SymbolStream s;
  s.append(Symbol::Dot);
  s.append(Symbol::Dash);
  s.append(Symbol::SymbolGap);
  s.append(Symbol::Dash);
  s.append(Symbol::WordGap);
  s.append(Symbol::Dot);

  EXPECT_EQ(".- -|.", to_code_string(s));
}

TEST(SymbolStreamTest, ParseCodeString) {
  auto parsed = parse_code_string("... ---|.");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(9u, parsed->size());
  EXPECT_EQ(Symbol::WordGap, (*parsed)[7]);
  EXPECT_EQ("... ---|.", to_code_string(*parsed));
}

TEST(SymbolStreamTest, ParseRejectsForeignCharacters) {
  EXPECT_FALSE(parse_code_string(".-x").has_value());
  EXPECT_FALSE(parse_code_string("/").has_value());
  EXPECT_TRUE(parse_code_string("").has_value());
}

TEST(SymbolStreamTest, SpokenRendering) {
  auto s = parse_code_string(".- -|.");
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ("dot dash, dash word gap dot", to_spoken(*s));
}

TEST(SymbolStreamTest, SpokenCollapsesRepeatedPauses) {
  auto s = parse_code_string("  .   -");
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ("dot, dash", to_spoken(*s));
}

}  // namespace

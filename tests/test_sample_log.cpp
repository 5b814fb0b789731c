/**
 * @file test_sample_log.cpp
 * @brief Unit tests for SampleLogReader
 */

#include "sample_log.hpp"

#include <sstream>
#include <vector>

#include "gtest/gtest.h"

using namespace colormorse;

namespace {

class SampleLogReaderTest : public ::testing::Test {
 protected:
  std::vector<ColorSample> ReadAll(SampleLogReader& reader) {
    std::vector<ColorSample> out;
    ColorSample s;
    while (reader.next(s)) out.push_back(s);
    return out;
  }

  ColorSensorAdapter adapter_;
};

TEST_F(SampleLogReaderTest, ReadsSamplesThroughAdapter) {
  std::istringstream in(
      "0.00,6\n"
      "0.25,5\n"
      "0.50,4\n"
      "0.75,3\n");
  SampleLogReader reader(in, adapter_);

  auto samples = ReadAll(reader);
  EXPECT_FALSE(reader.failed());
  ASSERT_EQ(4u, samples.size());

  EXPECT_EQ(ColorClass::SignalGap, samples[0].color);
  EXPECT_EQ(ColorClass::SignalMark, samples[1].color);
  EXPECT_EQ(ColorClass::SignalMark, samples[2].color);   // yellow alias
  EXPECT_EQ(raw_color::kRed, samples[2].raw_code);
  EXPECT_EQ(ColorClass::SteeringHint, samples[3].color);
  EXPECT_DOUBLE_EQ(0.75, samples[3].timestamp);
}

TEST_F(SampleLogReaderTest, SkipsCommentsBlankLinesAndWhitespace) {
  std::istringstream in(
      "# recorded on the test course\n"
      "\n"
      "   \n"
      "  1.5 , 6 \r\n"
      "\t# another comment\n"
      "2.0,5\n");
  SampleLogReader reader(in, adapter_);

  auto samples = ReadAll(reader);
  EXPECT_FALSE(reader.failed());
  ASSERT_EQ(2u, samples.size());
  EXPECT_DOUBLE_EQ(1.5, samples[0].timestamp);
  EXPECT_EQ(ColorClass::SignalGap, samples[0].color);
  EXPECT_EQ(6u, reader.line_number());
}

TEST_F(SampleLogReaderTest, BadTimestampFailsWithLineNumber) {
  std::istringstream in("0.0,6\nabc,5\n1.0,6\n");
  SampleLogReader reader(in, adapter_);

  auto samples = ReadAll(reader);
  EXPECT_EQ(1u, samples.size());
  ASSERT_TRUE(reader.failed());
  EXPECT_NE(std::string::npos, reader.error().find("line 2"));

  // The reader stays failed.
  ColorSample s;
  EXPECT_FALSE(reader.next(s));
}

TEST_F(SampleLogReaderTest, MissingSeparatorFails) {
  std::istringstream in("0.5 6\n");
  SampleLogReader reader(in, adapter_);
  ColorSample s;
  EXPECT_FALSE(reader.next(s));
  EXPECT_TRUE(reader.failed());
}

TEST_F(SampleLogReaderTest, BadColorCodeFails) {
  for (const char* text : {"0.5,\n", "0.5,red\n", "0.5,5x\n", "0.5,   \n"}) {
    std::istringstream in(text);
    SampleLogReader reader(in, adapter_);
    ColorSample s;
    EXPECT_FALSE(reader.next(s)) << text;
    EXPECT_TRUE(reader.failed()) << text;
  }
}

TEST_F(SampleLogReaderTest, OutOfRangeColorCodeFails) {
  // 4294967301 would wrap to 5 (red) if narrowed to int.
  for (const char* text : {"1.0,4294967301\n", "1.0,-4294967291\n",
                           "1.0,99999999999999999999999\n"}) {
    std::istringstream in(text);
    SampleLogReader reader(in, adapter_);
    ColorSample s;
    EXPECT_FALSE(reader.next(s)) << text;
    ASSERT_TRUE(reader.failed()) << text;
    EXPECT_EQ("line 1: bad color code", reader.error()) << text;
  }
}

TEST_F(SampleLogReaderTest, EmptyInputIsNotAnError) {
  std::istringstream in("");
  SampleLogReader reader(in, adapter_);
  ColorSample s;
  EXPECT_FALSE(reader.next(s));
  EXPECT_FALSE(reader.failed());
}

}  // namespace

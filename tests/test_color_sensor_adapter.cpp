/**
 * @file test_color_sensor_adapter.cpp
 * @brief Unit tests for ColorSensorAdapter
 */

#include "color_sensor_adapter.hpp"

#include "gtest/gtest.h"

using namespace colormorse;

namespace {

TEST(ColorSensorAdapterTest, DefaultCourseMapping) {
  ColorSensorAdapter adapter;
  EXPECT_EQ(ColorClass::SignalMark, adapter.map(raw_color::kRed));
  EXPECT_EQ(ColorClass::SignalGap, adapter.map(raw_color::kWhite));
  EXPECT_EQ(ColorClass::SteeringHint, adapter.map(raw_color::kGreen));
  EXPECT_EQ(ColorClass::SteeringHint, adapter.map(raw_color::kBlack));
  EXPECT_EQ(ColorClass::Background, adapter.map(raw_color::kNone));
  EXPECT_EQ(ColorClass::Ignored, adapter.map(raw_color::kBlue));
  EXPECT_EQ(ColorClass::Ignored, adapter.map(42));
}

TEST(ColorSensorAdapterTest, YellowAndBrownReadAsRed) {
  ColorSensorAdapter adapter;
  EXPECT_EQ(raw_color::kRed, adapter.resolve(raw_color::kYellow));
  EXPECT_EQ(raw_color::kRed, adapter.resolve(raw_color::kBrown));
  EXPECT_EQ(ColorClass::SignalMark, adapter.map(raw_color::kYellow));
  EXPECT_EQ(ColorClass::SignalMark, adapter.map(raw_color::kBrown));
}

TEST(ColorSensorAdapterTest, SampleCarriesResolvedCode) {
  ColorSensorAdapter adapter;
  ColorSample s = adapter.sample(raw_color::kBrown, 1.25);
  EXPECT_EQ(ColorClass::SignalMark, s.color);
  EXPECT_DOUBLE_EQ(1.25, s.timestamp);
  EXPECT_EQ(raw_color::kRed, s.raw_code);
}

TEST(ColorSensorAdapterTest, CustomCourse) {
  AdapterConfig cfg;
  cfg.mark_code = raw_color::kBlue;
  cfg.gap_code = raw_color::kYellow;
  cfg.steering_codes = {raw_color::kBlack};
  cfg.aliases.clear();
  ColorSensorAdapter adapter(cfg);

  EXPECT_EQ(ColorClass::SignalMark, adapter.map(raw_color::kBlue));
  EXPECT_EQ(ColorClass::SignalGap, adapter.map(raw_color::kYellow));
  EXPECT_EQ(ColorClass::Ignored, adapter.map(raw_color::kRed));
  EXPECT_EQ(ColorClass::Ignored, adapter.map(raw_color::kGreen));
}

}  // namespace

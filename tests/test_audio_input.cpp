/**
 * @file test_audio_input.cpp
 * @brief Unit tests for AudioInput helpers that need no audio device
 */

#include "audio_input.hpp"

#include <cmath>

#include "gtest/gtest.h"

using namespace colormorse;

namespace {

TEST(AudioInputTest, FrameCountForPositiveDuration) {
  EXPECT_EQ(44100ul, AudioInput::frame_count(44100.0, 1.0));
  EXPECT_EQ(4000ul, AudioInput::frame_count(8000.0, 0.5));
}

TEST(AudioInputTest, FrameCountRejectsBadDurations) {
  EXPECT_EQ(0ul, AudioInput::frame_count(44100.0, 0.0));
  EXPECT_EQ(0ul, AudioInput::frame_count(44100.0, -1.0));
  EXPECT_EQ(0ul, AudioInput::frame_count(44100.0, std::nan("")));
  EXPECT_EQ(0ul, AudioInput::frame_count(44100.0, 1e300));
}

TEST(AudioInputTest, CaptureWithoutOpenReturnsNothing) {
  AudioInput input;
  EXPECT_TRUE(input.capture(-1.0).empty());
  EXPECT_TRUE(input.capture(0.5).empty());
}

}  // namespace

// c++ headers ------------------------------------------
#include <array>
#include <string>

// external headers -------------------------------------
#include <gtest/gtest.h>

// project headers --------------------------------------
#include "mbase/log.h"
#include "dial_geometry.h"
#include "dial_view.h"
#include "text.h"

#include "recording_surface.h"

namespace fandial {
namespace {

using test::RecordingSurface;
using test::TextCall;
using test::ToRgba;

constexpr Color kRed    { 255,   0, 0, 255 };
constexpr Color kYellow { 255, 255, 0, 255 };
constexpr Color kGreen  {   0, 255, 0, 255 };

class DialViewTest : public ::testing::Test {
protected:
  void SetUp() override {
    previous_level_ = mbase::GetLogLevel();
    mbase::SetLogLevel(mbase::LogLevel::kError);
    SetCurrentLanguage(Language::kEnglish);

    config_.color_low = kRed;
    config_.color_medium = kYellow;
    config_.color_high = kGreen;
  }

  void TearDown() override {
    SetCurrentLanguage(Language::kEnglish);
    mbase::SetLogLevel(previous_level_);
  }

  /// Fill color of the dial disc as drawn.
  uint32_t RenderedDialColor(DialView const& dial) {
    RecordingSurface surface(300.0f, 300.0f);
    dial.Render(surface);
    EXPECT_FALSE(surface.circles.empty());
    return surface.circles.empty() ? 0 : ToRgba(surface.circles.front().color);
  }

  DialConfig config_;
  int invalidate_count_ = 0;
  mbase::LogLevel previous_level_ = mbase::LogLevel::kInfo;
};

TEST_F(DialViewTest, StartsOffAndClickable) {
  DialView dial(config_, nullptr);

  EXPECT_EQ(dial.GetCurrentSpeed(), FanSpeed::kOff);
  EXPECT_FLOAT_EQ(dial.GetRadius(), 0.0f);
  EXPECT_TRUE(dial.IsClickable());
  EXPECT_EQ(dial.GetContentDescription(), GetText(TextId::kFanOff));
}

TEST_F(DialViewTest, ActivateCyclesThroughSpeeds) {
  DialView dial(config_, nullptr);

  for (uint32_t n = 1; n <= 9; ++n) {
    EXPECT_TRUE(dial.Activate());
    EXPECT_EQ(dial.GetCurrentSpeed(), kFanSpeeds[n % kFanSpeedCount]) << "after " << n << " activations";
  }
}

TEST_F(DialViewTest, DescriptionFollowsNewSpeed) {
  DialView dial(config_, nullptr);

  for (int i = 0; i < 5; ++i) {
    dial.Activate();
    EXPECT_EQ(dial.GetContentDescription(), GetText(GetLabelTextId(dial.GetCurrentSpeed())));
    EXPECT_EQ(dial.GetAccessibilityInfo().description, dial.GetContentDescription());
  }
}

TEST_F(DialViewTest, EveryActivationRequestsOneRepaint) {
  DialView dial(config_, [this]() { ++invalidate_count_; });
  EXPECT_EQ(invalidate_count_, 0);

  dial.Activate();
  EXPECT_EQ(invalidate_count_, 1);
  dial.Activate();
  dial.Activate();
  EXPECT_EQ(invalidate_count_, 3);
}

TEST_F(DialViewTest, HandledUpstreamIsANoOp) {
  DialView dial(config_, [this]() { ++invalidate_count_; });
  dial.Activate();
  ASSERT_EQ(dial.GetCurrentSpeed(), FanSpeed::kLow);

  EXPECT_TRUE(dial.Activate(true));
  EXPECT_EQ(dial.GetCurrentSpeed(), FanSpeed::kLow);
  EXPECT_EQ(dial.GetContentDescription(), GetText(TextId::kFanLow));
  EXPECT_EQ(invalidate_count_, 1);
}

TEST_F(DialViewTest, ResizeIsIdempotent) {
  DialView dial(config_, nullptr);

  dial.Resize(300.0f, 300.0f);
  EXPECT_FLOAT_EQ(dial.GetRadius(), 120.0f);
  dial.Resize(300.0f, 300.0f);
  EXPECT_FLOAT_EQ(dial.GetRadius(), 120.0f);

  dial.Resize(200.0f, 100.0f);
  EXPECT_FLOAT_EQ(dial.GetRadius(), 40.0f);
}

TEST_F(DialViewTest, ColorScenario) {
  DialView dial(config_, nullptr);
  dial.Resize(300.0f, 300.0f);

  EXPECT_EQ(RenderedDialColor(dial), ToRgba(GRAY));

  dial.Activate();
  EXPECT_EQ(dial.GetCurrentSpeed(), FanSpeed::kLow);
  EXPECT_EQ(RenderedDialColor(dial), ToRgba(kRed));
  EXPECT_EQ(dial.GetContentDescription(), "1");

  dial.Activate();
  EXPECT_EQ(RenderedDialColor(dial), ToRgba(kYellow));
  dial.Activate();
  EXPECT_EQ(RenderedDialColor(dial), ToRgba(kGreen));
  dial.Activate();
  EXPECT_EQ(dial.GetCurrentSpeed(), FanSpeed::kOff);
  EXPECT_EQ(RenderedDialColor(dial), ToRgba(GRAY));
}

TEST_F(DialViewTest, MissingColorsAreTransparent) {
  DialView dial(DialConfig {}, nullptr);
  dial.Resize(300.0f, 300.0f);

  EXPECT_EQ(ToRgba(dial.GetFillColor(FanSpeed::kOff)), ToRgba(GRAY));
  dial.Activate();
  EXPECT_EQ(RenderedDialColor(dial), 0u);
}

TEST_F(DialViewTest, RenderLayout) {
  DialView dial(config_, nullptr);
  dial.Resize(400.0f, 300.0f);
  dial.Activate();
  dial.Activate(); // MEDIUM

  RecordingSurface surface(400.0f, 300.0f);
  dial.Render(surface);

  float const radius = 120.0f;
  raylib::Vector2 const center { 200.0f, 150.0f };

  ASSERT_EQ(surface.circles.size(), 2u);

  // Dial disc.
  EXPECT_FLOAT_EQ(surface.circles[0].center.x, center.x);
  EXPECT_FLOAT_EQ(surface.circles[0].center.y, center.y);
  EXPECT_FLOAT_EQ(surface.circles[0].radius, radius);

  // Indicator.
  raylib::Vector2 const marker = PositionForIndex(2, radius - 35.0f, center.x, center.y);
  EXPECT_FLOAT_EQ(surface.circles[1].center.x, marker.x);
  EXPECT_FLOAT_EQ(surface.circles[1].center.y, marker.y);
  EXPECT_FLOAT_EQ(surface.circles[1].radius, radius / 12.0f);
  EXPECT_EQ(ToRgba(surface.circles[1].color), ToRgba(BLACK));

  // Labels in ordinal order, independent of the current speed.
  std::array<char const*, kFanSpeedCount> const kExpectedLabels = { "off", "1", "2", "3" };
  ASSERT_EQ(surface.texts.size(), kFanSpeedCount);
  for (uint32_t i = 0; i < kFanSpeedCount; ++i) {
    raylib::Vector2 const expected = PositionForIndex(i, radius + 30.0f, center.x, center.y);
    TextCall const& call = surface.texts[i];
    EXPECT_EQ(call.text, kExpectedLabels[i]);
    EXPECT_FLOAT_EQ(call.position.x, expected.x);
    EXPECT_FLOAT_EQ(call.position.y, expected.y);
    EXPECT_FLOAT_EQ(call.font_size, DialView::kLabelFontSize);
    EXPECT_EQ(call.weight, FontWeight::kBold);
    EXPECT_EQ(ToRgba(call.color), ToRgba(BLACK));
  }
}

TEST_F(DialViewTest, RenderDoesNotMutate) {
  DialView dial(config_, [this]() { ++invalidate_count_; });
  dial.Resize(300.0f, 300.0f);

  RecordingSurface surface(300.0f, 300.0f);
  dial.Render(surface);
  dial.Render(surface);

  EXPECT_EQ(dial.GetCurrentSpeed(), FanSpeed::kOff);
  EXPECT_EQ(invalidate_count_, 0);
}

TEST_F(DialViewTest, ZeroSizeRendersZeroRadius) {
  DialView dial(config_, nullptr);
  dial.Resize(0.0f, 0.0f);

  RecordingSurface surface(0.0f, 0.0f);
  dial.Render(surface);

  ASSERT_FALSE(surface.circles.empty());
  EXPECT_FLOAT_EQ(surface.circles[0].radius, 0.0f);
}

TEST_F(DialViewTest, ActionLabelResetsAtHigh) {
  DialView dial(config_, nullptr);

  for (int i = 0; i < 8; ++i) {
    std::string const expected = GetText(
      dial.GetCurrentSpeed() == FanSpeed::kHigh ? TextId::kReset : TextId::kChange
    );
    EXPECT_EQ(dial.GetAccessibilityInfo().action_label, expected);
    dial.Activate();
  }

  dial.Activate();
  dial.Activate();
  dial.Activate();
  ASSERT_EQ(dial.GetCurrentSpeed(), FanSpeed::kHigh);
  EXPECT_EQ(dial.GetAccessibilityInfo().action_label, "reset");
}

TEST_F(DialViewTest, RefreshTextFollowsLanguage) {
  DialView dial(config_, [this]() { ++invalidate_count_; });
  EXPECT_EQ(dial.GetContentDescription(), "off");

  SetCurrentLanguage(Language::kGerman);
  dial.RefreshText();

  EXPECT_EQ(dial.GetContentDescription(), "aus");
  EXPECT_EQ(dial.GetAccessibilityInfo().action_label, GetTextInLang(TextId::kChange, Language::kGerman));
  EXPECT_EQ(dial.GetCurrentSpeed(), FanSpeed::kOff);
  EXPECT_EQ(invalidate_count_, 1);
}

TEST_F(DialViewTest, HitTestUsesBounds) {
  DialView dial(config_, nullptr);
  EXPECT_FALSE(dial.HitTest(raylib::Vector2 { 0.0f, 0.0f }));

  dial.Resize(200.0f, 100.0f);
  EXPECT_TRUE(dial.HitTest(raylib::Vector2 { 0.0f, 0.0f }));
  EXPECT_TRUE(dial.HitTest(raylib::Vector2 { 199.0f, 99.0f }));
  EXPECT_FALSE(dial.HitTest(raylib::Vector2 { 200.0f, 50.0f }));
  EXPECT_FALSE(dial.HitTest(raylib::Vector2 { -1.0f, 50.0f }));
}

} // namespace
} // namespace fandial

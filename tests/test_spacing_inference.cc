#include "inference/swatch_spacing_inference.h"
#include "branding_fixtures.h"
#include <gtest/gtest.h>
#include <vector>

TEST(SwatchSpacingInferenceTest, RegularGridPicksEight) {
  EXPECT_EQ(SwatchSpacingInference::InferBaseUnit({8, 16, 24, 32}), 8);
}

TEST(SwatchSpacingInferenceTest, OffByOneValuesStillAgree) {
  EXPECT_EQ(SwatchSpacingInference::InferBaseUnit({7, 15, 23}), 8);
}

// Units with equal agreement resolve to the larger one; a finer unit wins
// only when it agrees with more values
TEST(SwatchSpacingInferenceTest, TiedUnitsPreferTheLargest) {
  EXPECT_EQ(SwatchSpacingInference::InferBaseUnit({12, 24, 36}), 12);
  EXPECT_EQ(SwatchSpacingInference::InferBaseUnit({4, 12, 20, 28}), 4);
}

TEST(SwatchSpacingInferenceTest, EmptyOrUnusableInputDefaultsToEight) {
  EXPECT_EQ(SwatchSpacingInference::InferBaseUnit({}), 8);
  EXPECT_EQ(SwatchSpacingInference::InferBaseUnit({0, -4, 200, 512}), 8);
}

TEST(SwatchSpacingInferenceTest, TenPixelGrid) {
  EXPECT_EQ(SwatchSpacingInference::InferBaseUnit({10, 20, 30, 50}), 10);
}

TEST(SwatchSpacingInferenceTest, ResultStaysInRange) {
  std::vector<std::vector<double>> inputs = {
    {1}, {2, 3}, {127}, {50, 70, 90}, {13, 27, 38}, {5.4, 11.2, 17.9}, {100, 101, 102}
  };
  for (const auto& values : inputs) {
    int unit = SwatchSpacingInference::InferBaseUnit(values);
    EXPECT_GE(unit, 2);
    EXPECT_LE(unit, 12);
  }
}

TEST(SwatchSpacingInferenceTest, BorderRadiusIsRoundedMedian) {
  EXPECT_EQ(SwatchSpacingInference::PickBorderRadius({}), "8px");
  EXPECT_EQ(SwatchSpacingInference::PickBorderRadius({4, 6.4, 12}), "6px");
  EXPECT_EQ(SwatchSpacingInference::PickBorderRadius({12, 4}), "12px");
}

TEST(SwatchSpacingInferenceTest, InferUsesSnapshotsThenStylesheets) {
  RawBrandingRecord raw;
  raw.snapshots.push_back(MakeButtonSnapshot("Go", "#0000FF"));
  raw.snapshots.push_back(MakeTextSnapshot("p", "#333333"));
  raw.css_data.radii = {4, 4};
  raw.css_data.spacings = {4, 8, 12, 20};

  std::vector<double> radii = SwatchSpacingInference::CollectRadii(raw);
  ASSERT_EQ(radii.size(), 3u);
  EXPECT_DOUBLE_EQ(radii[0], 6.0);

  SpacingProfile spacing = SwatchSpacingInference::Infer(raw);
  EXPECT_EQ(spacing.base_unit, 4);
  EXPECT_EQ(spacing.border_radius, "4px");
}

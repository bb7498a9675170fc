#include "inference/swatch_component_builder.h"
#include "branding_fixtures.h"
#include <gtest/gtest.h>

namespace {

Palette TestPalette() {
  Palette palette;
  palette.primary = "#E11D48";
  palette.accent = "#2563EB";
  palette.background = "#FFFFFF";
  palette.text_primary = "#111111";
  palette.link = "#2563EB";
  return palette;
}

}  // namespace

TEST(SwatchComponentBuilderTest, PrimaryPrefersClassMatch) {
  std::vector<ButtonCandidate> candidates = {
    MakeCandidate("Learn more", "#2563EB", "btn", 20000),
    MakeCandidate("Sign up", "#E11D48", "btn btn-primary", 4000),
  };
  EXPECT_EQ(SwatchComponentBuilder::PickPrimary(candidates), 1);
}

TEST(SwatchComponentBuilderTest, PrimaryFallsBackToLargestVisibleBackground) {
  std::vector<ButtonCandidate> candidates = {
    MakeCandidate("Docs", "#FFFFFF", "btn", 90000),
    MakeCandidate("Pricing", "#2563EB", "btn", 3000),
    MakeCandidate("Sign up", "#E11D48", "btn", 6000),
  };
  EXPECT_EQ(SwatchComponentBuilder::PickPrimary(candidates), 2);

  std::vector<ButtonCandidate> invisible = {
    MakeCandidate("Docs", "#FFFFFF"),
    MakeCandidate("Blog", "#00000000"),
  };
  EXPECT_EQ(SwatchComponentBuilder::PickPrimary(invisible), 0);
  EXPECT_EQ(SwatchComponentBuilder::PickPrimary({}), -1);
}

TEST(SwatchComponentBuilderTest, SecondaryByClass) {
  std::vector<ButtonCandidate> candidates = {
    MakeCandidate("Sign up", "#E11D48", "btn btn-primary"),
    MakeCandidate("Docs", "#2563EB", "btn"),
    MakeCandidate("Contact", "#FFFFFF", "btn btn-secondary"),
  };
  EXPECT_EQ(SwatchComponentBuilder::PickSecondary(candidates, 0), 2);
}

TEST(SwatchComponentBuilderTest, SecondaryByRepeatedStyle) {
  std::vector<ButtonCandidate> candidates = {
    MakeCandidate("Sign up", "#E11D48", "btn"),
    MakeCandidate("One", "#0F172A", "btn"),
    MakeCandidate("Docs", "#2563EB", "btn"),
    MakeCandidate("Blog", "#2563EB", "btn"),
  };
  EXPECT_EQ(SwatchComponentBuilder::PickSecondary(candidates, 0), 2);
}

TEST(SwatchComponentBuilderTest, SecondaryByDistinctLook) {
  std::vector<ButtonCandidate> candidates = {
    MakeCandidate("Sign up", "#E11D48", "btn"),
    MakeCandidate("Sign in", "#E11D48", "btn"),
    MakeCandidate("Docs", "#2563EB", "btn"),
  };
  // Index 1 shares the primary's style key, so it is not a repeated group
  EXPECT_EQ(SwatchComponentBuilder::PickSecondary(candidates, 0), 2);

  std::vector<ButtonCandidate> same = {
    MakeCandidate("Sign up", "#E11D48", "btn"),
    MakeCandidate("Sign in", "#E11D48", "btn"),
  };
  EXPECT_EQ(SwatchComponentBuilder::PickSecondary(same, 0), -1);
}

TEST(SwatchComponentBuilderTest, PrimaryStyle) {
  Palette palette = TestPalette();
  ButtonStyle style = SwatchComponentBuilder::PrimaryStyle(
      MakeCandidate("Go", "#2563EB", "btn", 4800, "", "6.4px"), palette, "8px");
  EXPECT_EQ(style.background, "#2563EB");
  EXPECT_EQ(style.text_color, "#FFFFFF");
  EXPECT_EQ(style.border_radius, "6px");

  style = SwatchComponentBuilder::PrimaryStyle(
      MakeCandidate("Go", "#FFFFFF", "btn", 4800, "", "0px"), palette, "8px");
  EXPECT_EQ(style.background, "#E11D48");
  EXPECT_EQ(style.border_radius, "8px");
}

TEST(SwatchComponentBuilderTest, SecondaryStyle) {
  Palette palette = TestPalette();
  ButtonStyle style = SwatchComponentBuilder::SecondaryStyle(
      MakeCandidate("Docs", "#FFFFFF", "btn", 4800, "", "0px"), palette, "12px");
  EXPECT_EQ(style.background, "");
  EXPECT_EQ(style.border_color, "#E11D48");
  EXPECT_EQ(style.border_radius, "12px");

  style = SwatchComponentBuilder::SecondaryStyle(
      MakeCandidate("Docs", "#2563EB", "btn", 4800, "#0F172A", "4px"), palette, "12px");
  EXPECT_EQ(style.background, "#2563EB");
  EXPECT_EQ(style.border_color, "#0F172A");
  EXPECT_EQ(style.border_radius, "4px");
}

TEST(SwatchComponentBuilderTest, InputStyle) {
  std::vector<StyleSnapshot> snapshots = {MakeTextSnapshot("p", "#333333")};
  InputStyle input = SwatchComponentBuilder::BuildInput(snapshots, "6px");
  EXPECT_EQ(input.border_color, "#CCCCCC");
  EXPECT_EQ(input.border_radius, "6px");

  snapshots.push_back(MakeInputSnapshot("rgb(209, 213, 219)", 4));
  input = SwatchComponentBuilder::BuildInput(snapshots, "6px");
  EXPECT_EQ(input.border_color, "#D1D5DB");
}

TEST(SwatchComponentBuilderTest, BuildRecordsSelection) {
  std::vector<ButtonCandidate> candidates = {
    MakeCandidate("Sign up", "#E11D48", "btn btn-primary"),
    MakeCandidate("Docs", "#2563EB", "btn"),
  };
  ButtonSelection selection;
  ComponentsProfile components = SwatchComponentBuilder::Build(candidates, {}, TestPalette(), "8px", selection);
  EXPECT_EQ(selection.primary_index, 0);
  EXPECT_EQ(selection.secondary_index, 1);
  EXPECT_TRUE(components.has_button_primary);
  EXPECT_TRUE(components.has_button_secondary);
  EXPECT_EQ(components.button_primary.background, "#E11D48");

  ButtonSelection none;
  components = SwatchComponentBuilder::Build({}, {}, TestPalette(), "8px", none);
  EXPECT_EQ(none.primary_index, -1);
  EXPECT_EQ(none.secondary_index, -1);
  EXPECT_FALSE(components.has_button_primary);
  EXPECT_FALSE(components.has_button_secondary);
}

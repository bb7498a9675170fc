#include "inference/swatch_palette_inference.h"
#include "branding_fixtures.h"
#include <gtest/gtest.h>

TEST(SwatchPaletteInferenceTest, DarkPageBackgroundWins) {
  RawBrandingRecord raw;
  raw.color_scheme = ColorScheme::DARK;
  raw.page_background = "#121212";
  raw.snapshots.push_back(MakeButtonSnapshot("Get Started", "rgb(99, 102, 241)"));
  raw.snapshots.push_back(MakeTextSnapshot("p", "#EDEDED"));
  raw.css_data.colors = {"#6366F1", "#F59E0B"};

  std::vector<ColorFrequency> table;
  Palette palette = SwatchPaletteInference::Infer(raw, &table);

  EXPECT_EQ(palette.background, "#121212");
  EXPECT_EQ(palette.primary, "#6366F1");
  EXPECT_EQ(palette.accent, "#F59E0B");
  EXPECT_EQ(palette.link, "#F59E0B");

  ASSERT_FALSE(table.empty());
  EXPECT_EQ(table[0].hex, "#121212");
  EXPECT_DOUBLE_EQ(table[0].frequency, SwatchPaletteInference::kPageBackgroundWeight);
  EXPECT_TRUE(table[0].is_grayish);
}

TEST(SwatchPaletteInferenceTest, LightPageFallsBackToLightGray) {
  RawBrandingRecord raw;
  raw.snapshots.push_back(MakeTextSnapshot("p", "#333333"));
  raw.snapshots.push_back(MakeTextSnapshot("h1", "#333333"));
  raw.css_data.colors = {"#FAFAFA", "#E11D48"};

  Palette palette = SwatchPaletteInference::Infer(raw);
  EXPECT_EQ(palette.background, "#FAFAFA");
  EXPECT_EQ(palette.text_primary, "#333333");
  EXPECT_EQ(palette.primary, "#E11D48");
  EXPECT_EQ(palette.accent, "#E11D48");
}

TEST(SwatchPaletteInferenceTest, SchemeDefaultsWithoutColours) {
  RawBrandingRecord light;
  Palette palette = SwatchPaletteInference::Infer(light);
  EXPECT_EQ(palette.background, "#FFFFFF");
  EXPECT_EQ(palette.text_primary, "#111111");
  EXPECT_EQ(palette.primary, "#000000");
  EXPECT_EQ(palette.accent, "#000000");

  RawBrandingRecord dark;
  dark.color_scheme = ColorScheme::DARK;
  palette = SwatchPaletteInference::Infer(dark);
  EXPECT_EQ(palette.background, "#1A1A1A");
  EXPECT_EQ(palette.text_primary, "#FFFFFF");
  EXPECT_EQ(palette.primary, "#FFFFFF");
}

TEST(SwatchPaletteInferenceTest, TransparentColoursAreNotCounted) {
  RawBrandingRecord raw;
  raw.snapshots.push_back(MakeTextSnapshot("p", "#333333"));
  raw.css_data.colors = {"#00000000", "rgba(255, 0, 0, 0)"};

  for (const auto& entry : SwatchPaletteInference::RankColors(raw)) {
    EXPECT_GE(entry.hex.size(), 7u);
    EXPECT_NE(entry.hex, "#00000000");
    EXPECT_NE(entry.hex, "#FF000000");
  }
}

TEST(SwatchPaletteInferenceTest, ColouredAnchorBecomesLink) {
  RawBrandingRecord raw;
  raw.css_data.colors = {"#E11D48", "#2563EB"};
  raw.link_color = "rgb(22, 163, 74)";
  EXPECT_EQ(SwatchPaletteInference::Infer(raw).link, "#16A34A");

  raw.link_color = "rgb(51, 51, 51)";
  Palette palette = SwatchPaletteInference::Infer(raw);
  EXPECT_EQ(palette.link, palette.accent);
}

TEST(SwatchPaletteInferenceTest, WhitePageBackgroundIsNotAHint) {
  std::vector<std::string> ranked = {"#FFFFFF", "#F4F4F5", "#111111"};
  EXPECT_EQ(SwatchPaletteInference::PickBackground(ranked, ColorScheme::LIGHT, "#FFFFFF"), "#FFFFFF");
  EXPECT_EQ(SwatchPaletteInference::PickBackground(ranked, ColorScheme::LIGHT, "#F4F4F5"), "#F4F4F5");
  EXPECT_EQ(SwatchPaletteInference::PickBackground(ranked, ColorScheme::DARK, ""), "#111111");
}

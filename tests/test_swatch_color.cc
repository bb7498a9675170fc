#include "color/swatch_color.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

TEST(SwatchColorTest, HexifyFunctionalNotations) {
  EXPECT_EQ(SwatchColor::Hexify("rgb(255, 0, 0)"), "#FF0000");
  EXPECT_EQ(SwatchColor::Hexify("rgba(0, 0, 255, 0.5)"), "#0000FF80");
  EXPECT_EQ(SwatchColor::Hexify("rgb(0 128 255 / 50%)"), "#0080FF80");
  EXPECT_EQ(SwatchColor::Hexify("hsl(0, 100%, 50%)"), "#FF0000");
  EXPECT_EQ(SwatchColor::Hexify("hsl(120deg 100% 25%)"), "#008000");
  EXPECT_EQ(SwatchColor::Hexify("color(display-p3 1 0 0)"), "#FF0000");
  EXPECT_EQ(SwatchColor::Hexify("color(srgb 0 0 1 / 0.5)"), "#0000FF80");
}

TEST(SwatchColorTest, HexifyHexAndKeywords) {
  EXPECT_EQ(SwatchColor::Hexify("#abc"), "#AABBCC");
  EXPECT_EQ(SwatchColor::Hexify("#aabbcc"), "#AABBCC");
  EXPECT_EQ(SwatchColor::Hexify("#11223344"), "#11223344");
  EXPECT_EQ(SwatchColor::Hexify("  RED "), "#FF0000");
  EXPECT_EQ(SwatchColor::Hexify("rebeccapurple"), "#663399");
  EXPECT_EQ(SwatchColor::Hexify("transparent"), "#00000000");
}

TEST(SwatchColorTest, HexifyRejectsGarbage) {
  EXPECT_EQ(SwatchColor::Hexify(""), "");
  EXPECT_EQ(SwatchColor::Hexify("not-a-color"), "");
  EXPECT_EQ(SwatchColor::Hexify("rgb(1, 2)"), "");
  EXPECT_EQ(SwatchColor::Hexify("#12"), "");
  EXPECT_EQ(SwatchColor::Hexify("var(--brand)"), "");
  EXPECT_EQ(SwatchColor::Hexify("rgb(a, b, c)"), "");
}

TEST(SwatchColorTest, HexifyIsIdempotent) {
  std::vector<std::string> inputs = {
    "rgb(10, 20, 30)", "rgba(255, 255, 255, 0.25)", "#fff", "#12345678",
    "hsl(200, 50%, 40%)", "navy", "transparent", "garbage", "",
    "color(display-p3 1 0 0)", "color(srgb 0.5 0.5 0.5 / 0.5)"
  };
  for (const auto& input : inputs) {
    std::string once = SwatchColor::Hexify(input);
    EXPECT_EQ(SwatchColor::Hexify(once), once) << input;
  }
  EXPECT_EQ(SwatchColor::Hexify("color(srgb 0.5 0.5 0.5 / 0.5)").size(), 9u);
}

TEST(SwatchColorTest, IsColorValid) {
  EXPECT_TRUE(SwatchColor::IsColorValid("#0000FF"));
  EXPECT_TRUE(SwatchColor::IsColorValid("rgb(255, 255, 255)"));
  EXPECT_FALSE(SwatchColor::IsColorValid("#FFFFFF"));
  EXPECT_FALSE(SwatchColor::IsColorValid("#000000"));
  EXPECT_FALSE(SwatchColor::IsColorValid("#F5F5F5"));
  EXPECT_FALSE(SwatchColor::IsColorValid("rgba(0, 0, 0, 0)"));
  EXPECT_FALSE(SwatchColor::IsColorValid("transparent"));
  EXPECT_FALSE(SwatchColor::IsColorValid(""));
}

TEST(SwatchColorTest, ContrastAndGray) {
  EXPECT_DOUBLE_EQ(SwatchColor::ContrastYIQ("#FFFFFF"), 255.0);
  EXPECT_DOUBLE_EQ(SwatchColor::ContrastYIQ("#000000"), 0.0);
  EXPECT_NEAR(SwatchColor::ContrastYIQ("#FF0000"), 76.245, 1e-9);
  EXPECT_DOUBLE_EQ(SwatchColor::ContrastYIQ("#FFF"), 0.0);

  EXPECT_TRUE(SwatchColor::IsGrayish("#808080"));
  EXPECT_TRUE(SwatchColor::IsGrayish("#121212"));
  EXPECT_FALSE(SwatchColor::IsGrayish("#0000FF"));

  EXPECT_EQ(SwatchColor::ContrastTextColor("#000000"), "#FFFFFF");
  EXPECT_EQ(SwatchColor::ContrastTextColor("#FFFFFF"), "#111111");
}

TEST(SwatchColorTest, LuminanceAndAlpha) {
  EXPECT_NEAR(SwatchColor::RelativeLuminance("#FFFFFF"), 1.0, 1e-9);
  EXPECT_NEAR(SwatchColor::RelativeLuminance("rgb(0, 0, 0)"), 0.0, 1e-9);
  EXPECT_LT(SwatchColor::RelativeLuminance("#121212"), 0.4);
  EXPECT_DOUBLE_EQ(SwatchColor::RelativeLuminance("nope"), -1.0);

  EXPECT_DOUBLE_EQ(SwatchColor::Alpha("#FF000000"), 0.0);
  EXPECT_DOUBLE_EQ(SwatchColor::Alpha("#FF0000"), 1.0);
  EXPECT_DOUBLE_EQ(SwatchColor::Alpha("nope"), 1.0);
}

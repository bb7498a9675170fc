#include "collector/swatch_svg_resolver.h"
#include "fake_page_accessor.h"
#include <gtest/gtest.h>

TEST(SwatchSvgResolverTest, CssVariableFillIsInlined) {
  FakePageAccessor page;
  ElementHandle svg = page.AddElement("svg", page.body());
  page.SetAttribute(svg, "viewBox", "0 0 10 10");
  page.SetAttribute(svg, "fill", "var(--bg)");
  page.SetStyle(svg, "fill", "rgb(0, 0, 0)");
  ElementHandle path = page.AddElement("path", svg);
  page.SetAttribute(path, "d", "M0 0h10v10H0z");

  std::string markup = SwatchSvgResolver::ResolveToMarkup(page, svg);
  EXPECT_EQ(markup,
            "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 10 10\" "
            "style=\"fill: rgb(0, 0, 0) !important;\"><path d=\"M0 0h10v10H0z\"/></svg>");
  EXPECT_EQ(markup.find("var("), std::string::npos);
}

TEST(SwatchSvgResolverTest, ExplicitStylesOverrideExistingDeclarations) {
  FakePageAccessor page;
  ElementHandle svg = page.AddElement("svg", page.body());
  page.SetAttribute(svg, "xmlns", "http://www.w3.org/2000/svg");
  page.SetAttribute(svg, "style", "opacity: 0.5; display: block");
  page.SetInlineStyle(svg, "opacity", "0.5");
  page.SetStyle(svg, "opacity", "0.5");

  EXPECT_EQ(SwatchSvgResolver::ResolveToMarkup(page, svg),
            "<svg xmlns=\"http://www.w3.org/2000/svg\" "
            "style=\"opacity: 0.5 !important; display: block;\"/>");
}

TEST(SwatchSvgResolverTest, OnlyNonDefaultComputedValuesAreInlined) {
  FakePageAccessor page;
  ElementHandle svg = page.AddElement("svg", page.body());
  ElementHandle plain = page.AddElement("rect", svg);
  page.SetStyle(plain, "fill", "rgb(0, 0, 0)");
  page.SetStyle(plain, "stroke", "none");
  ElementHandle outlined = page.AddElement("circle", svg);
  page.SetStyle(outlined, "stroke", "rgb(255, 0, 0)");
  page.AddText(svg, "a<b");

  std::string markup = SwatchSvgResolver::ResolveToMarkup(page, svg);
  EXPECT_NE(markup.find("<rect/>"), std::string::npos);
  EXPECT_NE(markup.find("<circle style=\"stroke: rgb(255, 0, 0) !important;\"/>"), std::string::npos);
  EXPECT_NE(markup.find("a&lt;b"), std::string::npos);
}

TEST(SwatchSvgResolverTest, DataUrl) {
  FakePageAccessor page;
  ElementHandle svg = page.AddElement("svg", page.body());
  std::string url = SwatchSvgResolver::ResolveToDataUrl(page, svg);
  EXPECT_EQ(url, "data:image/svg+xml;utf8,%3Csvg%20xmlns%3D%22http%3A%2F%2Fwww.w3.org%2F2000%2Fsvg%22%2F%3E");
  EXPECT_EQ(SwatchSvgResolver::ResolveToDataUrl(page, kNoElement), "");
}

#include "core/swatch_branding_json.h"
#include "inference/swatch_branding_processor.h"
#include "branding_fixtures.h"
#include <gtest/gtest.h>

using json = nlohmann::json;

TEST(SwatchBrandingJsonTest, ParsesCollectorOutput) {
  const char* text = R"json({
    "cssData": {
      "colors": ["#E11D48", "#2563EB"],
      "radii": [4, 8],
      "spacings": [8, 16, 24],
      "customProperties": {"--brand": "#E11D48", "--bad": 4},
      "fonts": ["Inter"],
      "fontFaces": [{"family": "Inter", "src": "url(/inter.woff2)"}],
      "skipped": [{"source": "stylesheet[1]", "reason": "cssRules not accessible"}]
    },
    "snapshots": [{
      "tag": "button", "classes": "btn btn-primary", "text": "Get Started",
      "rect": {"w": 120, "h": 40},
      "colors": {"text": "rgb(255, 255, 255)", "background": "rgb(225, 29, 72)", "border": null, "borderWidth": 0},
      "typography": {"family": "Inter", "fontStack": ["Inter", "sans-serif"], "size": "16px", "weight": 600},
      "radius": 6, "isButton": true, "isInput": false, "isLink": false, "hasCTAIndicator": true, "shadow": null
    }, "not an object"],
    "images": [{"type": "favicon", "src": "/favicon.ico"}, {"type": "bogus", "src": "x"}],
    "colorScheme": "dark",
    "typography": {"stacks": {"body": ["Inter"], "heading": ["Poppins"]}, "sizes": {"h1": "48px"}},
    "frameworkHints": ["next.js", "react"],
    "pageBackground": "#121212",
    "linkColor": null,
    "logoCandidates": [{"src": "/logo.svg", "isSvg": true, "location": "header",
                        "position": {"top": 10, "left": 20, "width": 100, "height": 30}}],
    "brandName": "Example"
  })json";

  RawBrandingRecord raw;
  std::string error;
  ASSERT_TRUE(SwatchBrandingJson::ParseRawRecord(text, raw, error)) << error;

  EXPECT_EQ(raw.css_data.colors.size(), 2u);
  EXPECT_EQ(raw.css_data.custom_properties.size(), 1u);
  EXPECT_EQ(raw.css_data.skipped.size(), 1u);
  ASSERT_EQ(raw.snapshots.size(), 1u);
  EXPECT_TRUE(raw.snapshots[0].has_radius);
  EXPECT_DOUBLE_EQ(raw.snapshots[0].radius, 6.0);
  EXPECT_EQ(raw.snapshots[0].typography.weight, 600);
  EXPECT_TRUE(raw.snapshots[0].has_cta_indicator);
  EXPECT_EQ(raw.snapshots[0].colors.border, "");
  ASSERT_EQ(raw.images.size(), 1u);
  EXPECT_EQ(raw.images[0].type, ImageType::FAVICON);
  EXPECT_EQ(raw.color_scheme, ColorScheme::DARK);
  EXPECT_EQ(raw.typography.sizes.h1, "48px");
  EXPECT_EQ(raw.typography.sizes.body, "");
  EXPECT_EQ(raw.framework_hints.size(), 2u);
  EXPECT_EQ(raw.page_background, "#121212");
  EXPECT_EQ(raw.link_color, "");
  ASSERT_EQ(raw.logo_candidates.size(), 1u);
  EXPECT_TRUE(raw.logo_candidates[0].in_header);
  EXPECT_DOUBLE_EQ(raw.logo_candidates[0].width, 100.0);
  EXPECT_EQ(raw.brand_name, "Example");
}

TEST(SwatchBrandingJsonTest, RejectsNonObjects) {
  RawBrandingRecord raw;
  std::string error;
  EXPECT_FALSE(SwatchBrandingJson::ParseRawRecord("[1, 2]", raw, error));
  EXPECT_EQ(error, "Raw branding record must be a JSON object");
  EXPECT_FALSE(SwatchBrandingJson::ParseRawRecord("{oops", raw, error));
  EXPECT_EQ(error, "Raw branding record is not valid JSON");
}

TEST(SwatchBrandingJsonTest, OutOfRangeFontWeightIsUnresolved) {
  RawBrandingRecord raw;
  std::string error;
  ASSERT_TRUE(SwatchBrandingJson::ParseRawRecord(
      R"({"snapshots": [{"tag": "p", "typography": {"weight": 1e20}},
                        {"tag": "p", "typography": {"weight": -400}},
                        {"tag": "p", "typography": {"weight": 700}}]})",
      raw, error)) << error;
  ASSERT_EQ(raw.snapshots.size(), 3u);
  EXPECT_EQ(raw.snapshots[0].typography.weight, 0);
  EXPECT_EQ(raw.snapshots[1].typography.weight, 0);
  EXPECT_EQ(raw.snapshots[2].typography.weight, 700);
}

TEST(SwatchBrandingJsonTest, RawRecordSurvivesSerialization) {
  RawBrandingRecord raw;
  raw.snapshots.push_back(MakeButtonSnapshot("Get Started", "rgb(225, 29, 72)"));
  raw.css_data.skipped.push_back({"stylesheet[0]", "SecurityError"});
  raw.page_background = "#FFFFFF";

  RawBrandingRecord parsed;
  std::string error;
  ASSERT_TRUE(SwatchBrandingJson::RawRecordFromJson(SwatchBrandingJson::RawRecordToJson(raw), parsed, error));
  EXPECT_EQ(SwatchBrandingJson::RawRecordToJson(parsed).dump(), SwatchBrandingJson::RawRecordToJson(raw).dump());
}

TEST(SwatchBrandingJsonTest, ProfileShape) {
  RawBrandingRecord raw;
  StyleSnapshot cta = MakeButtonSnapshot("Get Started", "rgb(225, 29, 72)", "btn btn-primary");
  raw.snapshots.push_back(cta);
  BrandingProfile profile = SwatchBrandingProcessor::Process(raw);

  json node = SwatchBrandingJson::ProfileToJson(profile);
  EXPECT_EQ(node["colorScheme"].get<std::string>(), "light");
  EXPECT_TRUE(node["colors"].contains("textPrimary"));
  EXPECT_EQ(node["spacing"]["baseUnit"].get<int>(), 8);
  EXPECT_EQ(node["buttonSelection"]["primaryIndex"].get<int>(), 0);
  EXPECT_TRUE(node["buttonSelection"]["secondaryIndex"].is_null());
  EXPECT_TRUE(node["components"]["buttonSecondary"].is_null());
  EXPECT_TRUE(node["images"]["logo"].is_null());
  EXPECT_EQ(node["buttonCandidates"].size(), 1u);
  ASSERT_TRUE(node.contains("debug"));
  EXPECT_TRUE(node["debug"].contains("allDetectedColors"));
  EXPECT_FALSE(node["debug"].contains("mergeReport"));

  profile.has_debug = false;
  profile.button_candidates.clear();
  node = SwatchBrandingJson::ProfileToJson(profile);
  EXPECT_FALSE(node.contains("debug"));
  EXPECT_FALSE(node.contains("buttonCandidates"));
}

TEST(SwatchBrandingJsonTest, MergeReportFields) {
  MergeReport report;
  report.classifier_attempted = true;
  report.color_primary = FieldSource::OVERRIDDEN;
  report.logo_confidence = 0.5;

  json node = SwatchBrandingJson::MergeReportToJson(report);
  EXPECT_TRUE(node["classifierAttempted"].get<bool>());
  EXPECT_TRUE(node["classifierError"].is_null());
  EXPECT_EQ(node["fields"]["colorPrimary"].get<std::string>(), "overridden");
  EXPECT_EQ(node["fields"]["logo"].get<std::string>(), "kept_heuristic");
  EXPECT_DOUBLE_EQ(node["confidence"]["logo"].get<double>(), 0.5);
}

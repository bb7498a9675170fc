#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

// Value types shared by the collector, the inference engine, the classifier
// contract and the merger. Absent colours and strings are empty; the JSON
// layer writes them as null.

enum class ColorScheme {
  LIGHT,
  DARK
};

inline const char* ColorSchemeToString(ColorScheme scheme) {
  return scheme == ColorScheme::DARK ? "dark" : "light";
}

inline ColorScheme ParseColorScheme(const std::string& str) {
  return str == "dark" ? ColorScheme::DARK : ColorScheme::LIGHT;
}

// ============================================================================
// Raw Branding Record (collector output)
// ============================================================================

// One stylesheet or rule the collector could not read
struct CollectionSkip {
  std::string source;  // "stylesheet[2]", "stylesheet[2].rule[14]", ...
  std::string reason;
};

struct FontFace {
  std::string family;
  std::string src;
};

struct CssData {
  std::vector<std::string> colors;    // distinct hexified colours, first-seen order
  std::vector<double> radii;          // distinct px values
  std::vector<double> spacings;       // distinct px values
  std::map<std::string, std::string> custom_properties;
  std::vector<std::string> fonts;     // families named in rules, in order
  std::vector<FontFace> font_faces;
  std::vector<CollectionSkip> skipped;
};

struct SnapshotRect {
  double w = 0.0;
  double h = 0.0;
};

struct SnapshotColors {
  std::string text;        // raw computed values
  std::string background;
  std::string border;
  double border_width = 0.0;
};

struct SnapshotTypography {
  std::string family;                   // cleaned first family of the stack
  std::vector<std::string> font_stack;  // cleaned full stack
  std::string size;
  int weight = 0;                       // 0 when unresolved
};

struct StyleSnapshot {
  std::string tag;
  std::string classes;  // lower-cased className
  std::string text;     // trimmed, collapsed, truncated
  SnapshotRect rect;
  SnapshotColors colors;
  SnapshotTypography typography;
  bool has_radius = false;
  double radius = 0.0;
  bool is_button = false;
  bool is_input = false;
  bool is_link = false;
  bool has_cta_indicator = false;
  std::string shadow;   // empty when box-shadow is none
};

enum class ImageType {
  FAVICON,
  OG,
  TWITTER,
  LOGO,
  LOGO_SVG
};

inline const char* ImageTypeToString(ImageType type) {
  switch (type) {
    case ImageType::FAVICON: return "favicon";
    case ImageType::OG: return "og";
    case ImageType::TWITTER: return "twitter";
    case ImageType::LOGO: return "logo";
    case ImageType::LOGO_SVG: return "logo-svg";
    default: return "logo";
  }
}

// Returns false for unknown type names
inline bool ParseImageType(const std::string& str, ImageType& out) {
  if (str == "favicon") { out = ImageType::FAVICON; return true; }
  if (str == "og") { out = ImageType::OG; return true; }
  if (str == "twitter") { out = ImageType::TWITTER; return true; }
  if (str == "logo") { out = ImageType::LOGO; return true; }
  if (str == "logo-svg") { out = ImageType::LOGO_SVG; return true; }
  return false;
}

struct BrandImage {
  ImageType type = ImageType::LOGO;
  std::string src;
};

struct TypographyStacks {
  std::vector<std::string> body;
  std::vector<std::string> heading;
};

struct FontSizes {
  std::string h1;
  std::string h2;
  std::string body;
};

struct RawTypography {
  TypographyStacks stacks;
  FontSizes sizes;
};

struct BackgroundCandidate {
  std::string color;   // hexified
  std::string source;  // "body", "html", "#__next", ...
  double area = 0.0;
};

struct LogoCandidate {
  std::string src;
  std::string alt;
  bool is_svg = false;
  bool in_header = false;
  bool href_matches_root = false;  // wrapped in a link to "/" or the site root
  double top = 0.0;
  double left = 0.0;
  double width = 0.0;
  double height = 0.0;
  std::string source;  // "header-link", "img", "svg"
};

struct RawBrandingRecord {
  CssData css_data;
  std::vector<StyleSnapshot> snapshots;
  std::vector<BrandImage> images;
  ColorScheme color_scheme = ColorScheme::LIGHT;
  RawTypography typography;
  std::set<std::string> framework_hints;
  std::string page_background;
  std::string link_color;
  std::vector<BackgroundCandidate> background_candidates;
  std::vector<LogoCandidate> logo_candidates;
  std::string brand_name;
};

// ============================================================================
// Branding profile (inference and merge output)
// ============================================================================

struct Palette {
  std::string primary;
  std::string accent;
  std::string background;
  std::string text_primary;
  std::string link;
};

struct FontUsage {
  std::string family;
  int count = 0;
};

struct FontFamilies {
  std::string primary;
  std::string heading;
};

struct TypographyProfile {
  FontFamilies font_families;
  TypographyStacks font_stacks;
  FontSizes font_sizes;
};

struct SpacingProfile {
  int base_unit = 8;
  std::string border_radius = "8px";
};

struct ButtonStyle {
  std::string background;
  std::string text_color;
  std::string border_color;
  std::string border_radius;
};

struct InputStyle {
  std::string border_color;
  std::string border_radius;
};

struct ComponentsProfile {
  InputStyle input;
  bool has_button_primary = false;
  ButtonStyle button_primary;
  bool has_button_secondary = false;
  ButtonStyle button_secondary;
};

// Indices into BrandingProfile::button_candidates; -1 when unset
struct ButtonSelection {
  int primary_index = -1;
  int secondary_index = -1;
};

struct ImagesProfile {
  std::string logo;
  std::string favicon;
  std::string og_image;
};

struct ButtonCandidate {
  int index = 0;
  std::string text;
  std::string classes;
  std::string background;     // hex; never empty for an eligible candidate
  std::string text_color;
  std::string border_color;   // empty when the border has no width
  std::string border_radius;
  std::string shadow;
  double score = 0.0;
  double area = 0.0;
  std::string signature;
  int duplicate_count = 1;    // occurrences collapsed into this candidate
  std::string original_background;
  std::string original_text_color;
  std::string original_border_color;
};

struct ColorFrequency {
  std::string hex;
  double frequency = 0.0;
  bool is_grayish = false;
  double yiq = 0.0;
};

struct SourcedColor {
  std::string hex;
  std::string tag;
  std::string classes;  // first 50 chars
  double area = 0.0;    // backgrounds only
};

enum class FieldSource {
  KEPT_HEURISTIC,
  OVERRIDDEN
};

inline const char* FieldSourceToString(FieldSource source) {
  return source == FieldSource::OVERRIDDEN ? "overridden" : "kept_heuristic";
}

// Which input won for every field the merger may touch
struct MergeReport {
  bool classifier_attempted = false;
  bool classifier_succeeded = false;
  std::string classifier_error;
  FieldSource button_primary = FieldSource::KEPT_HEURISTIC;
  FieldSource button_secondary = FieldSource::KEPT_HEURISTIC;
  FieldSource color_primary = FieldSource::KEPT_HEURISTIC;
  FieldSource color_accent = FieldSource::KEPT_HEURISTIC;
  FieldSource color_background = FieldSource::KEPT_HEURISTIC;
  FieldSource color_text_primary = FieldSource::KEPT_HEURISTIC;
  FieldSource color_link = FieldSource::KEPT_HEURISTIC;
  FieldSource logo = FieldSource::KEPT_HEURISTIC;
  double button_confidence = 0.0;
  double color_confidence = 0.0;
  double logo_confidence = 0.0;
};

struct BrandingDebug {
  std::vector<ColorFrequency> all_detected_colors;
  std::vector<BackgroundCandidate> background_candidates;
  std::vector<std::string> raw_css_colors;
  std::vector<SourcedColor> snapshot_backgrounds;
  std::vector<SourcedColor> snapshot_texts;
  std::vector<SourcedColor> snapshot_borders;
  Palette inferred_palette;
  std::vector<CollectionSkip> collection_skips;
  bool has_merge_report = false;
  MergeReport merge_report;
};

struct BrandingProfile {
  ColorScheme color_scheme = ColorScheme::LIGHT;
  std::vector<FontUsage> fonts;
  Palette colors;
  TypographyProfile typography;
  SpacingProfile spacing;
  ComponentsProfile components;
  ButtonSelection button_selection;
  ImagesProfile images;
  std::vector<ButtonCandidate> button_candidates;
  std::set<std::string> framework_hints;
  bool has_debug = false;
  BrandingDebug debug;
};

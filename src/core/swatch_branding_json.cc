#include "core/swatch_branding_json.h"

using json = nlohmann::json;

namespace {

json Nullable(const std::string& value) {
  return value.empty() ? json(nullptr) : json(value);
}

json NullableIndex(int index) {
  return index < 0 ? json(nullptr) : json(index);
}

std::string GetString(const json& node, const char* key) {
  auto it = node.find(key);
  return (it != node.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

double GetNumber(const json& node, const char* key, double fallback = 0.0) {
  auto it = node.find(key);
  return (it != node.end() && it->is_number()) ? it->get<double>() : fallback;
}

bool GetBool(const json& node, const char* key) {
  auto it = node.find(key);
  return it != node.end() && it->is_boolean() && it->get<bool>();
}

const json& GetObject(const json& node, const char* key) {
  static const json empty = json::object();
  auto it = node.find(key);
  return (it != node.end() && it->is_object()) ? *it : empty;
}

const json& GetArray(const json& node, const char* key) {
  static const json empty = json::array();
  auto it = node.find(key);
  return (it != node.end() && it->is_array()) ? *it : empty;
}

std::vector<std::string> GetStrings(const json& node, const char* key) {
  std::vector<std::string> values;
  for (const auto& item : GetArray(node, key)) {
    if (item.is_string()) {
      values.push_back(item.get<std::string>());
    }
  }
  return values;
}

std::vector<double> GetNumbers(const json& node, const char* key) {
  std::vector<double> values;
  for (const auto& item : GetArray(node, key)) {
    if (item.is_number()) {
      values.push_back(item.get<double>());
    }
  }
  return values;
}

json StacksToJson(const TypographyStacks& stacks) {
  return {{"body", stacks.body}, {"heading", stacks.heading}};
}

json SizesToJson(const FontSizes& sizes) {
  return {{"h1", Nullable(sizes.h1)}, {"h2", Nullable(sizes.h2)}, {"body", Nullable(sizes.body)}};
}

json PaletteToJson(const Palette& palette) {
  return {
    {"primary", Nullable(palette.primary)},
    {"accent", Nullable(palette.accent)},
    {"background", Nullable(palette.background)},
    {"textPrimary", Nullable(palette.text_primary)},
    {"link", Nullable(palette.link)},
  };
}

json ButtonStyleToJson(const ButtonStyle& style) {
  return {
    {"background", Nullable(style.background)},
    {"textColor", Nullable(style.text_color)},
    {"borderColor", Nullable(style.border_color)},
    {"borderRadius", Nullable(style.border_radius)},
  };
}

json BackgroundCandidatesToJson(const std::vector<BackgroundCandidate>& candidates) {
  json list = json::array();
  for (const auto& candidate : candidates) {
    list.push_back({{"color", Nullable(candidate.color)}, {"source", candidate.source}, {"area", candidate.area}});
  }
  return list;
}

json SkipsToJson(const std::vector<CollectionSkip>& skips) {
  json list = json::array();
  for (const auto& skip : skips) {
    list.push_back({{"source", skip.source}, {"reason", skip.reason}});
  }
  return list;
}

json SourcedToJson(const std::vector<SourcedColor>& colors, bool with_area) {
  json list = json::array();
  for (const auto& color : colors) {
    json entry = {{"hex", color.hex}, {"tag", color.tag}, {"classes", color.classes}};
    if (with_area) {
      entry["area"] = color.area;
    }
    list.push_back(entry);
  }
  return list;
}

}  // namespace

// ============================================================================
// Profile
// ============================================================================

json SwatchBrandingJson::MergeReportToJson(const MergeReport& report) {
  return {
    {"classifierAttempted", report.classifier_attempted},
    {"classifierSucceeded", report.classifier_succeeded},
    {"classifierError", Nullable(report.classifier_error)},
    {"fields", {
      {"buttonPrimary", FieldSourceToString(report.button_primary)},
      {"buttonSecondary", FieldSourceToString(report.button_secondary)},
      {"colorPrimary", FieldSourceToString(report.color_primary)},
      {"colorAccent", FieldSourceToString(report.color_accent)},
      {"colorBackground", FieldSourceToString(report.color_background)},
      {"colorTextPrimary", FieldSourceToString(report.color_text_primary)},
      {"colorLink", FieldSourceToString(report.color_link)},
      {"logo", FieldSourceToString(report.logo)},
    }},
    {"confidence", {
      {"buttons", report.button_confidence},
      {"colors", report.color_confidence},
      {"logo", report.logo_confidence},
    }},
  };
}

json SwatchBrandingJson::DebugToJson(const BrandingDebug& debug) {
  json colors = json::array();
  for (const auto& freq : debug.all_detected_colors) {
    colors.push_back({{"hex", freq.hex}, {"frequency", freq.frequency},
                      {"isGrayish", freq.is_grayish}, {"yiq", freq.yiq}});
  }

  json node = {
    {"allDetectedColors", colors},
    {"backgroundCandidates", BackgroundCandidatesToJson(debug.background_candidates)},
    {"rawCssColors", debug.raw_css_colors},
    {"snapshotColors", {
      {"backgrounds", SourcedToJson(debug.snapshot_backgrounds, true)},
      {"texts", SourcedToJson(debug.snapshot_texts, false)},
      {"borders", SourcedToJson(debug.snapshot_borders, false)},
    }},
    {"inferredPalette", PaletteToJson(debug.inferred_palette)},
    {"collectionSkips", SkipsToJson(debug.collection_skips)},
  };
  if (debug.has_merge_report) {
    node["mergeReport"] = MergeReportToJson(debug.merge_report);
  }
  return node;
}

json SwatchBrandingJson::ProfileToJson(const BrandingProfile& profile) {
  json fonts = json::array();
  for (const auto& font : profile.fonts) {
    fonts.push_back({{"family", font.family}, {"count", font.count}});
  }

  const ComponentsProfile& components = profile.components;
  json components_json = {
    {"input", {
      {"borderColor", Nullable(components.input.border_color)},
      {"borderRadius", Nullable(components.input.border_radius)},
    }},
    {"buttonPrimary", components.has_button_primary ? ButtonStyleToJson(components.button_primary) : json(nullptr)},
    {"buttonSecondary", components.has_button_secondary ? ButtonStyleToJson(components.button_secondary) : json(nullptr)},
  };

  json root = {
    {"colorScheme", ColorSchemeToString(profile.color_scheme)},
    {"fonts", fonts},
    {"colors", PaletteToJson(profile.colors)},
    {"typography", {
      {"fontFamilies", {
        {"primary", Nullable(profile.typography.font_families.primary)},
        {"heading", Nullable(profile.typography.font_families.heading)},
      }},
      {"fontStacks", StacksToJson(profile.typography.font_stacks)},
      {"fontSizes", SizesToJson(profile.typography.font_sizes)},
    }},
    {"spacing", {
      {"baseUnit", profile.spacing.base_unit},
      {"borderRadius", profile.spacing.border_radius},
    }},
    {"components", components_json},
    {"images", {
      {"logo", Nullable(profile.images.logo)},
      {"favicon", Nullable(profile.images.favicon)},
      {"ogImage", Nullable(profile.images.og_image)},
    }},
    {"buttonSelection", {
      {"primaryIndex", NullableIndex(profile.button_selection.primary_index)},
      {"secondaryIndex", NullableIndex(profile.button_selection.secondary_index)},
    }},
    {"frameworkHints", profile.framework_hints},
  };

  if (!profile.button_candidates.empty()) {
    json buttons = json::array();
    for (const auto& button : profile.button_candidates) {
      buttons.push_back({
        {"index", button.index},
        {"text", button.text},
        {"classes", button.classes},
        {"background", Nullable(button.background)},
        {"textColor", Nullable(button.text_color)},
        {"borderColor", Nullable(button.border_color)},
        {"borderRadius", button.border_radius},
        {"shadow", Nullable(button.shadow)},
        {"score", button.score},
        {"area", button.area},
        {"duplicateCount", button.duplicate_count},
        {"originalBackgroundColor", Nullable(button.original_background)},
        {"originalTextColor", Nullable(button.original_text_color)},
        {"originalBorderColor", Nullable(button.original_border_color)},
      });
    }
    root["buttonCandidates"] = buttons;
  }

  if (profile.has_debug) {
    root["debug"] = DebugToJson(profile.debug);
  }
  return root;
}

std::string SwatchBrandingJson::SerializeProfile(const BrandingProfile& profile, int indent) {
  // Replace invalid UTF-8 from page text instead of throwing
  return ProfileToJson(profile).dump(indent, ' ', false, json::error_handler_t::replace);
}

// ============================================================================
// Raw record
// ============================================================================

json SwatchBrandingJson::SnapshotToJson(const StyleSnapshot& snapshot) {
  return {
    {"tag", snapshot.tag},
    {"classes", snapshot.classes},
    {"text", snapshot.text},
    {"rect", {{"w", snapshot.rect.w}, {"h", snapshot.rect.h}}},
    {"colors", {
      {"text", Nullable(snapshot.colors.text)},
      {"background", Nullable(snapshot.colors.background)},
      {"border", Nullable(snapshot.colors.border)},
      {"borderWidth", snapshot.colors.border_width},
    }},
    {"typography", {
      {"family", Nullable(snapshot.typography.family)},
      {"fontStack", snapshot.typography.font_stack},
      {"size", Nullable(snapshot.typography.size)},
      {"weight", snapshot.typography.weight},
    }},
    {"radius", snapshot.has_radius ? json(snapshot.radius) : json(nullptr)},
    {"isButton", snapshot.is_button},
    {"isInput", snapshot.is_input},
    {"isLink", snapshot.is_link},
    {"hasCTAIndicator", snapshot.has_cta_indicator},
    {"shadow", Nullable(snapshot.shadow)},
  };
}

StyleSnapshot SwatchBrandingJson::SnapshotFromJson(const json& node) {
  StyleSnapshot snapshot;
  snapshot.tag = GetString(node, "tag");
  snapshot.classes = GetString(node, "classes");
  snapshot.text = GetString(node, "text");

  const json& rect = GetObject(node, "rect");
  snapshot.rect.w = GetNumber(rect, "w");
  snapshot.rect.h = GetNumber(rect, "h");

  const json& colors = GetObject(node, "colors");
  snapshot.colors.text = GetString(colors, "text");
  snapshot.colors.background = GetString(colors, "background");
  snapshot.colors.border = GetString(colors, "border");
  snapshot.colors.border_width = GetNumber(colors, "borderWidth");

  const json& typography = GetObject(node, "typography");
  snapshot.typography.family = GetString(typography, "family");
  snapshot.typography.font_stack = GetStrings(typography, "fontStack");
  snapshot.typography.size = GetString(typography, "size");
  // CSS font-weight is 1..1000; anything else is unresolved
  double weight = GetNumber(typography, "weight");
  if (weight >= 1 && weight <= 1000) {
    snapshot.typography.weight = static_cast<int>(weight);
  }

  auto radius = node.find("radius");
  if (radius != node.end() && radius->is_number()) {
    snapshot.has_radius = true;
    snapshot.radius = radius->get<double>();
  }

  snapshot.is_button = GetBool(node, "isButton");
  snapshot.is_input = GetBool(node, "isInput");
  snapshot.is_link = GetBool(node, "isLink");
  snapshot.has_cta_indicator = GetBool(node, "hasCTAIndicator");
  snapshot.shadow = GetString(node, "shadow");
  return snapshot;
}

json SwatchBrandingJson::LogoCandidateToJson(const LogoCandidate& logo) {
  return {
    {"src", logo.src},
    {"alt", logo.alt},
    {"isSvg", logo.is_svg},
    {"location", logo.in_header ? "header" : "body"},
    {"hrefMatchesRoot", logo.href_matches_root},
    {"position", {{"top", logo.top}, {"left", logo.left}, {"width", logo.width}, {"height", logo.height}}},
    {"source", logo.source},
  };
}

LogoCandidate SwatchBrandingJson::LogoCandidateFromJson(const json& node) {
  LogoCandidate logo;
  logo.src = GetString(node, "src");
  logo.alt = GetString(node, "alt");
  logo.is_svg = GetBool(node, "isSvg");
  logo.in_header = GetString(node, "location") == "header";
  logo.href_matches_root = GetBool(node, "hrefMatchesRoot");
  const json& position = GetObject(node, "position");
  logo.top = GetNumber(position, "top");
  logo.left = GetNumber(position, "left");
  logo.width = GetNumber(position, "width");
  logo.height = GetNumber(position, "height");
  logo.source = GetString(node, "source");
  return logo;
}

json SwatchBrandingJson::RawRecordToJson(const RawBrandingRecord& raw) {
  json font_faces = json::array();
  for (const auto& face : raw.css_data.font_faces) {
    font_faces.push_back({{"family", face.family}, {"src", face.src}});
  }

  json snapshots = json::array();
  for (const auto& snapshot : raw.snapshots) {
    snapshots.push_back(SnapshotToJson(snapshot));
  }

  json images = json::array();
  for (const auto& image : raw.images) {
    images.push_back({{"type", ImageTypeToString(image.type)}, {"src", image.src}});
  }

  json logos = json::array();
  for (const auto& logo : raw.logo_candidates) {
    logos.push_back(LogoCandidateToJson(logo));
  }

  return {
    {"cssData", {
      {"colors", raw.css_data.colors},
      {"radii", raw.css_data.radii},
      {"spacings", raw.css_data.spacings},
      {"customProperties", raw.css_data.custom_properties},
      {"fonts", raw.css_data.fonts},
      {"fontFaces", font_faces},
      {"skipped", SkipsToJson(raw.css_data.skipped)},
    }},
    {"snapshots", snapshots},
    {"images", images},
    {"colorScheme", ColorSchemeToString(raw.color_scheme)},
    {"typography", {
      {"stacks", StacksToJson(raw.typography.stacks)},
      {"sizes", SizesToJson(raw.typography.sizes)},
    }},
    {"frameworkHints", raw.framework_hints},
    {"pageBackground", Nullable(raw.page_background)},
    {"linkColor", Nullable(raw.link_color)},
    {"backgroundCandidates", BackgroundCandidatesToJson(raw.background_candidates)},
    {"logoCandidates", logos},
    {"brandName", Nullable(raw.brand_name)},
  };
}

bool SwatchBrandingJson::RawRecordFromJson(const json& root, RawBrandingRecord& out, std::string& error) {
  if (!root.is_object()) {
    error = "Raw branding record must be a JSON object";
    return false;
  }

  RawBrandingRecord raw;

  const json& css = GetObject(root, "cssData");
  raw.css_data.colors = GetStrings(css, "colors");
  raw.css_data.radii = GetNumbers(css, "radii");
  raw.css_data.spacings = GetNumbers(css, "spacings");
  const json& custom = GetObject(css, "customProperties");
  for (auto it = custom.begin(); it != custom.end(); ++it) {
    if (it.value().is_string()) {
      raw.css_data.custom_properties[it.key()] = it.value().get<std::string>();
    }
  }
  raw.css_data.fonts = GetStrings(css, "fonts");
  for (const auto& face : GetArray(css, "fontFaces")) {
    if (face.is_object()) {
      raw.css_data.font_faces.push_back({GetString(face, "family"), GetString(face, "src")});
    }
  }
  for (const auto& skip : GetArray(css, "skipped")) {
    if (skip.is_object()) {
      raw.css_data.skipped.push_back({GetString(skip, "source"), GetString(skip, "reason")});
    }
  }

  for (const auto& snapshot : GetArray(root, "snapshots")) {
    if (snapshot.is_object()) {
      raw.snapshots.push_back(SnapshotFromJson(snapshot));
    }
  }

  for (const auto& image : GetArray(root, "images")) {
    ImageType type;
    if (image.is_object() && ParseImageType(GetString(image, "type"), type)) {
      std::string src = GetString(image, "src");
      if (!src.empty()) {
        raw.images.push_back({type, src});
      }
    }
  }

  raw.color_scheme = ParseColorScheme(GetString(root, "colorScheme"));

  const json& typography = GetObject(root, "typography");
  const json& stacks = GetObject(typography, "stacks");
  raw.typography.stacks.body = GetStrings(stacks, "body");
  raw.typography.stacks.heading = GetStrings(stacks, "heading");
  const json& sizes = GetObject(typography, "sizes");
  raw.typography.sizes.h1 = GetString(sizes, "h1");
  raw.typography.sizes.h2 = GetString(sizes, "h2");
  raw.typography.sizes.body = GetString(sizes, "body");

  for (const auto& hint : GetStrings(root, "frameworkHints")) {
    raw.framework_hints.insert(hint);
  }

  raw.page_background = GetString(root, "pageBackground");
  raw.link_color = GetString(root, "linkColor");

  for (const auto& candidate : GetArray(root, "backgroundCandidates")) {
    if (candidate.is_object()) {
      raw.background_candidates.push_back(
          {GetString(candidate, "color"), GetString(candidate, "source"), GetNumber(candidate, "area")});
    }
  }

  for (const auto& logo : GetArray(root, "logoCandidates")) {
    if (logo.is_object()) {
      raw.logo_candidates.push_back(LogoCandidateFromJson(logo));
    }
  }

  raw.brand_name = GetString(root, "brandName");

  out = raw;
  return true;
}

bool SwatchBrandingJson::ParseRawRecord(const std::string& text, RawBrandingRecord& out, std::string& error) {
  json root = json::parse(text, nullptr, false);
  if (root.is_discarded()) {
    error = "Raw branding record is not valid JSON";
    return false;
  }
  return RawRecordFromJson(root, out, error);
}

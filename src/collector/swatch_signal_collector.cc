#include "collector/swatch_signal_collector.h"
#include "collector/swatch_css_values.h"
#include "collector/swatch_svg_resolver.h"
#include "color/swatch_color.h"
#include "util/logger.h"
#include <algorithm>
#include <exception>
#include <initializer_list>

const char* const SwatchSignalCollector::kLogoImageSelector =
    "header img, .site-logo img, img[alt*=logo i], img[src*=\"logo\"]";
const char* const SwatchSignalCollector::kButtonSelector =
    "button, [role=button], a.button, a.btn, [class*=\"btn\"]";
const char* const SwatchSignalCollector::kFormControlSelector =
    "input, select, textarea, [class*=\"form-control\"]";
const char* const SwatchSignalCollector::kTextSelector = "h1, h2, h3, p, a";

const char* const SwatchSignalCollector::kHeaderLinkLogoSelector =
    "header a img, header a svg, nav a img, nav a svg, "
    "[role=\"banner\"] a img, [role=\"banner\"] a svg";
const char* const SwatchSignalCollector::kHeaderRegionSelector =
    "header, nav, [role=\"banner\"]";
const char* const SwatchSignalCollector::kLogoContainerSelector = "[class*=\"logo\" i]";
const char* const SwatchSignalCollector::kLogoExclusionSelector =
    "[class*=\"testimonial\" i], [class*=\"client\" i], [class*=\"partner\" i]";

namespace {

const char* const kColorProperties[] = {
  "color", "background-color", "border-color", "fill", "stroke"
};

const char* const kRadiusProperties[] = {
  "border-radius", "border-top-left-radius", "border-top-right-radius",
  "border-bottom-left-radius", "border-bottom-right-radius"
};

const char* const kSpacingProperties[] = {
  "margin", "margin-top", "margin-right", "margin-bottom", "margin-left",
  "padding", "padding-top", "padding-right", "padding-bottom", "padding-left",
  "gap", "row-gap", "column-gap"
};

const char* const kAppRootSelectors[] = {
  "#__next", "#root", "#app", "#__nuxt", "main"
};

const char* const kDarkAttributes[] = {
  "data-theme", "data-mode", "data-bs-theme", "data-color-mode"
};

struct ScriptFingerprint {
  const char* pattern;
  const char* hint;
};

const ScriptFingerprint kScriptFingerprints[] = {
  {"/_next/", "next.js"},
  {"/_nuxt/", "nuxt"},
  {"gatsby", "gatsby"},
  {"wp-content", "wordpress"},
  {"wp-includes", "wordpress"},
  {"cdn.shopify.com", "shopify"},
  {"webflow", "webflow"},
  {"squarespace", "squarespace"},
  {"wixstatic", "wix"},
  {"parastorage", "wix"},
  {"framer", "framer"},
  {"drupal", "drupal"},
  {"hs-scripts", "hubspot"},
  {"hubspot", "hubspot"},
  {"react", "react"},
  {"vue", "vue"},
  {"angular", "angular"},
  {"svelte", "svelte"},
};

const char* const kGeneratorFingerprints[][2] = {
  {"next.js", "next.js"},
  {"nuxt", "nuxt"},
  {"gatsby", "gatsby"},
  {"wordpress", "wordpress"},
  {"shopify", "shopify"},
  {"webflow", "webflow"},
  {"squarespace", "squarespace"},
  {"wix", "wix"},
  {"framer", "framer"},
  {"drupal", "drupal"},
  {"hubspot", "hubspot"},
};

const char* const kTitleSeparators[] = {" | ", " - ", " \xE2\x80\x93 ", " \xE2\x80\x94 ", " \xC2\xB7 "};

// Last declaration for a property, as CSSStyleDeclaration.getPropertyValue would return
std::string DeclarationValue(const CssRuleInfo& rule, const std::string& property) {
  std::string value;
  for (const auto& decl : rule.declarations) {
    if (SwatchCssValues::ToLower(decl.first) == property) {
      value = decl.second;
    }
  }
  return SwatchCssValues::Trim(value);
}

void AddDistinct(std::vector<double>& values, double value) {
  if (std::find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(value);
  }
}

std::string StripQuotes(const std::string& value) {
  std::string out;
  for (char c : value) {
    if (c != '"' && c != '\'') {
      out += c;
    }
  }
  return SwatchCssValues::Trim(out);
}

// Cleaned stack with generated fallback families dropped
std::vector<std::string> CleanFontStack(const std::string& font_family) {
  std::vector<std::string> cleaned;
  for (const auto& family : SwatchCssValues::SplitFontStack(font_family)) {
    std::string name = SwatchCssValues::CleanNextJsFontName(family);
    if (!name.empty()) {
      cleaned.push_back(name);
    }
  }
  return cleaned;
}

bool IsRootHref(const std::string& href) {
  std::string h = SwatchCssValues::Trim(href);
  return h == "/" || h == "./" || h.compare(0, 2, "/?") == 0 || h.compare(0, 2, "/#") == 0;
}

}  // namespace

std::string SwatchSignalCollector::HexifyWithPage(SwatchPageAccessor& page, const std::string& css_color) {
  std::string hex = SwatchColor::Hexify(css_color);
  if (!hex.empty()) {
    return hex;
  }

  // Only bare keywords are worth a canvas round trip
  std::string value = SwatchCssValues::Trim(css_color);
  if (value.empty() || value.find_first_of("( \t") != std::string::npos) {
    return "";
  }
  try {
    return SwatchColor::Hexify(page.ResolveColor(value));
  } catch (const std::exception& e) {
    LOG_DEBUG("SignalCollector", "Canvas colour resolution failed for '" + value + "': " + e.what());
    return "";
  }
}

RawBrandingRecord SwatchSignalCollector::Collect(SwatchPageAccessor& page) {
  RawBrandingRecord record;

  double root_font_px = 16.0;
  double body_font_px = 16.0;
  std::string font_size_error;
  try {
    root_font_px = FontSizePx(page, page.GetDocumentElement());
    body_font_px = FontSizePx(page, page.GetBody());
  } catch (const std::exception& e) {
    font_size_error = e.what();
  }

  record.css_data = CollectCssData(page, root_font_px, body_font_px);
  if (!font_size_error.empty()) {
    record.css_data.skipped.push_back({"font-size", font_size_error});
  }

  std::vector<ElementHandle> sample;
  try {
    sample = SampleElements(page);
  } catch (const std::exception& e) {
    record.css_data.skipped.push_back({"sampling", e.what()});
  }
  for (size_t i = 0; i < sample.size(); i++) {
    try {
      record.snapshots.push_back(TakeSnapshot(page, sample[i], root_font_px, body_font_px));
    } catch (const std::exception& e) {
      record.css_data.skipped.push_back({"snapshot[" + std::to_string(i) + "]", e.what()});
    }
  }

  try {
    FindImages(page, record.images, record.logo_candidates);
  } catch (const std::exception& e) {
    record.css_data.skipped.push_back({"images", e.what()});
  }

  try {
    DetectColorScheme(page, record);
  } catch (const std::exception& e) {
    record.css_data.skipped.push_back({"color-scheme", e.what()});
  }

  try {
    record.typography = CollectTypography(page);
  } catch (const std::exception& e) {
    record.css_data.skipped.push_back({"typography", e.what()});
  }

  try {
    ElementHandle anchor = page.QuerySelector("a");
    if (anchor != kNoElement) {
      record.link_color = SwatchCssValues::Trim(page.GetComputedStyle(anchor, "color"));
    }
  } catch (const std::exception& e) {
    record.css_data.skipped.push_back({"link-color", e.what()});
  }

  record.framework_hints = DetectFrameworkHints(page);

  try {
    record.brand_name = FindBrandName(page);
  } catch (const std::exception& e) {
    record.css_data.skipped.push_back({"brand-name", e.what()});
  }

  LOG_DEBUG("SignalCollector", "Collected " + std::to_string(record.snapshots.size()) + " snapshots, " +
            std::to_string(record.css_data.colors.size()) + " stylesheet colours, " +
            std::to_string(record.css_data.skipped.size()) + " skipped items");
  return record;
}

// ============================================================================
// Stylesheets
// ============================================================================

CssData SwatchSignalCollector::CollectCssData(SwatchPageAccessor& page, double root_font_px, double body_font_px) {
  CssData data;
  std::set<std::string> seen_colors;

  int sheet_count = 0;
  try {
    sheet_count = page.GetStyleSheetCount();
  } catch (const std::exception& e) {
    data.skipped.push_back({"stylesheets", e.what()});
    return data;
  }

  for (int i = 0; i < sheet_count; i++) {
    std::string sheet_source = "stylesheet[" + std::to_string(i) + "]";

    StyleSheetInfo sheet;
    try {
      sheet = page.ReadStyleSheet(i);
    } catch (const std::exception& e) {
      data.skipped.push_back({sheet_source, e.what()});
      continue;
    }
    if (!sheet.accessible) {
      std::string reason = sheet.error.empty() ? "cssRules not accessible" : sheet.error;
      if (!sheet.href.empty()) {
        reason += " (" + sheet.href + ")";
      }
      data.skipped.push_back({sheet_source, reason});
      continue;
    }

    for (size_t j = 0; j < sheet.rules.size(); j++) {
      const CssRuleInfo& rule = sheet.rules[j];
      std::string rule_source = sheet_source + ".rule[" + std::to_string(j) + "]";
      if (!rule.error.empty()) {
        data.skipped.push_back({rule_source, rule.error});
        continue;
      }
      try {
        if (rule.type == CssRuleType::STYLE) {
          ProcessStyleRule(page, rule, root_font_px, body_font_px, data, seen_colors);
        } else if (rule.type == CssRuleType::FONT_FACE) {
          ProcessFontFaceRule(rule, data);
        }
      } catch (const std::exception& e) {
        data.skipped.push_back({rule_source, e.what()});
      }
    }
  }

  if (!data.skipped.empty()) {
    LOG_DEBUG("SignalCollector", "Skipped " + std::to_string(data.skipped.size()) + " stylesheet items");
  }
  return data;
}

void SwatchSignalCollector::ProcessStyleRule(SwatchPageAccessor& page, const CssRuleInfo& rule,
                                             double root_font_px, double body_font_px, CssData& data,
                                             std::set<std::string>& seen_colors) {
  auto add_color = [&](const std::string& value) {
    std::string hex = HexifyWithPage(page, value);
    if (!hex.empty() && seen_colors.insert(hex).second) {
      data.colors.push_back(hex);
    }
  };

  for (const auto& decl : rule.declarations) {
    if (decl.first.compare(0, 2, "--") == 0) {
      std::string value = SwatchCssValues::Trim(decl.second);
      data.custom_properties[decl.first] = value;
      add_color(value);
    }
  }

  for (const char* prop : kColorProperties) {
    std::string value = DeclarationValue(rule, prop);
    if (!value.empty()) {
      add_color(value);
    }
  }

  for (const char* prop : {"font-family", "font"}) {
    std::string value = DeclarationValue(rule, prop);
    if (value.empty()) {
      continue;
    }
    for (const auto& family : SwatchCssValues::SplitFontStack(value)) {
      data.fonts.push_back(family);
    }
  }

  double px = 0.0;
  for (const char* prop : kRadiusProperties) {
    if (SwatchCssValues::ToPx(DeclarationValue(rule, prop), root_font_px, body_font_px, px) && px != 0.0) {
      AddDistinct(data.radii, px);
    }
  }
  for (const char* prop : kSpacingProperties) {
    if (SwatchCssValues::ToPx(DeclarationValue(rule, prop), root_font_px, body_font_px, px) && px != 0.0) {
      AddDistinct(data.spacings, px);
    }
  }
}

void SwatchSignalCollector::ProcessFontFaceRule(const CssRuleInfo& rule, CssData& data) {
  FontFace face;
  face.family = StripQuotes(DeclarationValue(rule, "font-family"));
  face.src = DeclarationValue(rule, "src");
  if (face.family.empty() && face.src.empty()) {
    return;
  }
  data.font_faces.push_back(face);
  if (!face.family.empty()) {
    data.fonts.push_back(face.family);
  }
}

// ============================================================================
// Element sampling and snapshots
// ============================================================================

std::vector<ElementHandle> SwatchSignalCollector::SampleElements(SwatchPageAccessor& page) {
  std::vector<ElementHandle> sample;
  std::set<ElementHandle> seen;

  auto take = [&](const char* selector, int limit) {
    std::vector<ElementHandle> matches = page.QuerySelectorAll(selector);
    int taken = 0;
    for (ElementHandle el : matches) {
      if (taken >= limit) {
        break;
      }
      taken++;
      if (el != kNoElement && seen.insert(el).second) {
        sample.push_back(el);
      }
    }
  };

  take(kLogoImageSelector, kMaxLogoImages);
  take(kButtonSelector, kMaxButtons);
  take(kFormControlSelector, kMaxFormControls);
  take(kTextSelector, kMaxTextElements);
  return sample;
}

StyleSnapshot SwatchSignalCollector::TakeSnapshot(SwatchPageAccessor& page, ElementHandle element,
                                                  double root_font_px, double body_font_px) {
  StyleSnapshot snap;
  snap.tag = SwatchCssValues::ToLower(page.GetTagName(element));
  snap.classes = SwatchCssValues::ToLower(page.GetClassName(element));
  snap.text = SwatchCssValues::TruncateUtf8(
      SwatchCssValues::CollapseWhitespace(page.GetTextContent(element)), kMaxSnapshotText);

  ElementRect rect = page.GetBoundingClientRect(element);
  snap.rect.w = rect.width;
  snap.rect.h = rect.height;

  snap.colors.text = SwatchCssValues::Trim(page.GetComputedStyle(element, "color"));
  snap.colors.background = SwatchCssValues::Trim(page.GetComputedStyle(element, "background-color"));
  snap.colors.border = SwatchCssValues::Trim(page.GetComputedStyle(element, "border-top-color"));
  double px = 0.0;
  if (SwatchCssValues::ToPx(page.GetComputedStyle(element, "border-top-width"),
                            root_font_px, body_font_px, px)) {
    snap.colors.border_width = px;
  }

  if (SwatchCssValues::ToPx(page.GetComputedStyle(element, "border-radius"),
                            root_font_px, body_font_px, px)) {
    snap.has_radius = true;
    snap.radius = px;
  }

  std::string raw_family = page.GetComputedStyle(element, "font-family");
  snap.typography.font_stack = CleanFontStack(raw_family);
  std::vector<std::string> raw_stack = SwatchCssValues::SplitFontStack(raw_family);
  if (!raw_stack.empty()) {
    std::string cleaned = SwatchCssValues::CleanNextJsFontName(raw_stack.front());
    snap.typography.family = cleaned.empty() ? raw_stack.front() : cleaned;
  }
  snap.typography.size = SwatchCssValues::Trim(page.GetComputedStyle(element, "font-size"));
  double weight = 0.0;
  if (SwatchCssValues::LeadingNumber(page.GetComputedStyle(element, "font-weight"), weight)) {
    snap.typography.weight = static_cast<int>(weight);
  }

  snap.is_button = page.Matches(element, kButtonSelector);
  snap.is_input = page.Matches(element, kFormControlSelector);
  snap.is_link = snap.tag == "a";
  snap.has_cta_indicator = HasCtaIndicator(page, element, snap.classes);

  std::string shadow = SwatchCssValues::Trim(page.GetComputedStyle(element, "box-shadow"));
  if (shadow != "none") {
    snap.shadow = shadow;
  }
  return snap;
}

bool SwatchSignalCollector::HasCtaIndicator(SwatchPageAccessor& page, ElementHandle element,
                                            const std::string& classes) {
  for (const auto& token : SwatchCssValues::SplitTokens(classes)) {
    if (token.find("cta") != std::string::npos || token == "primary" ||
        token == "btn-primary" || token == "button-primary") {
      return true;
    }
  }
  return page.HasAttribute(element, "data-cta");
}

double SwatchSignalCollector::FontSizePx(SwatchPageAccessor& page, ElementHandle element) {
  if (element == kNoElement) {
    return 16.0;
  }
  double px = 0.0;
  if (SwatchCssValues::ToPx(page.GetComputedStyle(element, "font-size"), 16.0, 16.0, px) && px > 0) {
    return px;
  }
  return 16.0;
}

// ============================================================================
// Images and logos
// ============================================================================

void SwatchSignalCollector::FindImages(SwatchPageAccessor& page, std::vector<BrandImage>& images,
                                       std::vector<LogoCandidate>& logo_candidates) {
  auto push_property = [&](const char* selector, const char* property, ImageType type) {
    ElementHandle el = page.QuerySelector(selector);
    if (el == kNoElement) {
      return;
    }
    std::string src = SwatchCssValues::Trim(page.GetProperty(el, property));
    if (!src.empty()) {
      images.push_back({type, src});
    }
  };

  push_property("link[rel*=\"icon\" i]", "href", ImageType::FAVICON);
  push_property("meta[property=\"og:image\" i]", "content", ImageType::OG);
  push_property("meta[name=\"twitter:image\" i]", "content", ImageType::TWITTER);

  std::set<ElementHandle> described;
  auto describe = [&](ElementHandle el, const std::string& source) {
    if (static_cast<int>(logo_candidates.size()) >= kMaxLogoCandidates || !described.insert(el).second) {
      return;
    }
    try {
      logo_candidates.push_back(DescribeLogo(page, el, source));
    } catch (const std::exception& e) {
      LOG_DEBUG("SignalCollector", std::string("Logo candidate skipped: ") + e.what());
    }
  };

  // (1) image or SVG inside a link in the header region
  std::vector<ElementHandle> header_logos = page.QuerySelectorAll(kHeaderLinkLogoSelector);
  for (ElementHandle el : header_logos) {
    describe(el, "header-link");
  }

  std::vector<ElementHandle> logo_images;
  for (ElementHandle img : page.QuerySelectorAll("img")) {
    if (IsLogoImage(page, img)) {
      logo_images.push_back(img);
      describe(img, "img");
    }
  }

  std::vector<ElementHandle> logo_svgs;
  for (ElementHandle svg : page.QuerySelectorAll("svg")) {
    if (IsLogoSvg(page, svg)) {
      logo_svgs.push_back(svg);
      describe(svg, "svg");
    }
  }

  if (!header_logos.empty()) {
    ElementHandle el = header_logos.front();
    if (SwatchCssValues::ToLower(page.GetTagName(el)) == "svg") {
      std::string url = SwatchSvgResolver::ResolveToDataUrl(page, el);
      if (!url.empty()) {
        images.push_back({ImageType::LOGO_SVG, url});
        return;
      }
    } else {
      std::string src = SwatchCssValues::Trim(page.GetProperty(el, "src"));
      if (!src.empty()) {
        images.push_back({ImageType::LOGO, src});
        return;
      }
    }
  }

  // (2) best logo <img>
  ElementHandle best_img = PickBestLogo(page, logo_images);
  if (best_img != kNoElement) {
    std::string src = SwatchCssValues::Trim(page.GetProperty(best_img, "src"));
    if (!src.empty()) {
      images.push_back({ImageType::LOGO, src});
      return;
    }
  }

  // (3) best logo <svg>
  ElementHandle best_svg = PickBestLogo(page, logo_svgs);
  if (best_svg != kNoElement) {
    std::string url = SwatchSvgResolver::ResolveToDataUrl(page, best_svg);
    if (!url.empty()) {
      images.push_back({ImageType::LOGO_SVG, url});
    }
  }
}

bool SwatchSignalCollector::IsLogoImage(SwatchPageAccessor& page, ElementHandle img) {
  bool matches = SwatchCssValues::ContainsIgnoreCase(page.GetAttribute(img, "alt"), "logo") ||
                 SwatchCssValues::ContainsIgnoreCase(page.GetAttribute(img, "src"), "logo") ||
                 page.Closest(img, kLogoContainerSelector) != kNoElement;
  return matches && page.Closest(img, kLogoExclusionSelector) == kNoElement;
}

bool SwatchSignalCollector::IsLogoSvg(SwatchPageAccessor& page, ElementHandle svg) {
  bool matches = SwatchCssValues::ContainsIgnoreCase(page.GetAttribute(svg, "id"), "logo") ||
                 SwatchCssValues::ContainsIgnoreCase(page.GetClassName(svg), "logo") ||
                 page.Closest(svg, kLogoContainerSelector) != kNoElement;
  return matches && page.Closest(svg, kLogoExclusionSelector) == kNoElement;
}

ElementHandle SwatchSignalCollector::PickBestLogo(SwatchPageAccessor& page,
                                                  const std::vector<ElementHandle>& candidates) {
  ElementHandle best = kNoElement;
  bool best_in_header = false;
  double best_top = 0.0;

  for (ElementHandle el : candidates) {
    bool in_header = page.Closest(el, kHeaderRegionSelector) != kNoElement;
    double top = page.GetBoundingClientRect(el).y;
    if (best == kNoElement || (in_header && !best_in_header) ||
        (in_header == best_in_header && top < best_top)) {
      best = el;
      best_in_header = in_header;
      best_top = top;
    }
  }
  return best;
}

LogoCandidate SwatchSignalCollector::DescribeLogo(SwatchPageAccessor& page, ElementHandle element,
                                                  const std::string& source) {
  LogoCandidate candidate;
  candidate.source = source;
  candidate.is_svg = SwatchCssValues::ToLower(page.GetTagName(element)) == "svg";
  if (candidate.is_svg) {
    candidate.src = SwatchSvgResolver::ResolveToDataUrl(page, element);
    candidate.alt = page.GetAttribute(element, "aria-label");
  } else {
    candidate.src = SwatchCssValues::Trim(page.GetProperty(element, "src"));
    candidate.alt = page.GetAttribute(element, "alt");
  }
  candidate.in_header = page.Closest(element, kHeaderRegionSelector) != kNoElement;

  ElementHandle link = page.Closest(element, "a");
  if (link != kNoElement) {
    candidate.href_matches_root = IsRootHref(page.GetAttribute(link, "href"));
  }

  ElementRect rect = page.GetBoundingClientRect(element);
  candidate.top = rect.y;
  candidate.left = rect.x;
  candidate.width = rect.width;
  candidate.height = rect.height;
  return candidate;
}

// ============================================================================
// Colour scheme
// ============================================================================

void SwatchSignalCollector::DetectColorScheme(SwatchPageAccessor& page, RawBrandingRecord& record) {
  ElementHandle html = page.GetDocumentElement();
  ElementHandle body = page.GetBody();

  bool explicit_dark = HasExplicitDarkSignal(page, html) || HasExplicitDarkSignal(page, body);

  std::vector<std::pair<std::string, ElementHandle>> containers = {{"body", body}, {"html", html}};
  for (const char* selector : kAppRootSelectors) {
    containers.emplace_back(selector, page.QuerySelector(selector));
  }

  std::string scheme_background;
  for (const auto& container : containers) {
    if (container.second == kNoElement) {
      continue;
    }
    std::string raw = SwatchCssValues::Trim(page.GetComputedStyle(container.second, "background-color"));
    std::string hex = HexifyWithPage(page, raw);
    if (hex.empty() || SwatchColor::Alpha(hex) < 0.01) {
      continue;
    }
    ElementRect rect = page.GetBoundingClientRect(container.second);
    record.background_candidates.push_back({hex, container.first, rect.width * rect.height});
    if (scheme_background.empty()) {
      scheme_background = hex;
    }
  }
  record.page_background = scheme_background;

  if (explicit_dark) {
    record.color_scheme = ColorScheme::DARK;
    return;
  }

  double luminance = SwatchColor::RelativeLuminance(scheme_background);
  record.color_scheme = (luminance >= 0.0 && luminance < 0.4) ? ColorScheme::DARK : ColorScheme::LIGHT;
}

bool SwatchSignalCollector::HasExplicitDarkSignal(SwatchPageAccessor& page, ElementHandle element) {
  if (element == kNoElement) {
    return false;
  }
  for (const auto& token : SwatchCssValues::SplitTokens(SwatchCssValues::ToLower(page.GetClassName(element)))) {
    if (token == "dark" || token == "dark-mode" || token == "theme-dark") {
      return true;
    }
  }
  for (const char* attr : kDarkAttributes) {
    if (SwatchCssValues::ToLower(SwatchCssValues::Trim(page.GetAttribute(element, attr))) == "dark") {
      return true;
    }
  }
  return false;
}

// ============================================================================
// Typography, framework hints, brand name
// ============================================================================

RawTypography SwatchSignalCollector::CollectTypography(SwatchPageAccessor& page) {
  RawTypography typography;

  ElementHandle body = page.GetBody();
  ElementHandle h1 = page.QuerySelector("h1");
  ElementHandle h2 = page.QuerySelector("h2");
  ElementHandle p = page.QuerySelector("p");

  ElementHandle heading_el = h1 != kNoElement ? h1 : body;
  ElementHandle h2_el = h2 != kNoElement ? h2 : heading_el;
  ElementHandle body_el = p != kNoElement ? p : body;

  if (body != kNoElement) {
    typography.stacks.body = CleanFontStack(page.GetComputedStyle(body, "font-family"));
  }
  if (heading_el != kNoElement) {
    typography.stacks.heading = CleanFontStack(page.GetComputedStyle(heading_el, "font-family"));
  }

  auto size_of = [&](ElementHandle el, const char* fallback) {
    if (el == kNoElement) {
      return std::string(fallback);
    }
    std::string size = SwatchCssValues::Trim(page.GetComputedStyle(el, "font-size"));
    return size.empty() ? std::string(fallback) : size;
  };
  typography.sizes.h1 = size_of(heading_el, "32px");
  typography.sizes.h2 = size_of(h2_el, "24px");
  typography.sizes.body = size_of(body_el, "16px");
  return typography;
}

std::set<std::string> SwatchSignalCollector::DetectFrameworkHints(SwatchPageAccessor& page) {
  std::set<std::string> hints;

  try {
    ElementHandle generator = page.QuerySelector("meta[name=\"generator\" i]");
    if (generator != kNoElement) {
      std::string content = SwatchCssValues::ToLower(page.GetProperty(generator, "content"));
      for (const auto& fingerprint : kGeneratorFingerprints) {
        if (content.find(fingerprint[0]) != std::string::npos) {
          hints.insert(fingerprint[1]);
        }
      }
    }
  } catch (const std::exception& e) {
    LOG_DEBUG("SignalCollector", std::string("Generator meta unreadable: ") + e.what());
  }

  try {
    for (ElementHandle script : page.QuerySelectorAll("script[src]")) {
      std::string src = SwatchCssValues::ToLower(page.GetAttribute(script, "src"));
      for (const auto& fingerprint : kScriptFingerprints) {
        if (src.find(fingerprint.pattern) != std::string::npos) {
          hints.insert(fingerprint.hint);
        }
      }
    }
  } catch (const std::exception& e) {
    LOG_DEBUG("SignalCollector", std::string("Script sources unreadable: ") + e.what());
  }

  return hints;
}

std::string SwatchSignalCollector::FindBrandName(SwatchPageAccessor& page) {
  for (const char* selector : {"meta[property=\"og:site_name\" i]", "meta[name=\"application-name\" i]"}) {
    ElementHandle meta = page.QuerySelector(selector);
    if (meta != kNoElement) {
      std::string name = SwatchCssValues::CollapseWhitespace(page.GetProperty(meta, "content"));
      if (!name.empty()) {
        return name;
      }
    }
  }

  ElementHandle title = page.QuerySelector("title");
  if (title == kNoElement) {
    return "";
  }
  std::string text = SwatchCssValues::CollapseWhitespace(page.GetTextContent(title));
  size_t cut = text.size();
  for (const char* separator : kTitleSeparators) {
    size_t pos = text.find(separator);
    if (pos != std::string::npos && pos < cut) {
      cut = pos;
    }
  }
  return SwatchCssValues::Trim(text.substr(0, cut));
}

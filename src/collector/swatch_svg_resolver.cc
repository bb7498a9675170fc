#include "collector/swatch_svg_resolver.h"
#include "collector/swatch_css_values.h"
#include <algorithm>
#include <map>

namespace {

const char kSvgNamespace[] = "http://www.w3.org/2000/svg";
const char kDataUrlPrefix[] = "data:image/svg+xml;utf8,";

// Computed values the SVG user agent stylesheet produces on its own
const std::map<std::string, std::string>& SvgDefaults() {
  static const std::map<std::string, std::string> defaults = {
    {"fill", "rgb(0, 0, 0)"},
    {"stroke", "none"},
    {"stroke-width", "1px"},
    {"opacity", "1"},
    {"fill-opacity", "1"},
    {"stroke-opacity", "1"},
  };
  return defaults;
}

}  // namespace

const std::vector<std::string>& SwatchSvgResolver::ResolvedProperties() {
  static const std::vector<std::string> properties = {
    "fill",
    "stroke",
    "color",
    "stop-color",
    "flood-color",
    "lighting-color",
    "stroke-width",
    "stroke-dasharray",
    "stroke-dashoffset",
    "stroke-linecap",
    "stroke-linejoin",
    "opacity",
    "fill-opacity",
    "stroke-opacity",
  };
  return properties;
}

std::string SwatchSvgResolver::ResolveToMarkup(SwatchPageAccessor& page, ElementHandle svg) {
  std::string out;
  if (svg == kNoElement) {
    return out;
  }
  SerializeElement(page, svg, true, out);
  return out;
}

std::string SwatchSvgResolver::ResolveToDataUrl(SwatchPageAccessor& page, ElementHandle svg) {
  std::string markup = ResolveToMarkup(page, svg);
  if (markup.empty()) {
    return "";
  }
  return kDataUrlPrefix + SwatchCssValues::PercentEncode(markup);
}

void SwatchSvgResolver::ResolveElementStyles(SwatchPageAccessor& page, ElementHandle element,
                                             Declarations& style_overrides,
                                             std::vector<std::string>& removed_attributes) {
  const auto& defaults = SvgDefaults();

  for (const auto& prop : ResolvedProperties()) {
    std::string attr_value = page.GetAttribute(element, prop);
    std::string computed = SwatchCssValues::Trim(page.GetComputedStyle(element, prop));

    if (attr_value.find("var(") != std::string::npos) {
      // The exported copy has no access to the custom property
      removed_attributes.push_back(prop);
      if (!computed.empty() && computed != "none") {
        style_overrides.emplace_back(prop, computed);
      }
      continue;
    }

    if (computed.empty()) {
      continue;
    }

    bool is_explicit = page.HasAttribute(element, prop) ||
                       !SwatchCssValues::Trim(page.GetInlineStyle(element, prop)).empty();
    auto it = defaults.find(prop);
    bool is_different = it != defaults.end() && computed != it->second;
    if (is_explicit || is_different) {
      style_overrides.emplace_back(prop, computed);
    }
  }
}

void SwatchSvgResolver::SerializeElement(SwatchPageAccessor& page, ElementHandle element,
                                         bool is_root, std::string& out) {
  std::string tag = page.GetTagName(element);

  Declarations style_overrides;
  std::vector<std::string> removed;
  ResolveElementStyles(page, element, style_overrides, removed);

  std::vector<std::pair<std::string, std::string>> attributes = page.GetAttributes(element);

  // Drop var() attributes, merge overrides into the style attribute
  bool has_namespace = false;
  bool has_style = false;
  std::vector<std::pair<std::string, std::string>> kept;
  for (const auto& attr : attributes) {
    if (std::find(removed.begin(), removed.end(), attr.first) != removed.end()) {
      continue;
    }
    if (attr.first == "xmlns") {
      has_namespace = true;
    }
    if (attr.first == "style") {
      has_style = true;
      Declarations declarations = ParseStyleAttribute(attr.second);
      for (const auto& override_decl : style_overrides) {
        auto existing = std::find_if(declarations.begin(), declarations.end(),
            [&](const std::pair<std::string, std::string>& d) { return d.first == override_decl.first; });
        std::string value = override_decl.second + " !important";
        if (existing != declarations.end()) {
          existing->second = value;
        } else {
          declarations.emplace_back(override_decl.first, value);
        }
      }
      std::string style = BuildStyleAttribute(declarations);
      if (!style.empty()) {
        kept.emplace_back("style", style);
      }
      continue;
    }
    kept.push_back(attr);
  }

  if (!has_style && !style_overrides.empty()) {
    Declarations declarations;
    for (const auto& override_decl : style_overrides) {
      declarations.emplace_back(override_decl.first, override_decl.second + " !important");
    }
    kept.emplace_back("style", BuildStyleAttribute(declarations));
  }

  out += "<" + tag;
  if (is_root && !has_namespace) {
    out += std::string(" xmlns=\"") + kSvgNamespace + "\"";
  }
  for (const auto& attr : kept) {
    out += " " + attr.first + "=\"" + EscapeAttribute(attr.second) + "\"";
  }

  std::vector<ChildNode> children = page.GetChildNodes(element);
  if (children.empty()) {
    out += "/>";
    return;
  }

  out += ">";
  for (const auto& child : children) {
    if (child.element != kNoElement) {
      SerializeElement(page, child.element, false, out);
    } else {
      out += EscapeText(child.text);
    }
  }
  out += "</" + tag + ">";
}

SwatchSvgResolver::Declarations SwatchSvgResolver::ParseStyleAttribute(const std::string& style) {
  Declarations declarations;
  size_t start = 0;
  while (start < style.size()) {
    size_t end = style.find(';', start);
    if (end == std::string::npos) {
      end = style.size();
    }
    std::string decl = style.substr(start, end - start);
    size_t colon = decl.find(':');
    if (colon != std::string::npos) {
      std::string name = SwatchCssValues::ToLower(SwatchCssValues::Trim(decl.substr(0, colon)));
      std::string value = SwatchCssValues::Trim(decl.substr(colon + 1));
      if (!name.empty()) {
        declarations.emplace_back(name, value);
      }
    }
    start = end + 1;
  }
  return declarations;
}

std::string SwatchSvgResolver::BuildStyleAttribute(const Declarations& declarations) {
  std::string style;
  for (const auto& decl : declarations) {
    if (!style.empty()) {
      style += " ";
    }
    style += decl.first + ": " + decl.second + ";";
  }
  return style;
}

std::string SwatchSvgResolver::EscapeAttribute(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default: out += c; break;
    }
  }
  return out;
}

std::string SwatchSvgResolver::EscapeText(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      default: out += c; break;
    }
  }
  return out;
}

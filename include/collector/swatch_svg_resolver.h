#pragma once

#include "collector/swatch_page_accessor.h"
#include <string>
#include <utility>
#include <vector>

/**
 * SwatchSvgResolver - exports an inline SVG so it renders without the
 * page's stylesheets.
 *
 * Attributes that reference CSS variables are replaced by the computed value
 * as an !important inline style. Other presentation properties are inlined
 * only when they were set explicitly or differ from the SVG default, which
 * keeps the exported markup small.
 */
class SwatchSvgResolver {
public:
  // Serialized, resolved markup of the SVG rooted at svg
  static std::string ResolveToMarkup(SwatchPageAccessor& page, ElementHandle svg);

  // "data:image/svg+xml;utf8," + percent-encoded ResolveToMarkup()
  static std::string ResolveToDataUrl(SwatchPageAccessor& page, ElementHandle svg);

  // Presentation properties that are inspected on every element
  static const std::vector<std::string>& ResolvedProperties();

private:
  using Declarations = std::vector<std::pair<std::string, std::string>>;

  static void SerializeElement(SwatchPageAccessor& page, ElementHandle element,
                               bool is_root, std::string& out);

  // Inline style declarations to apply, and attributes to drop, for one element
  static void ResolveElementStyles(SwatchPageAccessor& page, ElementHandle element,
                                   Declarations& style_overrides,
                                   std::vector<std::string>& removed_attributes);

  static Declarations ParseStyleAttribute(const std::string& style);
  static std::string BuildStyleAttribute(const Declarations& declarations);
  static std::string EscapeAttribute(const std::string& value);
  static std::string EscapeText(const std::string& value);
};

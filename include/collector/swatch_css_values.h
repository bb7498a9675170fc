#pragma once

#include <string>
#include <vector>

// String-level helpers for computed CSS values read from the page
class SwatchCssValues {
public:
  /**
   * Resolve a length to pixels. "auto" and "" are unresolved, "px" is taken
   * literally, "rem" scales by the root font size and "em" by the body font
   * size, "%" is unresolved without layout context, anything else uses its
   * leading number. Returns false when no pixel value can be derived.
   */
  static bool ToPx(const std::string& value, double root_font_px, double body_font_px, double& out);

  // Leading number of a CSS value ("16px" -> 16); false when there is none
  static bool LeadingNumber(const std::string& value, double& out);

  // Split a font-family list on commas and strip quotes and whitespace
  static std::vector<std::string> SplitFontStack(const std::string& font_family);

  /**
   * Turn Next.js generated family names back into the real font name:
   * "__Roboto_Mono_c8ca7d" -> "Roboto Mono". Returns "" for the generated
   * "_Fallback_" families, which carry no brand information. Other names
   * are returned unchanged.
   */
  static std::string CleanNextJsFontName(const std::string& font_name);

  // "12px", "6.5px"; at most three decimals, trailing zeros dropped
  static std::string FormatPx(double px);

  // encodeURIComponent
  static std::string PercentEncode(const std::string& value);

  // Trim and collapse internal whitespace runs to single spaces
  static std::string CollapseWhitespace(const std::string& value);

  // Truncate to at most max_chars UTF-8 code points
  static std::string TruncateUtf8(const std::string& value, size_t max_chars);

  static std::string ToLower(const std::string& value);
  static std::string Trim(const std::string& value);

  // Whitespace separated tokens, empty tokens dropped
  static std::vector<std::string> SplitTokens(const std::string& value);

  static bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);
};

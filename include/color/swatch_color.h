#pragma once

#include <string>

/**
 * SwatchColor - CSS colour normalization and colour-space helpers.
 *
 * Every function is total: malformed input yields an empty string or a
 * neutral number, never an exception. Normalized colours are upper-case
 * "#RRGGBB", or "#RRGGBBAA" when the source carried alpha < 1.
 */
class SwatchColor {
public:
  struct RGBA {
    int r = 0;
    int g = 0;
    int b = 0;
    double a = 1.0;
  };

  /**
   * Normalize a CSS colour to hex. Accepts #rgb/#rgba/#rrggbb/#rrggbbaa,
   * rgb()/rgba() (comma or space syntax, % channels), hsl()/hsla(),
   * color(display-p3 ...)/color(srgb ...), named colours and "transparent".
   * Returns "" when the input cannot be parsed.
   */
  static std::string Hexify(const std::string& css_color);

  // Parse into channels. Returns false when the input is not a colour.
  static bool Parse(const std::string& css_color, RGBA& out);

  // Format channels as normalized hex (alpha rounded to two decimals first)
  static std::string ToHex(const RGBA& color);

  // YIQ brightness (R*299 + G*587 + B*114) / 1000 of a hex colour; 0 when
  // the value has fewer than six hex digits.
  static double ContrastYIQ(const std::string& hex);

  // Channel spread (max - min) below 15, or not a full hex colour
  static bool IsGrayish(const std::string& hex);

  /**
   * Whether a colour carries usable brand signal: rejects fully transparent
   * values (alpha < 0.01) and pure black/white hex, accepts rgb()/rgba()
   * literals outright and hex whose YIQ is under 240.
   */
  static bool IsColorValid(const std::string& color);

  // Alpha of a normalized or raw colour; 1.0 when unknown
  static double Alpha(const std::string& color);

  // WCAG relative luminance in [0, 1] of any parseable colour; -1 on failure
  static double RelativeLuminance(const std::string& color);

  // "#FFFFFF" for dark backgrounds (YIQ < 128), "#111111" otherwise
  static std::string ContrastTextColor(const std::string& background_hex);

private:
  static bool ParseHex(const std::string& value, RGBA& out);
  static bool ParseRGBFunction(const std::string& value, RGBA& out);
  static bool ParseHSLFunction(const std::string& value, RGBA& out);
  static bool ParseColorFunction(const std::string& value, RGBA& out);
  static bool ParseNamed(const std::string& value, RGBA& out);
};

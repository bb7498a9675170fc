#include "color/swatch_color.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <vector>

namespace {

struct NamedColor {
  const char* name;
  unsigned int rgb;
};

// CSS Color Module Level 4 named colours
const NamedColor kNamedColors[] = {
  {"aliceblue", 0xF0F8FF}, {"antiquewhite", 0xFAEBD7}, {"aqua", 0x00FFFF},
  {"aquamarine", 0x7FFFD4}, {"azure", 0xF0FFFF}, {"beige", 0xF5F5DC},
  {"bisque", 0xFFE4C4}, {"black", 0x000000}, {"blanchedalmond", 0xFFEBCD},
  {"blue", 0x0000FF}, {"blueviolet", 0x8A2BE2}, {"brown", 0xA52A2A},
  {"burlywood", 0xDEB887}, {"cadetblue", 0x5F9EA0}, {"chartreuse", 0x7FFF00},
  {"chocolate", 0xD2691E}, {"coral", 0xFF7F50}, {"cornflowerblue", 0x6495ED},
  {"cornsilk", 0xFFF8DC}, {"crimson", 0xDC143C}, {"cyan", 0x00FFFF},
  {"darkblue", 0x00008B}, {"darkcyan", 0x008B8B}, {"darkgoldenrod", 0xB8860B},
  {"darkgray", 0xA9A9A9}, {"darkgreen", 0x006400}, {"darkgrey", 0xA9A9A9},
  {"darkkhaki", 0xBDB76B}, {"darkmagenta", 0x8B008B}, {"darkolivegreen", 0x556B2F},
  {"darkorange", 0xFF8C00}, {"darkorchid", 0x9932CC}, {"darkred", 0x8B0000},
  {"darksalmon", 0xE9967A}, {"darkseagreen", 0x8FBC8F}, {"darkslateblue", 0x483D8B},
  {"darkslategray", 0x2F4F4F}, {"darkslategrey", 0x2F4F4F}, {"darkturquoise", 0x00CED1},
  {"darkviolet", 0x9400D3}, {"deeppink", 0xFF1493}, {"deepskyblue", 0x00BFFF},
  {"dimgray", 0x696969}, {"dimgrey", 0x696969}, {"dodgerblue", 0x1E90FF},
  {"firebrick", 0xB22222}, {"floralwhite", 0xFFFAF0}, {"forestgreen", 0x228B22},
  {"fuchsia", 0xFF00FF}, {"gainsboro", 0xDCDCDC}, {"ghostwhite", 0xF8F8FF},
  {"gold", 0xFFD700}, {"goldenrod", 0xDAA520}, {"gray", 0x808080},
  {"green", 0x008000}, {"greenyellow", 0xADFF2F}, {"grey", 0x808080},
  {"honeydew", 0xF0FFF0}, {"hotpink", 0xFF69B4}, {"indianred", 0xCD5C5C},
  {"indigo", 0x4B0082}, {"ivory", 0xFFFFF0}, {"khaki", 0xF0E68C},
  {"lavender", 0xE6E6FA}, {"lavenderblush", 0xFFF0F5}, {"lawngreen", 0x7CFC00},
  {"lemonchiffon", 0xFFFACD}, {"lightblue", 0xADD8E6}, {"lightcoral", 0xF08080},
  {"lightcyan", 0xE0FFFF}, {"lightgoldenrodyellow", 0xFAFAD2}, {"lightgray", 0xD3D3D3},
  {"lightgreen", 0x90EE90}, {"lightgrey", 0xD3D3D3}, {"lightpink", 0xFFB6C1},
  {"lightsalmon", 0xFFA07A}, {"lightseagreen", 0x20B2AA}, {"lightskyblue", 0x87CEFA},
  {"lightslategray", 0x778899}, {"lightslategrey", 0x778899}, {"lightsteelblue", 0xB0C4DE},
  {"lightyellow", 0xFFFFE0}, {"lime", 0x00FF00}, {"limegreen", 0x32CD32},
  {"linen", 0xFAF0E6}, {"magenta", 0xFF00FF}, {"maroon", 0x800000},
  {"mediumaquamarine", 0x66CDAA}, {"mediumblue", 0x0000CD}, {"mediumorchid", 0xBA55D3},
  {"mediumpurple", 0x9370DB}, {"mediumseagreen", 0x3CB371}, {"mediumslateblue", 0x7B68EE},
  {"mediumspringgreen", 0x00FA9A}, {"mediumturquoise", 0x48D1CC}, {"mediumvioletred", 0xC71585},
  {"midnightblue", 0x191970}, {"mintcream", 0xF5FFFA}, {"mistyrose", 0xFFE4E1},
  {"moccasin", 0xFFE4B5}, {"navajowhite", 0xFFDEAD}, {"navy", 0x000080},
  {"oldlace", 0xFDF5E6}, {"olive", 0x808000}, {"olivedrab", 0x6B8E23},
  {"orange", 0xFFA500}, {"orangered", 0xFF4500}, {"orchid", 0xDA70D6},
  {"palegoldenrod", 0xEEE8AA}, {"palegreen", 0x98FB98}, {"paleturquoise", 0xAFEEEE},
  {"palevioletred", 0xDB7093}, {"papayawhip", 0xFFEFD5}, {"peachpuff", 0xFFDAB9},
  {"peru", 0xCD853F}, {"pink", 0xFFC0CB}, {"plum", 0xDDA0DD},
  {"powderblue", 0xB0E0E6}, {"purple", 0x800080}, {"rebeccapurple", 0x663399},
  {"red", 0xFF0000}, {"rosybrown", 0xBC8F8F}, {"royalblue", 0x4169E1},
  {"saddlebrown", 0x8B4513}, {"salmon", 0xFA8072}, {"sandybrown", 0xF4A460},
  {"seagreen", 0x2E8B57}, {"seashell", 0xFFF5EE}, {"sienna", 0xA0522D},
  {"silver", 0xC0C0C0}, {"skyblue", 0x87CEEB}, {"slateblue", 0x6A5ACD},
  {"slategray", 0x708090}, {"slategrey", 0x708090}, {"snow", 0xFFFAFA},
  {"springgreen", 0x00FF7F}, {"steelblue", 0x4682B4}, {"tan", 0xD2B48C},
  {"teal", 0x008080}, {"thistle", 0xD8BFD8}, {"tomato", 0xFF6347},
  {"turquoise", 0x40E0D0}, {"violet", 0xEE82EE}, {"wheat", 0xF5DEB3},
  {"white", 0xFFFFFF}, {"whitesmoke", 0xF5F5F5}, {"yellow", 0xFFFF00},
  {"yellowgreen", 0x9ACD32},
};

std::string Normalize(const std::string& value) {
  size_t start = value.find_first_not_of(" \t\n\r");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = value.find_last_not_of(" \t\n\r");
  std::string out;
  out.reserve(end - start + 1);
  for (size_t i = start; i <= end; i++) {
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(value[i])));
  }
  return out;
}

int Clamp255(double v) {
  long rounded = std::lround(v);
  return static_cast<int>(std::max(0L, std::min(255L, rounded)));
}

double Clamp01(double v) {
  return std::max(0.0, std::min(1.0, v));
}

// Whole-token number parse; rejects trailing garbage
bool ParseNumber(const std::string& token, double& out) {
  if (token.empty()) {
    return false;
  }
  const char* begin = token.c_str();
  char* end = nullptr;
  double v = std::strtod(begin, &end);
  if (end == begin || *end != '\0' || !std::isfinite(v)) {
    return false;
  }
  out = v;
  return true;
}

// Number or percentage; percentages are scaled onto [0, percent_scale]
bool ParseComponent(const std::string& token, double percent_scale, double& out, bool& was_percent) {
  was_percent = !token.empty() && token.back() == '%';
  if (was_percent) {
    double pct = 0.0;
    if (!ParseNumber(token.substr(0, token.size() - 1), pct)) {
      return false;
    }
    out = pct * percent_scale / 100.0;
    return true;
  }
  return ParseNumber(token, out);
}

bool ParseAlpha(const std::string& token, double& out) {
  bool pct = false;
  if (!ParseComponent(token, 1.0, out, pct)) {
    return false;
  }
  out = Clamp01(out);
  return true;
}

// Split the argument list of a colour function on commas, slashes and spaces
bool SplitFunctionArgs(const std::string& value, const std::string& name, std::vector<std::string>& args) {
  if (value.compare(0, name.size(), name) != 0) {
    return false;
  }
  size_t open = value.find('(', name.size());
  if (open == std::string::npos || value.back() != ')') {
    return false;
  }
  // Only whitespace may separate the name from the parenthesis
  for (size_t i = name.size(); i < open; i++) {
    if (!std::isspace(static_cast<unsigned char>(value[i]))) {
      return false;
    }
  }

  std::string inner = value.substr(open + 1, value.size() - open - 2);
  std::string current;
  for (char c : inner) {
    if (c == ',' || c == '/' || std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) {
        args.push_back(current);
        current.clear();
      }
    } else {
      current += c;
    }
  }
  if (!current.empty()) {
    args.push_back(current);
  }
  return true;
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool ReadHexByte(const std::string& h, size_t pos, int& out) {
  int hi = HexDigit(h[pos]);
  int lo = HexDigit(h[pos + 1]);
  if (hi < 0 || lo < 0) {
    return false;
  }
  out = hi * 16 + lo;
  return true;
}

// First six digits of a "#RRGGBB[AA]" string
bool ReadHexRGB(const std::string& hex, int& r, int& g, int& b) {
  std::string h = hex;
  if (!h.empty() && h[0] == '#') {
    h = h.substr(1);
  }
  if (h.size() < 6) {
    return false;
  }
  return ReadHexByte(h, 0, r) && ReadHexByte(h, 2, g) && ReadHexByte(h, 4, b);
}

bool IsHexLiteral(const std::string& value) {
  if (value.size() < 2 || value[0] != '#') {
    return false;
  }
  size_t digits = value.size() - 1;
  if (digits != 3 && digits != 4 && digits != 6 && digits != 8) {
    return false;
  }
  for (size_t i = 1; i < value.size(); i++) {
    if (HexDigit(value[i]) < 0) {
      return false;
    }
  }
  return true;
}

std::string ExpandHex(const std::string& value) {
  std::string out = "#";
  size_t digits = value.size() - 1;
  if (digits == 3 || digits == 4) {
    for (size_t i = 1; i < value.size(); i++) {
      char c = static_cast<char>(std::toupper(static_cast<unsigned char>(value[i])));
      out += c;
      out += c;
    }
    return out;
  }
  for (size_t i = 1; i < value.size(); i++) {
    out += static_cast<char>(std::toupper(static_cast<unsigned char>(value[i])));
  }
  return out;
}

double HueToRGB(double p, double q, double t) {
  if (t < 0) t += 1;
  if (t > 1) t -= 1;
  if (t < 1.0 / 6) return p + (q - p) * 6 * t;
  if (t < 1.0 / 2) return q;
  if (t < 2.0 / 3) return p + (q - p) * (2.0 / 3 - t) * 6;
  return p;
}

double Linearize(double channel) {
  double c = channel / 255.0;
  return c <= 0.03928 ? c / 12.92 : std::pow((c + 0.055) / 1.055, 2.4);
}

}  // namespace

std::string SwatchColor::Hexify(const std::string& css_color) {
  std::string value = Normalize(css_color);
  if (value.empty()) {
    return "";
  }

  // Hex input is only expanded and upper-cased: Hexify(Hexify(x)) == Hexify(x)
  if (IsHexLiteral(value)) {
    return ExpandHex(value);
  }

  RGBA rgba;
  if (!Parse(value, rgba)) {
    return "";
  }
  return ToHex(rgba);
}

bool SwatchColor::Parse(const std::string& css_color, RGBA& out) {
  std::string value = Normalize(css_color);
  if (value.empty()) {
    return false;
  }
  if (value[0] == '#') {
    return ParseHex(value, out);
  }
  if (value.compare(0, 3, "rgb") == 0) {
    return ParseRGBFunction(value, out);
  }
  if (value.compare(0, 3, "hsl") == 0) {
    return ParseHSLFunction(value, out);
  }
  if (value.compare(0, 6, "color(") == 0 || value.compare(0, 6, "color ") == 0) {
    return ParseColorFunction(value, out);
  }
  return ParseNamed(value, out);
}

std::string SwatchColor::ToHex(const RGBA& color) {
  std::ostringstream ss;
  ss << '#' << std::uppercase << std::hex << std::setfill('0')
     << std::setw(2) << Clamp255(color.r)
     << std::setw(2) << Clamp255(color.g)
     << std::setw(2) << Clamp255(color.b);

  double alpha = std::round(Clamp01(color.a) * 100.0) / 100.0;
  if (alpha < 1.0) {
    ss << std::setw(2) << Clamp255(alpha * 255.0);
  }
  return ss.str();
}

bool SwatchColor::ParseHex(const std::string& value, RGBA& out) {
  if (!IsHexLiteral(value)) {
    return false;
  }
  std::string h = ExpandHex(value).substr(1);
  int r = 0, g = 0, b = 0, a = 255;
  if (!ReadHexByte(h, 0, r) || !ReadHexByte(h, 2, g) || !ReadHexByte(h, 4, b)) {
    return false;
  }
  if (h.size() == 8 && !ReadHexByte(h, 6, a)) {
    return false;
  }
  out.r = r;
  out.g = g;
  out.b = b;
  out.a = a / 255.0;
  return true;
}

bool SwatchColor::ParseRGBFunction(const std::string& value, RGBA& out) {
  std::vector<std::string> args;
  if (!SplitFunctionArgs(value, value.compare(0, 4, "rgba") == 0 ? "rgba" : "rgb", args)) {
    return false;
  }
  if (args.size() != 3 && args.size() != 4) {
    return false;
  }

  double channels[3];
  for (int i = 0; i < 3; i++) {
    bool pct = false;
    if (!ParseComponent(args[i], 255.0, channels[i], pct)) {
      return false;
    }
  }
  double alpha = 1.0;
  if (args.size() == 4 && !ParseAlpha(args[3], alpha)) {
    return false;
  }

  out.r = Clamp255(channels[0]);
  out.g = Clamp255(channels[1]);
  out.b = Clamp255(channels[2]);
  out.a = alpha;
  return true;
}

bool SwatchColor::ParseHSLFunction(const std::string& value, RGBA& out) {
  std::vector<std::string> args;
  if (!SplitFunctionArgs(value, value.compare(0, 4, "hsla") == 0 ? "hsla" : "hsl", args)) {
    return false;
  }
  if (args.size() != 3 && args.size() != 4) {
    return false;
  }

  std::string hue_token = args[0];
  if (hue_token.size() > 3 && hue_token.compare(hue_token.size() - 3, 3, "deg") == 0) {
    hue_token = hue_token.substr(0, hue_token.size() - 3);
  }
  double hue = 0.0, sat = 0.0, light = 0.0;
  bool pct = false;
  if (!ParseNumber(hue_token, hue) ||
      !ParseComponent(args[1], 100.0, sat, pct) ||
      !ParseComponent(args[2], 100.0, light, pct)) {
    return false;
  }
  double alpha = 1.0;
  if (args.size() == 4 && !ParseAlpha(args[3], alpha)) {
    return false;
  }

  double h = std::fmod(std::fmod(hue, 360.0) + 360.0, 360.0) / 360.0;
  double s = Clamp01(sat / 100.0);
  double l = Clamp01(light / 100.0);

  double r = l, g = l, b = l;
  if (s > 0) {
    double q = l < 0.5 ? l * (1 + s) : l + s - l * s;
    double p = 2 * l - q;
    r = HueToRGB(p, q, h + 1.0 / 3);
    g = HueToRGB(p, q, h);
    b = HueToRGB(p, q, h - 1.0 / 3);
  }

  out.r = Clamp255(r * 255.0);
  out.g = Clamp255(g * 255.0);
  out.b = Clamp255(b * 255.0);
  out.a = alpha;
  return true;
}

bool SwatchColor::ParseColorFunction(const std::string& value, RGBA& out) {
  std::vector<std::string> args;
  if (!SplitFunctionArgs(value, "color", args)) {
    return false;
  }
  if (args.size() != 4 && args.size() != 5) {
    return false;
  }
  if (args[0] != "display-p3" && args[0] != "srgb") {
    return false;
  }

  double channels[3];
  for (int i = 0; i < 3; i++) {
    bool pct = false;
    if (!ParseComponent(args[i + 1], 1.0, channels[i], pct)) {
      return false;
    }
  }
  double alpha = 1.0;
  if (args.size() == 5 && !ParseAlpha(args[4], alpha)) {
    return false;
  }

  out.r = Clamp255(channels[0] * 255.0);
  out.g = Clamp255(channels[1] * 255.0);
  out.b = Clamp255(channels[2] * 255.0);
  out.a = alpha;
  return true;
}

bool SwatchColor::ParseNamed(const std::string& value, RGBA& out) {
  if (value == "transparent") {
    out = RGBA();
    out.a = 0.0;
    return true;
  }
  for (const auto& named : kNamedColors) {
    if (value == named.name) {
      out.r = (named.rgb >> 16) & 0xFF;
      out.g = (named.rgb >> 8) & 0xFF;
      out.b = named.rgb & 0xFF;
      out.a = 1.0;
      return true;
    }
  }
  return false;
}

double SwatchColor::ContrastYIQ(const std::string& hex) {
  int r = 0, g = 0, b = 0;
  if (!ReadHexRGB(hex, r, g, b)) {
    return 0.0;
  }
  return (r * 299 + g * 587 + b * 114) / 1000.0;
}

bool SwatchColor::IsGrayish(const std::string& hex) {
  int r = 0, g = 0, b = 0;
  if (!ReadHexRGB(hex, r, g, b)) {
    return true;
  }
  int max = std::max(r, std::max(g, b));
  int min = std::min(r, std::min(g, b));
  return max - min < 15;
}

bool SwatchColor::IsColorValid(const std::string& color) {
  std::string value = Normalize(color);
  if (value.empty()) {
    return false;
  }

  RGBA rgba;
  if (value.compare(0, 3, "rgb") == 0) {
    return ParseRGBFunction(value, rgba) && rgba.a >= 0.01;
  }

  std::string hex = value[0] == '#' ? value : Hexify(value);
  if (hex.empty() || !ParseHex(Normalize(hex), rgba)) {
    return false;
  }
  if (rgba.a < 0.01) {
    return false;
  }

  std::string upper = ExpandHex(Normalize(hex));
  if (upper == "#FFFFFF" || upper == "#000000") {
    return false;
  }
  return ContrastYIQ(upper) < 240;
}

double SwatchColor::Alpha(const std::string& color) {
  RGBA rgba;
  if (!Parse(color, rgba)) {
    return 1.0;
  }
  return rgba.a;
}

double SwatchColor::RelativeLuminance(const std::string& color) {
  RGBA rgba;
  if (!Parse(color, rgba)) {
    return -1.0;
  }
  return 0.2126 * Linearize(rgba.r) + 0.7152 * Linearize(rgba.g) + 0.0722 * Linearize(rgba.b);
}

std::string SwatchColor::ContrastTextColor(const std::string& background_hex) {
  return ContrastYIQ(background_hex) < 128 ? "#FFFFFF" : "#111111";
}

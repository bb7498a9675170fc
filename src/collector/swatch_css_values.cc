#include "collector/swatch_css_values.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <regex>

namespace {

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string SwatchCssValues::Trim(const std::string& value) {
  size_t start = value.find_first_not_of(" \t\n\r\f\v");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = value.find_last_not_of(" \t\n\r\f\v");
  return value.substr(start, end - start + 1);
}

std::string SwatchCssValues::ToLower(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return lower;
}

bool SwatchCssValues::LeadingNumber(const std::string& value, double& out) {
  std::string trimmed = Trim(value);
  if (trimmed.empty()) {
    return false;
  }
  const char* begin = trimmed.c_str();
  char* end = nullptr;
  double v = std::strtod(begin, &end);
  if (end == begin || !std::isfinite(v)) {
    return false;
  }
  out = v;
  return true;
}

bool SwatchCssValues::ToPx(const std::string& value, double root_font_px, double body_font_px, double& out) {
  std::string v = ToLower(Trim(value));
  if (v.empty() || v == "auto") {
    return false;
  }

  double number = 0.0;
  if (EndsWith(v, "px")) {
    return LeadingNumber(v, out);
  }
  if (EndsWith(v, "rem")) {
    if (!LeadingNumber(v, number)) {
      return false;
    }
    out = number * (root_font_px > 0 ? root_font_px : 16.0);
    return true;
  }
  if (EndsWith(v, "em")) {
    if (!LeadingNumber(v, number)) {
      return false;
    }
    out = number * (body_font_px > 0 ? body_font_px : 16.0);
    return true;
  }
  if (EndsWith(v, "%")) {
    return false;
  }
  return LeadingNumber(v, out);
}

std::vector<std::string> SwatchCssValues::SplitFontStack(const std::string& font_family) {
  std::vector<std::string> stack;
  std::string current;
  auto flush = [&]() {
    std::string cleaned;
    for (char c : current) {
      if (c != '"' && c != '\'') {
        cleaned += c;
      }
    }
    cleaned = Trim(cleaned);
    if (!cleaned.empty()) {
      stack.push_back(cleaned);
    }
    current.clear();
  };

  for (char c : font_family) {
    if (c == ',') {
      flush();
    } else {
      current += c;
    }
  }
  flush();
  return stack;
}

std::string SwatchCssValues::CleanNextJsFontName(const std::string& font_name) {
  if (font_name.compare(0, 2, "__") != 0) {
    return font_name;
  }
  if (font_name.find("_Fallback_") != std::string::npos) {
    return "";
  }

  static const std::regex kHashSuffix("_[a-f0-9]{6}$");
  std::string cleaned = std::regex_replace(font_name.substr(2), kHashSuffix, "");

  std::string result;
  size_t start = 0;
  while (start <= cleaned.size()) {
    size_t end = cleaned.find('_', start);
    if (end == std::string::npos) {
      end = cleaned.size();
    }
    std::string word = cleaned.substr(start, end - start);
    if (!result.empty() || start > 0) {
      result += ' ';
    }
    if (!word.empty()) {
      result += static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
      result += ToLower(word.substr(1));
    }
    start = end + 1;
  }
  return Trim(result);
}

std::string SwatchCssValues::FormatPx(double px) {
  if (!std::isfinite(px)) {
    return "0px";
  }
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.3f", px);
  std::string number(buffer);
  number.erase(number.find_last_not_of('0') + 1);
  if (!number.empty() && number.back() == '.') {
    number.pop_back();
  }
  if (number == "-0") {
    number = "0";
  }
  return number + "px";
}

std::string SwatchCssValues::PercentEncode(const std::string& value) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!' ||
        c == '~' || c == '*' || c == '\'' || c == '(' || c == ')') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

std::string SwatchCssValues::CollapseWhitespace(const std::string& value) {
  std::string out;
  bool pending_space = false;
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out += ' ';
      pending_space = false;
    }
    out += c;
  }
  return out;
}

std::string SwatchCssValues::TruncateUtf8(const std::string& value, size_t max_chars) {
  size_t chars = 0;
  for (size_t i = 0; i < value.size(); i++) {
    // Count lead bytes only
    if ((static_cast<unsigned char>(value[i]) & 0xC0) != 0x80) {
      if (chars == max_chars) {
        return value.substr(0, i);
      }
      chars++;
    }
  }
  return value;
}

std::vector<std::string> SwatchCssValues::SplitTokens(const std::string& value) {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) {
        tokens.push_back(current);
        current.clear();
      }
    } else {
      current += c;
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

bool SwatchCssValues::ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
  return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

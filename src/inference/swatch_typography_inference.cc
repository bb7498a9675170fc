#include "inference/swatch_typography_inference.h"
#include "collector/swatch_css_values.h"
#include <algorithm>
#include <map>
#include <set>

namespace {

const char kDefaultFamily[] = "system-ui, sans-serif";

const std::set<std::string>& GenericFamilies() {
  static const std::set<std::string> generics = {
    "inherit", "initial", "unset", "revert",
    "ui-sans-serif", "ui-serif", "ui-monospace", "system-ui",
    "sans-serif", "serif", "monospace", "cursive", "fantasy", "math",
    "emoji", "fangsong",
    "apple color emoji", "segoe ui emoji", "segoe ui symbol", "noto color emoji",
  };
  return generics;
}

}  // namespace

bool SwatchTypographyInference::IsGenericFamily(const std::string& family) {
  return GenericFamilies().count(SwatchCssValues::ToLower(SwatchCssValues::Trim(family))) > 0;
}

TypographyProfile SwatchTypographyInference::Infer(const RawBrandingRecord& raw) {
  TypographyProfile typography;
  const TypographyStacks& stacks = raw.typography.stacks;

  typography.font_families.primary = stacks.body.empty() ? kDefaultFamily : stacks.body.front();
  if (!stacks.heading.empty()) {
    typography.font_families.heading = stacks.heading.front();
  } else {
    typography.font_families.heading = typography.font_families.primary;
  }
  typography.font_stacks = stacks;
  typography.font_sizes = raw.typography.sizes;
  return typography;
}

std::vector<FontUsage> SwatchTypographyInference::RankFonts(const RawBrandingRecord& raw) {
  std::vector<FontUsage> usage;
  std::map<std::string, size_t> index;

  auto count = [&](const std::vector<std::string>& stack) {
    for (const auto& raw_family : stack) {
      std::string family = SwatchCssValues::Trim(raw_family);
      if (family.empty() || IsGenericFamily(family) || family.find("var(") != std::string::npos) {
        continue;
      }
      auto it = index.find(family);
      if (it == index.end()) {
        index[family] = usage.size();
        usage.push_back({family, 1});
      } else {
        usage[it->second].count++;
      }
    }
  };

  count(raw.typography.stacks.body);
  count(raw.typography.stacks.heading);
  for (const auto& snap : raw.snapshots) {
    count(snap.typography.font_stack);
  }

  std::stable_sort(usage.begin(), usage.end(),
      [](const FontUsage& a, const FontUsage& b) { return a.count > b.count; });
  if (usage.size() > kMaxFonts) {
    usage.resize(kMaxFonts);
  }
  return usage;
}

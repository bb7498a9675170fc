#include "inference/swatch_palette_inference.h"
#include "color/swatch_color.h"
#include <algorithm>
#include <cmath>
#include <map>

namespace {

// Insertion-ordered accumulator
class ColorTally {
public:
  void Bump(const std::string& hex, double weight) {
    if (hex.empty() || SwatchColor::Alpha(hex) < 0.01) {
      return;
    }
    auto it = index_.find(hex);
    if (it == index_.end()) {
      index_[hex] = entries_.size();
      entries_.push_back({hex, weight});
    } else {
      entries_[it->second].second += weight;
    }
  }

  std::vector<std::pair<std::string, double>> Ranked() const {
    std::vector<std::pair<std::string, double>> ranked = entries_;
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const std::pair<std::string, double>& a, const std::pair<std::string, double>& b) {
          return a.second > b.second;
        });
    return ranked;
  }

private:
  std::map<std::string, size_t> index_;
  std::vector<std::pair<std::string, double>> entries_;
};

}  // namespace

double SwatchPaletteInference::BackgroundWeight(const SnapshotRect& rect) {
  double area = std::max(1.0, rect.w * rect.h);
  if (!std::isfinite(area)) {
    area = 1.0;
  }
  return 0.5 + std::log10(area + 10.0);
}

std::vector<ColorFrequency> SwatchPaletteInference::RankColors(const RawBrandingRecord& raw) {
  ColorTally tally;

  tally.Bump(SwatchColor::Hexify(raw.page_background), kPageBackgroundWeight);

  for (const auto& snap : raw.snapshots) {
    tally.Bump(SwatchColor::Hexify(snap.colors.background), BackgroundWeight(snap.rect));
    tally.Bump(SwatchColor::Hexify(snap.colors.text), kTextWeight);
    tally.Bump(SwatchColor::Hexify(snap.colors.border), kBorderWeight);
  }

  for (const auto& color : raw.css_data.colors) {
    tally.Bump(SwatchColor::Hexify(color), kStylesheetWeight);
  }

  std::vector<ColorFrequency> table;
  for (const auto& entry : tally.Ranked()) {
    ColorFrequency freq;
    freq.hex = entry.first;
    freq.frequency = entry.second;
    freq.is_grayish = SwatchColor::IsGrayish(entry.first);
    freq.yiq = SwatchColor::ContrastYIQ(entry.first);
    table.push_back(freq);
  }
  return table;
}

std::string SwatchPaletteInference::PickBackground(const std::vector<std::string>& ranked, ColorScheme scheme,
                                                   const std::string& page_background) {
  std::string hint = SwatchColor::Hexify(page_background);
  if (!hint.empty() && SwatchColor::IsGrayish(hint) && hint != "#FFFFFF") {
    return hint;
  }

  if (scheme == ColorScheme::DARK) {
    for (const auto& hex : ranked) {
      double yiq = SwatchColor::ContrastYIQ(hex);
      if (SwatchColor::IsGrayish(hex) && yiq > 0 && yiq < 128) {
        return hex;
      }
    }
    for (const auto& hex : ranked) {
      if (SwatchColor::IsGrayish(hex) && SwatchColor::ContrastYIQ(hex) < 180) {
        return hex;
      }
    }
    return "#1A1A1A";
  }

  for (const auto& hex : ranked) {
    if (SwatchColor::IsGrayish(hex) && SwatchColor::ContrastYIQ(hex) > 180) {
      return hex;
    }
  }
  return "#FFFFFF";
}

Palette SwatchPaletteInference::Infer(const RawBrandingRecord& raw, std::vector<ColorFrequency>* frequencies) {
  std::vector<ColorFrequency> table = RankColors(raw);
  std::vector<std::string> ranked;
  for (const auto& entry : table) {
    ranked.push_back(entry.hex);
  }

  bool dark = raw.color_scheme == ColorScheme::DARK;
  Palette palette;
  palette.background = PickBackground(ranked, raw.color_scheme, raw.page_background);

  for (const auto& hex : ranked) {
    if (hex != "#FFFFFF" && SwatchColor::ContrastYIQ(hex) < 160) {
      palette.text_primary = hex;
      break;
    }
  }
  if (palette.text_primary.empty()) {
    palette.text_primary = dark ? "#FFFFFF" : "#111111";
  }

  for (const auto& hex : ranked) {
    if (!SwatchColor::IsGrayish(hex) && hex != palette.text_primary && hex != palette.background) {
      palette.primary = hex;
      break;
    }
  }
  if (palette.primary.empty()) {
    palette.primary = dark ? "#FFFFFF" : "#000000";
  }

  for (const auto& hex : ranked) {
    if (!SwatchColor::IsGrayish(hex) && hex != palette.primary) {
      palette.accent = hex;
      break;
    }
  }
  if (palette.accent.empty()) {
    palette.accent = palette.primary;
  }

  // A coloured first anchor says more about links than the ranking does
  std::string anchor = SwatchColor::Hexify(raw.link_color);
  if (!anchor.empty() && SwatchColor::Alpha(anchor) >= 0.01 && !SwatchColor::IsGrayish(anchor)) {
    palette.link = anchor;
  } else {
    palette.link = palette.accent;
  }

  if (frequencies) {
    *frequencies = table;
  }
  return palette;
}

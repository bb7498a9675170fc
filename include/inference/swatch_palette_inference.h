#pragma once

#include "core/swatch_branding_types.h"
#include <string>
#include <vector>

/**
 * SwatchPaletteInference - ranks every colour the page shows and assigns
 * palette roles from the ranking.
 *
 * Weights per occurrence:
 *   page background hint  1000
 *   snapshot background   0.5 + log10(max(1, w*h) + 10)
 *   snapshot text         1.0
 *   snapshot border       0.3
 *   stylesheet colour     0.5
 * Fully transparent colours are not counted. Ties keep first-seen order.
 */
class SwatchPaletteInference {
public:
  static constexpr double kPageBackgroundWeight = 1000.0;
  static constexpr double kTextWeight = 1.0;
  static constexpr double kBorderWeight = 0.3;
  static constexpr double kStylesheetWeight = 0.5;

  // Ranked frequency table, highest weight first
  static std::vector<ColorFrequency> RankColors(const RawBrandingRecord& raw);

  // Assign roles. When frequencies is non-null it receives the ranked table.
  static Palette Infer(const RawBrandingRecord& raw, std::vector<ColorFrequency>* frequencies = nullptr);

  static std::string PickBackground(const std::vector<std::string>& ranked, ColorScheme scheme,
                                    const std::string& page_background);

private:
  static double BackgroundWeight(const SnapshotRect& rect);
};

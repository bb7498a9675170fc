#pragma once

#include "core/swatch_branding_types.h"
#include <string>
#include <vector>

// Spacing grid and corner radius inference
class SwatchSpacingInference {
public:
  /**
   * Infer the spacing base unit from resolved spacing values (px).
   *
   * Values are rounded and restricted to (0, 128]. Each unit in
   * {4, 6, 8, 10, 12} is scored by the share of values that are a multiple
   * of it or within 1px of one. Among units reaching 60%, the highest share
   * wins and ties go to the larger unit. Without a qualifying unit the
   * median is rounded to an even number and clamped to [2, 12].
   * Returns 8 when there are no usable values.
   */
  static int InferBaseUnit(const std::vector<double>& values);

  // Median radius rounded to whole pixels, "8px" when empty
  static std::string PickBorderRadius(const std::vector<double>& radii);

  // Radii observed on snapshots followed by stylesheet radii
  static std::vector<double> CollectRadii(const RawBrandingRecord& raw);

  static SpacingProfile Infer(const RawBrandingRecord& raw);
};

#pragma once

#include "ai/swatch_brand_classifier.h"
#include "core/swatch_branding_types.h"
#include <optional>
#include <string>
#include <vector>

/**
 * SwatchBrandingMerger - applies a SemanticEnhancement to a heuristic profile.
 *
 * Every field is decided on its own: it is overridden only when the
 * enhancement carries a value for it and that value is usable (an index
 * inside the list that was sent, a colour that hexifies, a logo with a
 * source). Anything else keeps the heuristic value. Confidence is recorded,
 * never used to gate an override.
 */
class SwatchBrandingMerger {
public:
  /**
   * buttons and logos must be the lists the classifier was given. When
   * report is non-null it receives the per-field outcome; the report is also
   * attached to the debug payload of the returned profile when it has one.
   */
  static BrandingProfile Merge(const BrandingProfile& heuristic,
                               const SemanticEnhancement& enhancement,
                               const std::vector<ButtonCandidate>& buttons,
                               const std::vector<LogoCandidate>& logos,
                               MergeReport* report = nullptr);

private:
  static bool ValidIndex(const std::optional<int>& index, size_t size);
  static bool OverrideColor(const std::optional<std::string>& value, std::string& field);
};

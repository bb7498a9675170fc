#pragma once

#include "core/swatch_branding_types.h"
#include <string>
#include <vector>

// Font roles and the ranked list of families a page uses
class SwatchTypographyInference {
public:
  static constexpr size_t kMaxFonts = 10;

  // Families, stacks and sizes for the profile
  static TypographyProfile Infer(const RawBrandingRecord& raw);

  // Family frequencies over the body, heading and every snapshot stack,
  // generic keywords and var() references excluded, top kMaxFonts
  static std::vector<FontUsage> RankFonts(const RawBrandingRecord& raw);

  // CSS generic families, global keywords and system emoji fonts
  static bool IsGenericFamily(const std::string& family);
};

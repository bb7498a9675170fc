#pragma once

#include "core/swatch_branding_types.h"
#include <vector>

/**
 * SwatchBrandingProcessor - deterministic RawBrandingRecord -> heuristic
 * BrandingProfile.
 *
 * Pure: no logging of page data, no shared state, never throws on
 * malformed input. The returned profile always carries the debug payload
 * and the full button candidate list; the transformer strips them.
 */
class SwatchBrandingProcessor {
public:
  static BrandingProfile Process(const RawBrandingRecord& raw);

  // logo: first of logo, logo-svg, og, twitter, favicon
  static ImagesProfile PickImages(const std::vector<BrandImage>& images);

private:
  static BrandingDebug BuildDebug(const RawBrandingRecord& raw, const Palette& palette,
                                  const std::vector<ColorFrequency>& frequencies);
};

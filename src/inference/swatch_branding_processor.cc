#include "inference/swatch_branding_processor.h"
#include "color/swatch_color.h"
#include "inference/swatch_button_scorer.h"
#include "inference/swatch_component_builder.h"
#include "inference/swatch_palette_inference.h"
#include "inference/swatch_spacing_inference.h"
#include "inference/swatch_typography_inference.h"
#include <initializer_list>

namespace {

const size_t kDebugClassChars = 50;

std::string FirstOfType(const std::vector<BrandImage>& images, ImageType type) {
  for (const auto& image : images) {
    if (image.type == type && !image.src.empty()) {
      return image.src;
    }
  }
  return "";
}

SourcedColor Sourced(const std::string& hex, const StyleSnapshot& snap) {
  SourcedColor color;
  color.hex = hex;
  color.tag = snap.tag;
  color.classes = snap.classes.substr(0, kDebugClassChars);
  return color;
}

}  // namespace

ImagesProfile SwatchBrandingProcessor::PickImages(const std::vector<BrandImage>& images) {
  ImagesProfile profile;
  for (ImageType type : {ImageType::LOGO, ImageType::LOGO_SVG, ImageType::OG,
                         ImageType::TWITTER, ImageType::FAVICON}) {
    profile.logo = FirstOfType(images, type);
    if (!profile.logo.empty()) {
      break;
    }
  }
  profile.favicon = FirstOfType(images, ImageType::FAVICON);
  profile.og_image = FirstOfType(images, ImageType::OG);
  if (profile.og_image.empty()) {
    profile.og_image = FirstOfType(images, ImageType::TWITTER);
  }
  return profile;
}

BrandingDebug SwatchBrandingProcessor::BuildDebug(const RawBrandingRecord& raw, const Palette& palette,
                                                  const std::vector<ColorFrequency>& frequencies) {
  BrandingDebug debug;
  debug.all_detected_colors = frequencies;
  debug.background_candidates = raw.background_candidates;
  debug.raw_css_colors = raw.css_data.colors;
  debug.inferred_palette = palette;
  debug.collection_skips = raw.css_data.skipped;

  for (const auto& snap : raw.snapshots) {
    std::string background = SwatchColor::Hexify(snap.colors.background);
    if (!background.empty()) {
      SourcedColor color = Sourced(background, snap);
      color.area = snap.rect.w * snap.rect.h;
      debug.snapshot_backgrounds.push_back(color);
    }
    std::string text = SwatchColor::Hexify(snap.colors.text);
    if (!text.empty()) {
      debug.snapshot_texts.push_back(Sourced(text, snap));
    }
    std::string border = SwatchColor::Hexify(snap.colors.border);
    if (!border.empty()) {
      debug.snapshot_borders.push_back(Sourced(border, snap));
    }
  }
  return debug;
}

BrandingProfile SwatchBrandingProcessor::Process(const RawBrandingRecord& raw) {
  BrandingProfile profile;
  profile.color_scheme = raw.color_scheme;

  std::vector<ColorFrequency> frequencies;
  profile.colors = SwatchPaletteInference::Infer(raw, &frequencies);

  profile.typography = SwatchTypographyInference::Infer(raw);
  profile.fonts = SwatchTypographyInference::RankFonts(raw);
  profile.spacing = SwatchSpacingInference::Infer(raw);
  profile.images = PickImages(raw.images);

  profile.button_candidates = SwatchButtonScorer::RankCandidates(raw.snapshots);
  profile.components = SwatchComponentBuilder::Build(profile.button_candidates, raw.snapshots, profile.colors,
                                                     profile.spacing.border_radius, profile.button_selection);

  profile.framework_hints = raw.framework_hints;

  profile.has_debug = true;
  profile.debug = BuildDebug(raw, profile.colors, frequencies);
  return profile;
}

#pragma once

#include <memory>
#include <string>
#include "ai/swatch_brand_classifier.h"
#include "core/swatch_branding_types.h"
#include "util/swatch_config.h"

// What the caller knows about the page besides the collected record
struct BrandingPageInfo {
  std::string url;
  std::string screenshot_base64;  // PNG, may be empty
};

/**
 * SwatchBrandingTransformer - raw record in, final profile out.
 *
 * Runs inference, then the classifier when one is configured, then the
 * merger. A classifier failure or exception is logged and the heuristic
 * profile is kept. The debug payload and the button candidate list are
 * removed from the result unless debug output is enabled.
 */
class SwatchBrandingTransformer {
 public:
  // classifier may be null: the heuristic profile is then final
  SwatchBrandingTransformer(std::shared_ptr<SwatchBrandClassifier> classifier, bool debug_output);

  // LLM classifier when config.classifier_enabled, debug from config.debug_branding
  static SwatchBrandingTransformer FromConfig(const SwatchConfig& config);

  BrandingProfile Transform(const RawBrandingRecord& raw, const BrandingPageInfo& page) const;

  // Remove the debug payload and the button candidate list
  static void StripDebug(BrandingProfile& profile);

  bool HasClassifier() const { return classifier_ != nullptr; }
  bool DebugOutput() const { return debug_output_; }

 private:
  std::shared_ptr<SwatchBrandClassifier> classifier_;
  bool debug_output_;
};

#ifndef SWATCH_BRAND_CLASSIFIER_H_
#define SWATCH_BRAND_CLASSIFIER_H_

#include <optional>
#include <string>
#include <vector>
#include "core/swatch_branding_types.h"

// Everything a semantic classifier may look at for one page
struct ClassificationRequest {
  BrandingProfile profile;                 // heuristic profile
  std::vector<ButtonCandidate> buttons;    // ranked, indices refer to this list
  std::vector<LogoCandidate> logos;        // may be empty
  std::string brand_name;                  // may be empty
  std::string screenshot_base64;           // PNG, may be empty
  std::string url;
};

struct ButtonClassification {
  std::optional<int> primary_index;
  std::optional<int> secondary_index;
  double confidence = 0.0;
};

struct ColorRoles {
  std::optional<std::string> primary;
  std::optional<std::string> accent;
  std::optional<std::string> background;
  std::optional<std::string> text_primary;
  std::optional<std::string> link;
  double confidence = 0.0;
};

struct LogoSelection {
  std::optional<int> selected_index;
  double confidence = 0.0;
};

// Role assignments returned by a classifier; every block is optional
struct SemanticEnhancement {
  std::optional<ButtonClassification> button_classification;
  std::optional<ColorRoles> color_roles;
  std::optional<LogoSelection> logo_selection;
};

struct ClassificationResult {
  bool success = false;
  std::string error;
  SemanticEnhancement enhancement;
};

/**
 * SwatchBrandClassifier - semantic refinement of a heuristic profile.
 *
 * Implementations report failure through ClassificationResult and may also
 * throw; callers treat both the same way and keep the heuristic profile.
 * A call is expected to be bounded in time by the implementation.
 */
class SwatchBrandClassifier {
 public:
  virtual ~SwatchBrandClassifier() = default;

  virtual ClassificationResult Classify(const ClassificationRequest& request) = 0;
};

#endif  // SWATCH_BRAND_CLASSIFIER_H_

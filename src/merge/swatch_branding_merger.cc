#include "merge/swatch_branding_merger.h"
#include "color/swatch_color.h"
#include "inference/swatch_component_builder.h"
#include "util/logger.h"

bool SwatchBrandingMerger::ValidIndex(const std::optional<int>& index, size_t size) {
  return index.has_value() && *index >= 0 && static_cast<size_t>(*index) < size;
}

bool SwatchBrandingMerger::OverrideColor(const std::optional<std::string>& value, std::string& field) {
  if (!value) {
    return false;
  }
  std::string hex = SwatchColor::Hexify(*value);
  if (hex.empty()) {
    return false;
  }
  field = hex;
  return true;
}

BrandingProfile SwatchBrandingMerger::Merge(const BrandingProfile& heuristic,
                                            const SemanticEnhancement& enhancement,
                                            const std::vector<ButtonCandidate>& buttons,
                                            const std::vector<LogoCandidate>& logos,
                                            MergeReport* report) {
  BrandingProfile merged = heuristic;
  MergeReport outcome;
  outcome.classifier_attempted = true;
  outcome.classifier_succeeded = true;

  if (enhancement.color_roles) {
    const ColorRoles& roles = *enhancement.color_roles;
    outcome.color_confidence = roles.confidence;
    if (OverrideColor(roles.primary, merged.colors.primary)) {
      outcome.color_primary = FieldSource::OVERRIDDEN;
    }
    if (OverrideColor(roles.accent, merged.colors.accent)) {
      outcome.color_accent = FieldSource::OVERRIDDEN;
    }
    if (OverrideColor(roles.background, merged.colors.background)) {
      outcome.color_background = FieldSource::OVERRIDDEN;
    }
    if (OverrideColor(roles.text_primary, merged.colors.text_primary)) {
      outcome.color_text_primary = FieldSource::OVERRIDDEN;
    }
    if (OverrideColor(roles.link, merged.colors.link)) {
      outcome.color_link = FieldSource::OVERRIDDEN;
    }
  }

  if (enhancement.button_classification) {
    const ButtonClassification& classification = *enhancement.button_classification;
    outcome.button_confidence = classification.confidence;

    if (ValidIndex(classification.primary_index, buttons.size())) {
      int index = *classification.primary_index;
      merged.button_selection.primary_index = index;
      merged.components.has_button_primary = true;
      merged.components.button_primary = SwatchComponentBuilder::PrimaryStyle(
          buttons[index], merged.colors, merged.spacing.border_radius);
      outcome.button_primary = FieldSource::OVERRIDDEN;
    } else if (classification.primary_index) {
      LOG_DEBUG("BrandingMerger", "Ignoring primary button index " +
                std::to_string(*classification.primary_index) + " of " + std::to_string(buttons.size()));
    }

    if (ValidIndex(classification.secondary_index, buttons.size())) {
      int index = *classification.secondary_index;
      std::string primary_radius = merged.components.has_button_primary
          ? merged.components.button_primary.border_radius : merged.spacing.border_radius;
      merged.button_selection.secondary_index = index;
      merged.components.has_button_secondary = true;
      merged.components.button_secondary = SwatchComponentBuilder::SecondaryStyle(
          buttons[index], merged.colors, primary_radius);
      outcome.button_secondary = FieldSource::OVERRIDDEN;
    } else if (classification.secondary_index) {
      LOG_DEBUG("BrandingMerger", "Ignoring secondary button index " +
                std::to_string(*classification.secondary_index) + " of " + std::to_string(buttons.size()));
    }
  }

  if (enhancement.logo_selection) {
    const LogoSelection& selection = *enhancement.logo_selection;
    outcome.logo_confidence = selection.confidence;
    if (ValidIndex(selection.selected_index, logos.size()) && !logos[*selection.selected_index].src.empty()) {
      merged.images.logo = logos[*selection.selected_index].src;
      outcome.logo = FieldSource::OVERRIDDEN;
    }
  }

  if (merged.has_debug) {
    merged.debug.has_merge_report = true;
    merged.debug.merge_report = outcome;
  }
  if (report) {
    *report = outcome;
  }
  return merged;
}

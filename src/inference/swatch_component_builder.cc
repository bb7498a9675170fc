#include "inference/swatch_component_builder.h"
#include "collector/swatch_css_values.h"
#include "color/swatch_color.h"
#include <cmath>
#include <map>

namespace {

std::string StyleKey(const ButtonCandidate& candidate) {
  return candidate.background + "|" +
         (candidate.border_color.empty() ? "none" : candidate.border_color) + "|" +
         candidate.text_color;
}

}  // namespace

bool SwatchComponentBuilder::HasPrimaryClass(const ButtonCandidate& candidate) {
  return candidate.classes.find("primary") != std::string::npos ||
         candidate.classes.find("cta") != std::string::npos;
}

bool SwatchComponentBuilder::HasSecondaryClass(const ButtonCandidate& candidate) {
  for (const auto& token : SwatchCssValues::SplitTokens(candidate.classes)) {
    if (token == "secondary" || token == "button-secondary" || token == "btn-secondary" ||
        token == "outline" || token == "ghost") {
      return true;
    }
    if (token.find("secondary") != std::string::npos && token.find("tertiary") == std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string SwatchComponentBuilder::RadiusOr(const ButtonCandidate& candidate, const std::string& fallback) {
  double radius = 0.0;
  if (SwatchCssValues::LeadingNumber(candidate.border_radius, radius) && radius > 0) {
    return std::to_string(std::lround(radius)) + "px";
  }
  return fallback;
}

int SwatchComponentBuilder::PickPrimary(const std::vector<ButtonCandidate>& candidates) {
  if (candidates.empty()) {
    return -1;
  }

  int by_class = -1;
  for (size_t i = 0; i < candidates.size(); i++) {
    if (HasPrimaryClass(candidates[i])) {
      by_class = static_cast<int>(i);
      break;
    }
  }
  if (by_class >= 0 && SwatchColor::IsColorValid(candidates[by_class].background)) {
    return by_class;
  }

  int largest = -1;
  for (size_t i = 0; i < candidates.size(); i++) {
    if (!SwatchColor::IsColorValid(candidates[i].background)) {
      continue;
    }
    if (largest < 0 || candidates[i].area > candidates[largest].area) {
      largest = static_cast<int>(i);
    }
  }
  if (largest >= 0) {
    return largest;
  }
  return by_class >= 0 ? by_class : 0;
}

int SwatchComponentBuilder::PickSecondary(const std::vector<ButtonCandidate>& candidates, int primary) {
  for (size_t i = 0; i < candidates.size(); i++) {
    if (static_cast<int>(i) != primary && HasSecondaryClass(candidates[i])) {
      return static_cast<int>(i);
    }
  }

  const ButtonCandidate* primary_candidate =
      (primary >= 0 && primary < static_cast<int>(candidates.size())) ? &candidates[primary] : nullptr;
  std::string primary_key = primary_candidate ? StyleKey(*primary_candidate) : "";

  // Repeated styles, first-seen order
  std::map<std::string, size_t> group_index;
  std::vector<std::pair<int, int>> groups;  // first candidate, count
  for (size_t i = 0; i < candidates.size(); i++) {
    if (static_cast<int>(i) == primary) {
      continue;
    }
    std::string key = StyleKey(candidates[i]);
    if (key == primary_key) {
      continue;
    }
    auto it = group_index.find(key);
    if (it == group_index.end()) {
      group_index[key] = groups.size();
      groups.emplace_back(static_cast<int>(i), 1);
    } else {
      groups[it->second].second++;
    }
  }
  int best_group = -1;
  for (size_t g = 0; g < groups.size(); g++) {
    if (groups[g].second >= 2 && (best_group < 0 || groups[g].second > groups[best_group].second)) {
      best_group = static_cast<int>(g);
    }
  }
  if (best_group >= 0) {
    return groups[best_group].first;
  }

  bool primary_has_border = primary_candidate && SwatchColor::IsColorValid(primary_candidate->border_color);
  for (size_t i = 0; i < candidates.size(); i++) {
    if (static_cast<int>(i) == primary) {
      continue;
    }
    const ButtonCandidate& candidate = candidates[i];
    bool different_background = !primary_candidate || candidate.background != primary_candidate->background;
    bool has_border = SwatchColor::IsColorValid(candidate.border_color);
    if (different_background || (has_border && !primary_has_border)) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

ButtonStyle SwatchComponentBuilder::PrimaryStyle(const ButtonCandidate& candidate, const Palette& palette,
                                                 const std::string& border_radius) {
  ButtonStyle style;
  style.background = SwatchColor::IsColorValid(candidate.background) ? candidate.background : palette.primary;
  style.text_color = candidate.text_color.empty()
      ? SwatchColor::ContrastTextColor(style.background) : candidate.text_color;
  style.border_radius = RadiusOr(candidate, border_radius);
  return style;
}

ButtonStyle SwatchComponentBuilder::SecondaryStyle(const ButtonCandidate& candidate, const Palette& palette,
                                                   const std::string& primary_radius) {
  ButtonStyle style;
  if (SwatchColor::IsColorValid(candidate.background)) {
    style.background = candidate.background;
  }
  style.text_color = candidate.text_color.empty() ? palette.primary : candidate.text_color;
  style.border_color = SwatchColor::IsColorValid(candidate.border_color) ? candidate.border_color : palette.primary;
  style.border_radius = RadiusOr(candidate, primary_radius);
  return style;
}

InputStyle SwatchComponentBuilder::BuildInput(const std::vector<StyleSnapshot>& snapshots,
                                              const std::string& border_radius) {
  InputStyle input;
  input.border_color = "#CCCCCC";
  input.border_radius = border_radius;
  for (const auto& snap : snapshots) {
    if (!snap.is_input) {
      continue;
    }
    std::string border = SwatchColor::Hexify(snap.colors.border);
    if (!border.empty()) {
      input.border_color = border;
    }
    break;
  }
  return input;
}

ComponentsProfile SwatchComponentBuilder::Build(const std::vector<ButtonCandidate>& candidates,
                                                const std::vector<StyleSnapshot>& snapshots,
                                                const Palette& palette,
                                                const std::string& border_radius,
                                                ButtonSelection& selection) {
  ComponentsProfile components;
  components.input = BuildInput(snapshots, border_radius);

  selection.primary_index = PickPrimary(candidates);
  selection.secondary_index = PickSecondary(candidates, selection.primary_index);

  std::string primary_radius = border_radius;
  if (selection.primary_index >= 0) {
    components.has_button_primary = true;
    components.button_primary = PrimaryStyle(candidates[selection.primary_index], palette, border_radius);
    primary_radius = components.button_primary.border_radius;
  }
  if (selection.secondary_index >= 0) {
    components.has_button_secondary = true;
    components.button_secondary = SecondaryStyle(candidates[selection.secondary_index], palette, primary_radius);
  }
  return components;
}

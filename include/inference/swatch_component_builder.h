#pragma once

#include "core/swatch_branding_types.h"
#include <string>
#include <vector>

// Heuristic button and input styles chosen from the ranked button candidates
class SwatchComponentBuilder {
public:
  /**
   * Build the components block and record which candidates were chosen.
   * border_radius is the profile-wide radius used when a candidate has none.
   */
  static ComponentsProfile Build(const std::vector<ButtonCandidate>& candidates,
                                 const std::vector<StyleSnapshot>& snapshots,
                                 const Palette& palette,
                                 const std::string& border_radius,
                                 ButtonSelection& selection);

  // Class match with a valid background, else the largest valid background,
  // else the class match, else the top candidate. -1 when empty.
  static int PickPrimary(const std::vector<ButtonCandidate>& candidates);

  // Secondary class match, else the most common repeated style that
  // differs from primary, else the first visually distinct candidate. -1 when none.
  static int PickSecondary(const std::vector<ButtonCandidate>& candidates, int primary);

  static ButtonStyle PrimaryStyle(const ButtonCandidate& candidate, const Palette& palette,
                                  const std::string& border_radius);
  static ButtonStyle SecondaryStyle(const ButtonCandidate& candidate, const Palette& palette,
                                    const std::string& primary_radius);

  static InputStyle BuildInput(const std::vector<StyleSnapshot>& snapshots, const std::string& border_radius);

private:
  static bool HasPrimaryClass(const ButtonCandidate& candidate);
  static bool HasSecondaryClass(const ButtonCandidate& candidate);
  // Rounded candidate radius, or fallback when the candidate has none
  static std::string RadiusOr(const ButtonCandidate& candidate, const std::string& fallback);
};

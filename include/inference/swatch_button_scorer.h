#pragma once

#include "core/swatch_branding_types.h"
#include <string>
#include <vector>

/**
 * SwatchButtonScorer - turns button snapshots into ranked, deduplicated
 * ButtonCandidates.
 *
 * Eligible snapshots are flagged as buttons, at least 30x30px, carry text
 * and have a background that hexifies. Score:
 *   +1000  explicit call-to-action indicator
 *   +500   text contains a call-to-action keyword
 *   +300   visible background that is not near-white
 *   +100   text shorter than 50 characters
 *   +10 * log10(area + 1)
 * Candidates with the same signature collapse into the first (highest
 * scoring) one, and the list is capped at kMaxCandidates.
 */
class SwatchButtonScorer {
public:
  static constexpr size_t kMaxCandidates = 80;
  static constexpr double kMinButtonSize = 30.0;

  static std::vector<ButtonCandidate> RankCandidates(const std::vector<StyleSnapshot>& snapshots);

  static bool IsEligible(const StyleSnapshot& snapshot);
  static double Score(const StyleSnapshot& snapshot);

  // "<text, lower-cased, trimmed, 50 chars>|<background hex>|<first 5 class tokens>"
  static std::string Signature(const std::string& text, const std::string& background_hex,
                               const std::string& classes);

  static bool ContainsCtaKeyword(const std::string& text);

private:
  static ButtonCandidate MakeCandidate(const StyleSnapshot& snapshot, double score);
};

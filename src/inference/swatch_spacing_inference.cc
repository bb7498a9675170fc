#include "inference/swatch_spacing_inference.h"
#include <algorithm>
#include <cmath>

namespace {

const int kUnitCandidates[] = {4, 6, 8, 10, 12};
const double kAgreementThreshold = 0.6;
const double kMaxSpacingPx = 128.0;

}  // namespace

int SwatchSpacingInference::InferBaseUnit(const std::vector<double>& values) {
  std::vector<int> usable;
  for (double v : values) {
    if (std::isfinite(v) && v > 0 && v <= kMaxSpacingPx) {
      usable.push_back(static_cast<int>(std::lround(v)));
    }
  }
  if (usable.empty()) {
    return 8;
  }

  int best_unit = 0;
  double best_share = 0.0;
  for (int unit : kUnitCandidates) {
    int agreeing = 0;
    for (int v : usable) {
      int rem = v % unit;
      if (rem <= 1 || unit - rem <= 1) {
        agreeing++;
      }
    }
    double share = static_cast<double>(agreeing) / usable.size();
    if (share >= kAgreementThreshold && share >= best_share) {
      best_unit = unit;
      best_share = share;
    }
  }
  if (best_unit != 0) {
    return best_unit;
  }

  std::sort(usable.begin(), usable.end());
  int median = usable[usable.size() / 2];
  int unit = static_cast<int>(std::lround(median / 2.0)) * 2;
  return std::max(2, std::min(12, unit));
}

std::string SwatchSpacingInference::PickBorderRadius(const std::vector<double>& radii) {
  std::vector<double> finite;
  for (double r : radii) {
    if (std::isfinite(r)) {
      finite.push_back(r);
    }
  }
  if (finite.empty()) {
    return "8px";
  }
  std::sort(finite.begin(), finite.end());
  double median = finite[finite.size() / 2];
  return std::to_string(std::lround(median)) + "px";
}

std::vector<double> SwatchSpacingInference::CollectRadii(const RawBrandingRecord& raw) {
  std::vector<double> radii;
  for (const auto& snap : raw.snapshots) {
    if (snap.has_radius) {
      radii.push_back(snap.radius);
    }
  }
  radii.insert(radii.end(), raw.css_data.radii.begin(), raw.css_data.radii.end());
  return radii;
}

SpacingProfile SwatchSpacingInference::Infer(const RawBrandingRecord& raw) {
  SpacingProfile spacing;
  spacing.base_unit = InferBaseUnit(raw.css_data.spacings);
  spacing.border_radius = PickBorderRadius(CollectRadii(raw));
  return spacing;
}

#include "inference/swatch_button_scorer.h"
#include "collector/swatch_css_values.h"
#include "color/swatch_color.h"
#include <algorithm>
#include <cmath>
#include <map>

namespace {

const char* const kCtaKeywords[] = {
  "sign up", "get started", "deploy", "try", "demo", "contact", "buy",
  "subscribe", "join", "register", "free", "start", "get"
};

const char* const kNearWhite[] = {"#FFFFFF", "#FAFAFA", "#F5F5F5"};

const size_t kSignatureTextChars = 50;
const size_t kSignatureClassTokens = 5;

bool IsNearWhite(const std::string& hex) {
  for (const char* white : kNearWhite) {
    if (hex == white) {
      return true;
    }
  }
  return false;
}

}  // namespace

bool SwatchButtonScorer::ContainsCtaKeyword(const std::string& text) {
  std::string lower = SwatchCssValues::ToLower(text);
  for (const char* keyword : kCtaKeywords) {
    if (lower.find(keyword) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool SwatchButtonScorer::IsEligible(const StyleSnapshot& snapshot) {
  if (!snapshot.is_button) {
    return false;
  }
  if (!(snapshot.rect.w >= kMinButtonSize) || !(snapshot.rect.h >= kMinButtonSize)) {
    return false;
  }
  if (SwatchCssValues::Trim(snapshot.text).empty()) {
    return false;
  }
  return !SwatchColor::Hexify(snapshot.colors.background).empty();
}

double SwatchButtonScorer::Score(const StyleSnapshot& snapshot) {
  double score = 0.0;
  if (snapshot.has_cta_indicator) {
    score += 1000;
  }

  std::string text = SwatchCssValues::ToLower(snapshot.text);
  if (ContainsCtaKeyword(text)) {
    score += 500;
  }

  std::string background = SwatchColor::Hexify(snapshot.colors.background);
  if (!background.empty() && SwatchColor::Alpha(background) >= 0.01 && !IsNearWhite(background)) {
    score += 300;
  }

  if (!text.empty() && text.size() < 50) {
    score += 100;
  }

  double area = snapshot.rect.w * snapshot.rect.h;
  if (std::isfinite(area) && area >= 0) {
    score += std::log10(area + 1) * 10;
  }
  return score;
}

std::string SwatchButtonScorer::Signature(const std::string& text, const std::string& background_hex,
                                          const std::string& classes) {
  std::string text_key = SwatchCssValues::ToLower(SwatchCssValues::Trim(text)).substr(0, kSignatureTextChars);

  std::vector<std::string> tokens = SwatchCssValues::SplitTokens(SwatchCssValues::ToLower(classes));
  std::string class_key;
  for (size_t i = 0; i < tokens.size() && i < kSignatureClassTokens; i++) {
    if (i > 0) {
      class_key += " ";
    }
    class_key += tokens[i];
  }

  return text_key + "|" + (background_hex.empty() ? "transparent" : background_hex) + "|" + class_key;
}

ButtonCandidate SwatchButtonScorer::MakeCandidate(const StyleSnapshot& snapshot, double score) {
  ButtonCandidate candidate;
  candidate.text = snapshot.text;
  candidate.classes = snapshot.classes;
  candidate.background = SwatchColor::Hexify(snapshot.colors.background);
  candidate.text_color = SwatchColor::Hexify(snapshot.colors.text);
  if (candidate.text_color.empty()) {
    candidate.text_color = "#000000";
  }
  if (snapshot.colors.border_width > 0) {
    candidate.border_color = SwatchColor::Hexify(snapshot.colors.border);
  }
  candidate.border_radius = (snapshot.has_radius && snapshot.radius != 0.0)
      ? SwatchCssValues::FormatPx(snapshot.radius) : "0px";
  candidate.shadow = snapshot.shadow;
  candidate.score = score;
  candidate.area = snapshot.rect.w * snapshot.rect.h;
  candidate.signature = Signature(snapshot.text, candidate.background, snapshot.classes);
  candidate.original_background = snapshot.colors.background;
  candidate.original_text_color = snapshot.colors.text;
  candidate.original_border_color = snapshot.colors.border;
  return candidate;
}

std::vector<ButtonCandidate> SwatchButtonScorer::RankCandidates(const std::vector<StyleSnapshot>& snapshots) {
  std::vector<ButtonCandidate> scored;
  for (const auto& snap : snapshots) {
    if (IsEligible(snap)) {
      scored.push_back(MakeCandidate(snap, Score(snap)));
    }
  }

  std::stable_sort(scored.begin(), scored.end(),
      [](const ButtonCandidate& a, const ButtonCandidate& b) { return a.score > b.score; });

  std::vector<ButtonCandidate> unique;
  std::map<std::string, size_t> seen;
  for (auto& candidate : scored) {
    auto it = seen.find(candidate.signature);
    if (it != seen.end()) {
      unique[it->second].duplicate_count++;
      continue;
    }
    seen[candidate.signature] = unique.size();
    unique.push_back(std::move(candidate));
  }

  if (unique.size() > kMaxCandidates) {
    unique.resize(kMaxCandidates);
  }
  for (size_t i = 0; i < unique.size(); i++) {
    unique[i].index = static_cast<int>(i);
  }
  return unique;
}

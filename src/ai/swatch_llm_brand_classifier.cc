#include "ai/swatch_llm_brand_classifier.h"
#include "color/swatch_color.h"
#include "util/logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace {

const size_t kPromptTextChars = 60;
const size_t kPromptClassChars = 80;
const size_t kPromptSrcChars = 120;

std::optional<int> ReadIndex(const json& block, const char* key) {
  auto it = block.find(key);
  if (it == block.end()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    uint64_t value = it->get<uint64_t>();
    if (value > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
      return std::nullopt;
    }
    return static_cast<int>(value);
  }
  if (it->is_number_integer()) {
    int64_t value = it->get<int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
      return std::nullopt;
    }
    return static_cast<int>(value);
  }
  if (it->is_number_float()) {
    double value = it->get<double>();
    if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e9) {
      return static_cast<int>(value);
    }
  }
  return std::nullopt;
}

double ReadConfidence(const json& block) {
  auto it = block.find("confidence");
  if (it == block.end() || !it->is_number()) {
    return 0.0;
  }
  double value = it->get<double>();
  if (!std::isfinite(value)) {
    return 0.0;
  }
  return std::max(0.0, std::min(1.0, value));
}

std::optional<std::string> ReadColor(const json& block, const char* key) {
  auto it = block.find(key);
  if (it == block.end() || !it->is_string()) {
    return std::nullopt;
  }
  std::string hex = SwatchColor::Hexify(it->get<std::string>());
  if (hex.empty()) {
    return std::nullopt;
  }
  return hex;
}

std::string Clip(const std::string& value, size_t max_chars) {
  return value.size() > max_chars ? value.substr(0, max_chars) + "..." : value;
}

std::string OrNone(const std::string& value) {
  return value.empty() ? "none" : value;
}

}  // namespace

SwatchLLMBrandClassifier::SwatchLLMBrandClassifier(std::unique_ptr<SwatchLLMClient> client)
    : client_(std::move(client)) {}

std::string SwatchLLMBrandClassifier::SystemPrompt() {
  return "You are a brand design analyst. You receive signals extracted from a rendered web page "
         "and decide which elements carry the brand. Answer with a single JSON object and nothing else.";
}

std::string SwatchLLMBrandClassifier::BuildPrompt(const ClassificationRequest& request) {
  const BrandingProfile& profile = request.profile;
  std::ostringstream prompt;

  prompt << "URL: " << request.url << "\n";
  if (!request.brand_name.empty()) {
    prompt << "Brand name: " << request.brand_name << "\n";
  }
  prompt << "Color scheme: " << ColorSchemeToString(profile.color_scheme) << "\n\n";

  prompt << "Heuristic palette:\n"
         << "  primary: " << OrNone(profile.colors.primary) << "\n"
         << "  accent: " << OrNone(profile.colors.accent) << "\n"
         << "  background: " << OrNone(profile.colors.background) << "\n"
         << "  text_primary: " << OrNone(profile.colors.text_primary) << "\n"
         << "  link: " << OrNone(profile.colors.link) << "\n";

  if (!profile.fonts.empty()) {
    prompt << "Fonts:";
    for (const auto& font : profile.fonts) {
      prompt << " " << font.family << " (" << font.count << ")";
    }
    prompt << "\n";
  }

  prompt << "\nButton candidates (" << request.buttons.size() << "):\n";
  for (size_t i = 0; i < request.buttons.size(); i++) {
    const ButtonCandidate& button = request.buttons[i];
    prompt << "  [" << i << "] text=\"" << Clip(button.text, kPromptTextChars) << "\""
           << " background=" << OrNone(button.background)
           << " text_color=" << OrNone(button.text_color)
           << " border=" << OrNone(button.border_color)
           << " radius=" << button.border_radius
           << " classes=\"" << Clip(button.classes, kPromptClassChars) << "\""
           << " score=" << std::lround(button.score) << "\n";
  }

  if (!request.logos.empty()) {
    prompt << "\nLogo candidates (" << request.logos.size() << "):\n";
    for (size_t i = 0; i < request.logos.size(); i++) {
      const LogoCandidate& logo = request.logos[i];
      prompt << "  [" << i << "] " << (logo.is_svg ? "svg" : "img")
             << " alt=\"" << Clip(logo.alt, kPromptTextChars) << "\""
             << " in_header=" << (logo.in_header ? "true" : "false")
             << " links_home=" << (logo.href_matches_root ? "true" : "false")
             << " position=" << std::lround(logo.left) << "," << std::lround(logo.top)
             << " size=" << std::lround(logo.width) << "x" << std::lround(logo.height)
             << " src=" << Clip(logo.src, kPromptSrcChars) << "\n";
    }
  }

  prompt << "\nReturn JSON with these keys (use null when unsure):\n"
         << "{\"button_classification\": {\"primary_index\": int|null, \"secondary_index\": int|null, "
         << "\"confidence\": 0..1},\n"
         << " \"color_roles\": {\"primary\": hex|null, \"accent\": hex|null, \"background\": hex|null, "
         << "\"text_primary\": hex|null, \"link\": hex|null, \"confidence\": 0..1}";
  if (!request.logos.empty()) {
    prompt << ",\n \"logo_selection\": {\"selected_index\": int|null, \"confidence\": 0..1}";
  }
  prompt << "}\n";
  return prompt.str();
}

std::string SwatchLLMBrandClassifier::ExtractJsonObject(const std::string& content) {
  size_t start = content.find('{');
  size_t end = content.rfind('}');
  if (start == std::string::npos || end == std::string::npos || end < start) {
    return "";
  }
  return content.substr(start, end - start + 1);
}

bool SwatchLLMBrandClassifier::ParseEnhancement(const std::string& content, SemanticEnhancement& out,
                                                std::string& error) {
  std::string body = ExtractJsonObject(content);
  if (body.empty()) {
    error = "Response does not contain a JSON object";
    return false;
  }

  json reply = json::parse(body, nullptr, false);
  if (reply.is_discarded() || !reply.is_object()) {
    error = "Response is not a JSON object";
    return false;
  }

  SemanticEnhancement enhancement;

  auto block = [&](const char* key, const json*& value) {
    value = nullptr;
    auto it = reply.find(key);
    if (it == reply.end() || it->is_null()) {
      return true;
    }
    if (!it->is_object()) {
      error = std::string("'") + key + "' is not an object";
      return false;
    }
    value = &*it;
    return true;
  };

  const json* buttons = nullptr;
  const json* colors = nullptr;
  const json* logo = nullptr;
  if (!block("button_classification", buttons) || !block("color_roles", colors) ||
      !block("logo_selection", logo)) {
    return false;
  }

  if (buttons) {
    ButtonClassification classification;
    classification.primary_index = ReadIndex(*buttons, "primary_index");
    classification.secondary_index = ReadIndex(*buttons, "secondary_index");
    classification.confidence = ReadConfidence(*buttons);
    enhancement.button_classification = classification;
  }

  if (colors) {
    ColorRoles roles;
    roles.primary = ReadColor(*colors, "primary");
    roles.accent = ReadColor(*colors, "accent");
    roles.background = ReadColor(*colors, "background");
    roles.text_primary = ReadColor(*colors, "text_primary");
    roles.link = ReadColor(*colors, "link");
    roles.confidence = ReadConfidence(*colors);
    enhancement.color_roles = roles;
  }

  if (logo) {
    LogoSelection selection;
    selection.selected_index = ReadIndex(*logo, "selected_index");
    selection.confidence = ReadConfidence(*logo);
    enhancement.logo_selection = selection;
  }

  out = enhancement;
  return true;
}

ClassificationResult SwatchLLMBrandClassifier::Classify(const ClassificationRequest& request) {
  ClassificationResult result;
  if (!client_) {
    result.error = "No LLM client configured";
    return result;
  }

  SwatchLLMClient::CompletionResponse response =
      client_->Complete(BuildPrompt(request), SystemPrompt(), request.screenshot_base64, true);
  if (!response.success) {
    result.error = response.error;
    return result;
  }

  if (!ParseEnhancement(response.content, result.enhancement, result.error)) {
    LOG_WARN("BrandClassifier", "Rejected classifier reply: " + result.error);
    return result;
  }

  result.success = true;
  return result;
}

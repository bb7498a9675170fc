#ifndef SWATCH_LLM_BRAND_CLASSIFIER_H_
#define SWATCH_LLM_BRAND_CLASSIFIER_H_

#include <memory>
#include <string>
#include "ai/swatch_brand_classifier.h"
#include "ai/swatch_llm_client.h"

/**
 * SwatchLLMBrandClassifier - classifier backed by a chat completion model.
 *
 * The prompt lists the heuristic palette and fonts, every ranked button
 * candidate by index and the logo candidates. The model answers with one
 * JSON object:
 *
 *   {
 *     "button_classification": {"primary_index": 0, "secondary_index": 3, "confidence": 0.8},
 *     "color_roles": {"primary": "#0055FF", "accent": null, "background": "#FFFFFF",
 *                     "text_primary": "#111111", "link": null, "confidence": 0.7},
 *     "logo_selection": {"selected_index": 1, "confidence": 0.9}
 *   }
 *
 * Bounds are not checked here; that is the merger's job.
 */
class SwatchLLMBrandClassifier : public SwatchBrandClassifier {
 public:
  explicit SwatchLLMBrandClassifier(std::unique_ptr<SwatchLLMClient> client);

  ClassificationResult Classify(const ClassificationRequest& request) override;

  static std::string SystemPrompt();
  static std::string BuildPrompt(const ClassificationRequest& request);

  /**
   * Validate a model reply. Code fences and text around the first JSON
   * object are ignored. Fails when no JSON object can be parsed or a block
   * is present but not an object. Inside a block, indices that are not
   * integers and colours that do not hexify are dropped, and confidences
   * are clamped to [0, 1].
   */
  static bool ParseEnhancement(const std::string& content, SemanticEnhancement& out, std::string& error);

  // Text from the first '{' to the last '}', or "" when there is none
  static std::string ExtractJsonObject(const std::string& content);

 private:
  std::unique_ptr<SwatchLLMClient> client_;
};

#endif  // SWATCH_LLM_BRAND_CLASSIFIER_H_

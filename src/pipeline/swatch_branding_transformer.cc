#include "pipeline/swatch_branding_transformer.h"
#include "ai/swatch_llm_brand_classifier.h"
#include "ai/swatch_llm_client.h"
#include "inference/swatch_branding_processor.h"
#include "merge/swatch_branding_merger.h"
#include "util/logger.h"
#include <exception>

namespace {

std::string IndexString(const std::optional<int>& index) {
  return index ? std::to_string(*index) : "none";
}

}  // namespace

SwatchBrandingTransformer::SwatchBrandingTransformer(std::shared_ptr<SwatchBrandClassifier> classifier,
                                                     bool debug_output)
    : classifier_(std::move(classifier)),
      debug_output_(debug_output) {}

SwatchBrandingTransformer SwatchBrandingTransformer::FromConfig(const SwatchConfig& config) {
  std::shared_ptr<SwatchBrandClassifier> classifier;
  if (config.classifier_enabled) {
    auto client = std::make_unique<SwatchLLMClient>(config.llm.endpoint, config.llm.timeout_ms);
    client->SetModel(config.llm.model);
    client->SetApiKey(config.llm.api_key);
    classifier = std::make_shared<SwatchLLMBrandClassifier>(std::move(client));
    LOG_DEBUG("BrandingTransformer", "LLM classifier enabled for " + config.llm.endpoint);
  }
  return SwatchBrandingTransformer(classifier, config.debug_branding);
}

void SwatchBrandingTransformer::StripDebug(BrandingProfile& profile) {
  profile.has_debug = false;
  profile.debug = BrandingDebug();
  profile.button_candidates.clear();
}

BrandingProfile SwatchBrandingTransformer::Transform(const RawBrandingRecord& raw,
                                                     const BrandingPageInfo& page) const {
  BrandingProfile heuristic = SwatchBrandingProcessor::Process(raw);
  BrandingProfile profile = heuristic;

  if (classifier_) {
    ClassificationRequest request;
    request.profile = heuristic;
    request.buttons = heuristic.button_candidates;
    request.logos = raw.logo_candidates;
    request.brand_name = raw.brand_name;
    request.screenshot_base64 = page.screenshot_base64;
    request.url = page.url;

    LOG_INFO("BrandingTransformer", "Sending " + std::to_string(request.buttons.size()) + " buttons and " +
             std::to_string(request.logos.size()) + " logo candidates to classifier");

    MergeReport failure;
    failure.classifier_attempted = true;
    bool succeeded = false;

    try {
      ClassificationResult result = classifier_->Classify(request);
      if (result.success) {
        const SemanticEnhancement& enhancement = result.enhancement;
        if (enhancement.button_classification) {
          LOG_INFO("BrandingTransformer", "Classification complete - primary button " +
                   IndexString(enhancement.button_classification->primary_index) + ", secondary button " +
                   IndexString(enhancement.button_classification->secondary_index));
        } else {
          LOG_INFO("BrandingTransformer", "Classification complete");
        }
        profile = SwatchBrandingMerger::Merge(heuristic, enhancement, request.buttons, request.logos);
        succeeded = true;
      } else {
        failure.classifier_error = result.error;
      }
    } catch (const std::exception& e) {
      failure.classifier_error = e.what();
    }

    if (!succeeded) {
      LOG_ERROR("BrandingTransformer", "Brand classification failed, using heuristic profile only: " +
                failure.classifier_error);
      profile = heuristic;
      profile.debug.has_merge_report = true;
      profile.debug.merge_report = failure;
    }
  }

  if (!debug_output_) {
    StripDebug(profile);
  }
  return profile;
}

#include "ai/swatch_llm_brand_classifier.h"
#include "branding_fixtures.h"
#include <gtest/gtest.h>

TEST(SwatchLLMBrandClassifierTest, ParsesFencedReply) {
  std::string reply =
      "Here you go:\n```json\n"
      "{\"button_classification\": {\"primary_index\": 2, \"secondary_index\": null, \"confidence\": 0.8},\n"
      " \"color_roles\": {\"primary\": \"#0055ff\", \"accent\": null, \"background\": \"white\","
      " \"text_primary\": \"#111\", \"link\": \"nonsense\", \"confidence\": 0.7},\n"
      " \"logo_selection\": {\"selected_index\": 1, \"confidence\": 0.9}}\n```";

  SemanticEnhancement enhancement;
  std::string error;
  ASSERT_TRUE(SwatchLLMBrandClassifier::ParseEnhancement(reply, enhancement, error)) << error;

  ASSERT_TRUE(enhancement.button_classification.has_value());
  EXPECT_EQ(enhancement.button_classification->primary_index, 2);
  EXPECT_FALSE(enhancement.button_classification->secondary_index.has_value());
  EXPECT_DOUBLE_EQ(enhancement.button_classification->confidence, 0.8);

  ASSERT_TRUE(enhancement.color_roles.has_value());
  EXPECT_EQ(enhancement.color_roles->primary.value_or(""), "#0055FF");
  EXPECT_EQ(enhancement.color_roles->background.value_or(""), "#FFFFFF");
  EXPECT_EQ(enhancement.color_roles->text_primary.value_or(""), "#111111");
  EXPECT_FALSE(enhancement.color_roles->accent.has_value());
  EXPECT_FALSE(enhancement.color_roles->link.has_value());

  ASSERT_TRUE(enhancement.logo_selection.has_value());
  EXPECT_EQ(enhancement.logo_selection->selected_index, 1);
}

TEST(SwatchLLMBrandClassifierTest, RejectsRepliesWithoutAnObject) {
  SemanticEnhancement enhancement;
  std::string error;
  EXPECT_FALSE(SwatchLLMBrandClassifier::ParseEnhancement("I cannot help with that.", enhancement, error));
  EXPECT_EQ(error, "Response does not contain a JSON object");

  EXPECT_FALSE(SwatchLLMBrandClassifier::ParseEnhancement("{not json}", enhancement, error));
  EXPECT_EQ(error, "Response is not a JSON object");
}

TEST(SwatchLLMBrandClassifierTest, RejectsNonObjectBlocks) {
  SemanticEnhancement enhancement;
  std::string error;
  EXPECT_FALSE(SwatchLLMBrandClassifier::ParseEnhancement(
      "{\"button_classification\": [0, 1]}", enhancement, error));
  EXPECT_EQ(error, "'button_classification' is not an object");
}

TEST(SwatchLLMBrandClassifierTest, DropsNonIntegerIndicesAndClampsConfidence) {
  SemanticEnhancement enhancement;
  std::string error;
  ASSERT_TRUE(SwatchLLMBrandClassifier::ParseEnhancement(
      "{\"button_classification\": {\"primary_index\": \"2\", \"secondary_index\": 1.5, \"confidence\": 7},"
      " \"logo_selection\": {\"selected_index\": 3.0, \"confidence\": -1}}",
      enhancement, error));

  ASSERT_TRUE(enhancement.button_classification.has_value());
  EXPECT_FALSE(enhancement.button_classification->primary_index.has_value());
  EXPECT_FALSE(enhancement.button_classification->secondary_index.has_value());
  EXPECT_DOUBLE_EQ(enhancement.button_classification->confidence, 1.0);

  ASSERT_TRUE(enhancement.logo_selection.has_value());
  EXPECT_EQ(enhancement.logo_selection->selected_index, 3);
  EXPECT_DOUBLE_EQ(enhancement.logo_selection->confidence, 0.0);
  EXPECT_FALSE(enhancement.color_roles.has_value());
}

TEST(SwatchLLMBrandClassifierTest, DropsIndicesOutsideIntRange) {
  SemanticEnhancement enhancement;
  std::string error;
  ASSERT_TRUE(SwatchLLMBrandClassifier::ParseEnhancement(
      "{\"button_classification\": {\"primary_index\": 4294967296, \"secondary_index\": 4294967297},"
      " \"logo_selection\": {\"selected_index\": 18446744073709551615}}",
      enhancement, error));

  ASSERT_TRUE(enhancement.button_classification.has_value());
  EXPECT_FALSE(enhancement.button_classification->primary_index.has_value());
  EXPECT_FALSE(enhancement.button_classification->secondary_index.has_value());
  ASSERT_TRUE(enhancement.logo_selection.has_value());
  EXPECT_FALSE(enhancement.logo_selection->selected_index.has_value());

  ASSERT_TRUE(SwatchLLMBrandClassifier::ParseEnhancement(
      "{\"button_classification\": {\"primary_index\": -4294967296, \"secondary_index\": 2147483647}}",
      enhancement, error));
  EXPECT_FALSE(enhancement.button_classification->primary_index.has_value());
  EXPECT_EQ(enhancement.button_classification->secondary_index, 2147483647);
}

TEST(SwatchLLMBrandClassifierTest, PromptListsCandidatesByIndex) {
  ClassificationRequest request;
  request.url = "https://example.com";
  request.brand_name = "Example";
  request.buttons.push_back(MakeCandidate("Get Started", "#E11D48"));
  request.buttons.push_back(MakeCandidate("Docs", "#2563EB"));

  std::string prompt = SwatchLLMBrandClassifier::BuildPrompt(request);
  EXPECT_NE(prompt.find("Brand name: Example"), std::string::npos);
  EXPECT_NE(prompt.find("[0] text=\"Get Started\""), std::string::npos);
  EXPECT_NE(prompt.find("[1] text=\"Docs\""), std::string::npos);
  EXPECT_EQ(prompt.find("logo_selection"), std::string::npos);

  LogoCandidate logo;
  logo.src = "https://example.com/logo.png";
  request.logos.push_back(logo);
  prompt = SwatchLLMBrandClassifier::BuildPrompt(request);
  EXPECT_NE(prompt.find("logo_selection"), std::string::npos);
}

TEST(SwatchLLMBrandClassifierTest, MissingClientFails) {
  SwatchLLMBrandClassifier classifier(nullptr);
  ClassificationResult result = classifier.Classify(ClassificationRequest());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "No LLM client configured");
}

TEST(SwatchLLMBrandClassifierTest, ExtractJsonObject) {
  EXPECT_EQ(SwatchLLMBrandClassifier::ExtractJsonObject("x {\"a\": {\"b\": 1}} y"), "{\"a\": {\"b\": 1}}");
  EXPECT_EQ(SwatchLLMBrandClassifier::ExtractJsonObject("} {"), "");
}

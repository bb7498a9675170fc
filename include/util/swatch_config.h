#pragma once

#include <string>

// Chat completion endpoint used by the LLM brand classifier
struct SwatchLLMConfig {
  std::string endpoint = "http://localhost:8095";  // OpenAI-compatible server
  std::string model = "";                          // e.g. "gpt-4o-mini"
  std::string api_key = "";
  long timeout_ms = 30000;                         // whole request, connect included

  // Accepted timeout_ms range is (0, kMaxTimeoutMs]
  static constexpr long kMaxTimeoutMs = 600000;
};

/**
 * SwatchConfig - runtime settings for the branding pipeline.
 *
 * Sources, lowest priority first: compiled defaults, a JSON file, the
 * environment. Recognized environment variables:
 *   SWATCH_DEBUG_BRANDING (DEBUG_BRANDING)   keep debug payload, "true"/"1"
 *   SWATCH_CLASSIFIER_ENABLED                use the LLM classifier
 *   SWATCH_LLM_URL, SWATCH_LLM_MODEL, SWATCH_LLM_API_KEY, SWATCH_LLM_TIMEOUT_MS
 *   SWATCH_LOG_LEVEL                         debug | info | warn | error
 *   SWATCH_LOG_FILE                          append log records to this file
 *
 * JSON file layout:
 *   {"debug_branding": false, "classifier_enabled": true,
 *    "llm": {"endpoint": "...", "model": "...", "api_key": "...", "timeout_ms": 30000},
 *    "log_level": "info", "log_file": ""}
 */
struct SwatchConfig {
  bool debug_branding = false;
  bool classifier_enabled = false;
  SwatchLLMConfig llm;
  std::string log_level = "info";
  std::string log_file = "";

  // Overlay values from a JSON file. On failure returns false, sets error
  // and leaves the configuration unchanged.
  bool LoadFromJsonFile(const std::string& path, std::string& error);

  // Same as LoadFromJsonFile for an in-memory document
  bool LoadFromJson(const std::string& json_text, std::string& error);

  // Overlay values from environment variables
  void LoadFromEnvironment();

  // Point SwatchLogger at log_level and log_file
  void ApplyLogging() const;

  // "true", "1", "yes", "on" (any case)
  static bool ParseBool(const std::string& value);

  // Defaults, then the file when path is non-empty, then the environment.
  // A file error is logged and the file is ignored.
  static SwatchConfig Load(const std::string& path = "");
};

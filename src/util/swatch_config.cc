#include "util/swatch_config.h"
#include "collector/swatch_css_values.h"
#include "util/logger.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

bool ReadEnv(const char* name, std::string& out) {
  const char* value = std::getenv(name);
  if (!value) {
    return false;
  }
  out = value;
  return true;
}

}  // namespace

bool SwatchConfig::ParseBool(const std::string& value) {
  std::string v = SwatchCssValues::ToLower(SwatchCssValues::Trim(value));
  return v == "true" || v == "1" || v == "yes" || v == "on";
}

bool SwatchConfig::LoadFromJsonFile(const std::string& path, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "Cannot open config file: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return LoadFromJson(buffer.str(), error);
}

bool SwatchConfig::LoadFromJson(const std::string& json_text, std::string& error) {
  json root = json::parse(json_text, nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    error = "Config is not a JSON object";
    return false;
  }

  // Apply to a copy so a type error leaves *this untouched
  SwatchConfig updated = *this;
  try {
    if (root.contains("debug_branding")) {
      updated.debug_branding = root.at("debug_branding").get<bool>();
    }
    if (root.contains("classifier_enabled")) {
      updated.classifier_enabled = root.at("classifier_enabled").get<bool>();
    }
    if (root.contains("llm")) {
      const json& llm = root.at("llm");
      if (!llm.is_object()) {
        error = "'llm' must be an object";
        return false;
      }
      if (llm.contains("endpoint")) {
        updated.llm.endpoint = llm.at("endpoint").get<std::string>();
      }
      if (llm.contains("model")) {
        updated.llm.model = llm.at("model").get<std::string>();
      }
      if (llm.contains("api_key")) {
        updated.llm.api_key = llm.at("api_key").get<std::string>();
      }
      if (llm.contains("timeout_ms")) {
        double timeout = llm.at("timeout_ms").get<double>();
        if (!(timeout > 0 && timeout <= SwatchLLMConfig::kMaxTimeoutMs)) {
          error = "'llm.timeout_ms' must be in (0, " + std::to_string(SwatchLLMConfig::kMaxTimeoutMs) + "]";
          return false;
        }
        updated.llm.timeout_ms = static_cast<long>(timeout);
      }
    }
    if (root.contains("log_level")) {
      updated.log_level = root.at("log_level").get<std::string>();
    }
    if (root.contains("log_file")) {
      updated.log_file = root.at("log_file").get<std::string>();
    }
  } catch (const json::exception& e) {
    error = std::string("Invalid config value: ") + e.what();
    return false;
  }

  *this = updated;
  return true;
}

void SwatchConfig::LoadFromEnvironment() {
  std::string value;

  if (ReadEnv("DEBUG_BRANDING", value)) {
    debug_branding = ParseBool(value);
  }
  if (ReadEnv("SWATCH_DEBUG_BRANDING", value)) {
    debug_branding = ParseBool(value);
  }
  if (ReadEnv("SWATCH_CLASSIFIER_ENABLED", value)) {
    classifier_enabled = ParseBool(value);
  }
  if (ReadEnv("SWATCH_LLM_URL", value)) {
    llm.endpoint = value;
  }
  if (ReadEnv("SWATCH_LLM_MODEL", value)) {
    llm.model = value;
  }
  if (ReadEnv("SWATCH_LLM_API_KEY", value)) {
    llm.api_key = value;
  }
  if (ReadEnv("SWATCH_LLM_TIMEOUT_MS", value)) {
    double timeout = 0.0;
    if (SwatchCssValues::LeadingNumber(value, timeout) && timeout > 0 &&
        timeout <= SwatchLLMConfig::kMaxTimeoutMs) {
      llm.timeout_ms = static_cast<long>(timeout);
    } else {
      LOG_WARN("Config", "Ignoring SWATCH_LLM_TIMEOUT_MS=" + value);
    }
  }
  if (ReadEnv("SWATCH_LOG_LEVEL", value)) {
    log_level = value;
  }
  if (ReadEnv("SWATCH_LOG_FILE", value)) {
    log_file = value;
  }
}

void SwatchConfig::ApplyLogging() const {
  if (log_file.empty()) {
    SwatchLogger::Logger::Init();
  } else {
    SwatchLogger::Logger::Init(log_file);
  }
  SwatchLogger::Logger::SetLevel(SwatchLogger::Logger::ParseLevel(log_level));
}

SwatchConfig SwatchConfig::Load(const std::string& path) {
  SwatchConfig config;
  if (!path.empty()) {
    std::string error;
    if (!config.LoadFromJsonFile(path, error)) {
      LOG_WARN("Config", error + " - using defaults");
    }
  }
  config.LoadFromEnvironment();
  return config;
}

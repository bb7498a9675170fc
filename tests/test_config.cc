#include "util/swatch_config.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

namespace {

const char* const kEnvironment[] = {
  "DEBUG_BRANDING", "SWATCH_DEBUG_BRANDING", "SWATCH_CLASSIFIER_ENABLED", "SWATCH_LLM_URL",
  "SWATCH_LLM_MODEL", "SWATCH_LLM_API_KEY", "SWATCH_LLM_TIMEOUT_MS", "SWATCH_LOG_LEVEL", "SWATCH_LOG_FILE"
};

class SwatchConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnvironment(); }
  void TearDown() override {
    ClearEnvironment();
    if (!config_path_.empty()) {
      std::remove(config_path_.c_str());
    }
  }

  static void ClearEnvironment() {
    for (const char* name : kEnvironment) {
      unsetenv(name);
    }
  }

  std::string WriteConfig(const std::string& contents) {
    config_path_ = ::testing::TempDir() + "swatch_config_test.json";
    std::ofstream file(config_path_);
    file << contents;
    return config_path_;
  }

  std::string config_path_;
};

}  // namespace

TEST_F(SwatchConfigTest, Defaults) {
  SwatchConfig config = SwatchConfig::Load();
  EXPECT_FALSE(config.debug_branding);
  EXPECT_FALSE(config.classifier_enabled);
  EXPECT_EQ(config.llm.endpoint, "http://localhost:8095");
  EXPECT_EQ(config.llm.timeout_ms, 30000);
  EXPECT_EQ(config.log_level, "info");
}

TEST_F(SwatchConfigTest, FileOverridesDefaults) {
  std::string path = WriteConfig(R"({
    "classifier_enabled": true,
    "llm": {"endpoint": "https://llm.internal:9000", "model": "brand-small", "timeout_ms": 5000},
    "log_level": "debug"
  })");

  SwatchConfig config = SwatchConfig::Load(path);
  EXPECT_TRUE(config.classifier_enabled);
  EXPECT_EQ(config.llm.endpoint, "https://llm.internal:9000");
  EXPECT_EQ(config.llm.model, "brand-small");
  EXPECT_EQ(config.llm.timeout_ms, 5000);
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_FALSE(config.debug_branding);
}

TEST_F(SwatchConfigTest, EnvironmentOverridesFile) {
  std::string path = WriteConfig(R"({"debug_branding": false, "llm": {"model": "from-file", "timeout_ms": 5000}})");
  setenv("SWATCH_DEBUG_BRANDING", "true", 1);
  setenv("SWATCH_LLM_MODEL", "from-env", 1);
  setenv("SWATCH_LLM_TIMEOUT_MS", "12000", 1);

  SwatchConfig config = SwatchConfig::Load(path);
  EXPECT_TRUE(config.debug_branding);
  EXPECT_EQ(config.llm.model, "from-env");
  EXPECT_EQ(config.llm.timeout_ms, 12000);
}

TEST_F(SwatchConfigTest, LegacyDebugVariable) {
  setenv("DEBUG_BRANDING", "1", 1);
  EXPECT_TRUE(SwatchConfig::Load().debug_branding);

  setenv("SWATCH_DEBUG_BRANDING", "false", 1);
  EXPECT_FALSE(SwatchConfig::Load().debug_branding);
}

TEST_F(SwatchConfigTest, InvalidTimeoutIsIgnored) {
  setenv("SWATCH_LLM_TIMEOUT_MS", "soon", 1);
  EXPECT_EQ(SwatchConfig::Load().llm.timeout_ms, 30000);
}

TEST_F(SwatchConfigTest, OversizedTimeoutIsRejected) {
  setenv("SWATCH_LLM_TIMEOUT_MS", "1e30", 1);
  EXPECT_EQ(SwatchConfig::Load().llm.timeout_ms, 30000);

  setenv("SWATCH_LLM_TIMEOUT_MS", "600000", 1);
  EXPECT_EQ(SwatchConfig::Load().llm.timeout_ms, 600000);

  SwatchConfig config;
  std::string error;
  EXPECT_FALSE(config.LoadFromJson(R"({"llm": {"timeout_ms": 1e30}})", error));
  EXPECT_EQ(error, "'llm.timeout_ms' must be in (0, 600000]");
  EXPECT_FALSE(config.LoadFromJson(R"({"llm": {"timeout_ms": -5}})", error));
  EXPECT_EQ(config.llm.timeout_ms, 30000);
}

TEST_F(SwatchConfigTest, BadDocumentsLeaveConfigUnchanged) {
  SwatchConfig config;
  std::string error;

  EXPECT_FALSE(config.LoadFromJson("[]", error));
  EXPECT_EQ(error, "Config is not a JSON object");

  EXPECT_FALSE(config.LoadFromJson(R"({"classifier_enabled": true, "log_level": 3})", error));
  EXPECT_FALSE(config.classifier_enabled);
  EXPECT_EQ(config.log_level, "info");

  EXPECT_FALSE(config.LoadFromJson(R"({"llm": "http://x"})", error));
  EXPECT_EQ(error, "'llm' must be an object");

  EXPECT_FALSE(config.LoadFromJsonFile("/nonexistent/swatch.json", error));
  EXPECT_EQ(error, "Cannot open config file: /nonexistent/swatch.json");
}

TEST_F(SwatchConfigTest, ParseBool) {
  EXPECT_TRUE(SwatchConfig::ParseBool("TRUE"));
  EXPECT_TRUE(SwatchConfig::ParseBool(" yes "));
  EXPECT_TRUE(SwatchConfig::ParseBool("on"));
  EXPECT_TRUE(SwatchConfig::ParseBool("1"));
  EXPECT_FALSE(SwatchConfig::ParseBool("0"));
  EXPECT_FALSE(SwatchConfig::ParseBool(""));
  EXPECT_FALSE(SwatchConfig::ParseBool("enabled"));
}

#ifndef SWATCH_LLM_CLIENT_H_
#define SWATCH_LLM_CLIENT_H_

#include <string>
#include <vector>

// OpenAI-compatible chat client over libcurl
// Uses the /v1/chat/completions endpoint; supports vision models through
// multimodal messages (text + image)
class SwatchLLMClient {
 public:
  // Content part for multimodal messages (vision support)
  struct ContentPart {
    std::string type;  // "text" or "image_url"
    std::string text;  // For type="text"
    struct ImageURL {
      std::string url;  // Base64 data URL or HTTP(S) URL
    } image_url;  // For type="image_url"
  };

  struct Message {
    std::string role;     // "system", "user", "assistant"
    std::string content;  // Simple text content
    std::vector<ContentPart> content_parts;  // Multimodal content (vision)
    bool is_multimodal = false;  // Set to true when using content_parts
  };

  struct CompletionRequest {
    std::vector<Message> messages;
    int max_tokens = 1024;
    float temperature = 0.1f;
    float top_p = 0.9f;
    bool json_response = false;  // Ask for response_format json_object
  };

  struct CompletionResponse {
    std::string content;
    int tokens_generated = 0;
    int tokens_prompt = 0;
    bool success = false;
    std::string error;
    double latency_ms = 0.0;  // Response time in milliseconds
  };

  SwatchLLMClient(const std::string& server_url, long timeout_ms = 30000);

  // Set API key for external APIs (OpenAI, etc.)
  void SetApiKey(const std::string& api_key) { api_key_ = api_key; }

  // Set model name (e.g., "gpt-4o", "gpt-4o-mini")
  void SetModel(const std::string& model) { model_name_ = model; }

  // Make chat completion request (OpenAI-compatible)
  CompletionResponse ChatComplete(const CompletionRequest& request);

  // Helper: completion with system + user prompt, plus a PNG screenshot
  // when image_base64 is non-empty
  CompletionResponse Complete(const std::string& prompt,
                              const std::string& system_prompt,
                              const std::string& image_base64 = "",
                              bool json_response = false);

  std::string GetEndpointURL() const;

  // Remove <think></think> blocks some reasoning models always emit
  static std::string CleanThinkingTags(const std::string& text);

  // Build OpenAI-compatible JSON payload
  std::string BuildOpenAIPayload(const CompletionRequest& request) const;

  // Parse OpenAI-compatible JSON response
  static bool ParseOpenAIResponse(const std::string& json_str, CompletionResponse& response);

 private:
  std::string server_url_;
  std::string api_key_;      // API key for external services
  std::string model_name_;   // Model name (e.g., "gpt-4o-mini")
  long timeout_ms_;
  bool is_external_api_;     // External APIs reject local sampling parameters
};

#endif  // SWATCH_LLM_CLIENT_H_

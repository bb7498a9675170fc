#include "ai/swatch_llm_client.h"
#include "util/logger.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <regex>

using json = nlohmann::json;

// Callback for curl to write response data
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  ((std::string*)userp)->append((char*)contents, size * nmemb);
  return size * nmemb;
}

SwatchLLMClient::SwatchLLMClient(const std::string& server_url, long timeout_ms)
    : server_url_(server_url),
      timeout_ms_(timeout_ms),
      is_external_api_(false) {
  // Anything that is not on this machine is treated as an external API
  if (server_url.find("localhost") == std::string::npos &&
      server_url.find("127.0.0.1") == std::string::npos &&
      server_url.find("0.0.0.0") == std::string::npos) {
    is_external_api_ = true;
    LOG_DEBUG("LLMClient", "Detected external API from URL: " + server_url);
  }

  LOG_DEBUG("LLMClient", "Initialized for server: " + server_url);
}

std::string SwatchLLMClient::CleanThinkingTags(const std::string& text) {
  if (text.empty()) {
    return text;
  }

  // Non-greedy so several blocks are removed independently
  static const std::regex think_regex(R"(<think>[\s\S]*?</think>)");
  std::string result = std::regex_replace(text, think_regex, "");

  size_t start = result.find_first_not_of(" \t\n\r");
  size_t end = result.find_last_not_of(" \t\n\r");
  if (start == std::string::npos) {
    return "";
  }
  return result.substr(start, end - start + 1);
}

std::string SwatchLLMClient::BuildOpenAIPayload(const CompletionRequest& request) const {
  json payload;

  json messages = json::array();
  for (const auto& message : request.messages) {
    json msg;
    msg["role"] = message.role;

    if (message.is_multimodal && !message.content_parts.empty()) {
      json content = json::array();
      for (const auto& part : message.content_parts) {
        json part_json;
        part_json["type"] = part.type;
        if (part.type == "text") {
          part_json["text"] = part.text;
        } else if (part.type == "image_url") {
          part_json["image_url"] = {{"url", part.image_url.url}};
        }
        content.push_back(part_json);
      }
      msg["content"] = content;
    } else {
      msg["content"] = message.content;
    }
    messages.push_back(msg);
  }
  payload["messages"] = messages;

  // Required by external APIs like OpenAI
  if (!model_name_.empty()) {
    payload["model"] = model_name_;
  }

  payload["max_tokens"] = request.max_tokens;
  payload["temperature"] = request.temperature;
  // OpenAI rejects top_p together with temperature for some models
  if (!is_external_api_) {
    payload["top_p"] = request.top_p;
  }
  if (request.json_response) {
    payload["response_format"] = {{"type", "json_object"}};
  }
  payload["stream"] = false;

  return payload.dump();
}

bool SwatchLLMClient::ParseOpenAIResponse(const std::string& json_str, CompletionResponse& response) {
  // Response format: {"choices": [{"message": {"content": "..."}}], "usage": {...}}
  json dict = json::parse(json_str, nullptr, false);
  if (dict.is_discarded() || !dict.is_object()) {
    response.error = "Failed to parse JSON response";
    LOG_ERROR("LLMClient", "Invalid JSON response");
    return false;
  }

  auto choices = dict.find("choices");
  if (choices != dict.end() && choices->is_array() && !choices->empty()) {
    const json& choice = (*choices)[0];
    if (choice.is_object() && choice.contains("message") && choice["message"].is_object()) {
      const json& message = choice["message"];
      auto content = message.find("content");
      if (content != message.end() && content->is_string()) {
        response.content = CleanThinkingTags(content->get<std::string>());
        response.success = true;
      }
    }
  }

  auto usage = dict.find("usage");
  if (usage != dict.end() && usage->is_object()) {
    auto completion = usage->find("completion_tokens");
    if (completion != usage->end() && completion->is_number_integer()) {
      response.tokens_generated = completion->get<int>();
    }
    auto prompt = usage->find("prompt_tokens");
    if (prompt != usage->end() && prompt->is_number_integer()) {
      response.tokens_prompt = prompt->get<int>();
    }
  }

  if (!response.success) {
    response.error = "No content in response";
    return false;
  }
  return true;
}

std::string SwatchLLMClient::GetEndpointURL() const {
  // Only append /v1/chat/completions if not already present
  std::string url = server_url_;
  if (url.find("/v1/chat/completions") == std::string::npos) {
    if (!url.empty() && url.back() == '/') {
      url.pop_back();
    }
    url += "/v1/chat/completions";
  }
  return url;
}

SwatchLLMClient::CompletionResponse SwatchLLMClient::ChatComplete(const CompletionRequest& request) {
  CompletionResponse response;
  auto start_time = std::chrono::high_resolution_clock::now();

  CURL* curl = curl_easy_init();
  if (!curl) {
    response.error = "Failed to initialize CURL";
    LOG_ERROR("LLMClient", response.error);
    return response;
  }

  std::string payload_json = BuildOpenAIPayload(request);
  std::string response_str;
  std::string url = GetEndpointURL();

  LOG_DEBUG("LLMClient", "Request URL: " + url);
  LOG_DEBUG("LLMClient", "Model: " + model_name_);

  struct curl_slist* headers = NULL;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  if (!api_key_.empty()) {
    std::string auth_header = "Authorization: Bearer " + api_key_;
    headers = curl_slist_append(headers, auth_header.c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload_json.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_str);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);  // 5 second connect timeout
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Thread-safe
  curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

  CURLcode res = curl_easy_perform(curl);

  auto end_time = std::chrono::high_resolution_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
  response.latency_ms = duration.count();

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    response.error = "HTTP request failed: " + std::string(curl_easy_strerror(res));
    LOG_ERROR("LLMClient", response.error);
    return response;
  }

  if (http_code != 200) {
    response.error = "HTTP error " + std::to_string(http_code);
    LOG_ERROR("LLMClient", response.error);
    LOG_ERROR("LLMClient", "Response: " + response_str.substr(0, 200));
    return response;
  }

  if (!ParseOpenAIResponse(response_str, response)) {
    LOG_ERROR("LLMClient", "Failed to parse response");
    return response;
  }

  LOG_DEBUG("LLMClient", "Completion successful - " +
            std::to_string(response.tokens_generated) + " tokens in " +
            std::to_string(response.latency_ms) + "ms");
  return response;
}

SwatchLLMClient::CompletionResponse SwatchLLMClient::Complete(
    const std::string& prompt,
    const std::string& system_prompt,
    const std::string& image_base64,
    bool json_response) {
  CompletionRequest request;
  request.json_response = json_response;

  Message sys_msg;
  sys_msg.role = "system";
  sys_msg.content = system_prompt;
  request.messages.push_back(sys_msg);

  Message user_msg;
  user_msg.role = "user";
  if (image_base64.empty()) {
    user_msg.content = prompt;
  } else {
    user_msg.is_multimodal = true;

    ContentPart text_part;
    text_part.type = "text";
    text_part.text = prompt;
    user_msg.content_parts.push_back(text_part);

    ContentPart image_part;
    image_part.type = "image_url";
    image_part.image_url.url = "data:image/png;base64," + image_base64;
    user_msg.content_parts.push_back(image_part);

    LOG_DEBUG("LLMClient", "Sending vision request with image (" +
              std::to_string(image_base64.length()) + " bytes base64)");
  }
  request.messages.push_back(user_msg);

  return ChatComplete(request);
}

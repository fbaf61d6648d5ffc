#include "openai_generator.hpp"
#include "../http.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace engram {

OpenAIGenerator::OpenAIGenerator(const std::string& api_key, HttpClient& http,
                                 const std::string& model,
                                 const std::string& base_url,
                                 double temperature,
                                 uint32_t max_tokens,
                                 uint32_t timeout_seconds)
    : api_key_(api_key), http_(http), model_(model),
      base_url_(base_url.empty() ? "https://api.openai.com/v1" : base_url),
      temperature_(temperature), max_tokens_(max_tokens),
      timeout_seconds_(timeout_seconds) {}

json OpenAIGenerator::build_request(const json& messages,
                                    double temperature,
                                    uint32_t max_tokens,
                                    bool json_mode) const {
    json request;
    request["model"] = model_;
    request["messages"] = messages;
    request["temperature"] = temperature;
    request["max_tokens"] = max_tokens;
    if (json_mode) {
        request["response_format"] = {{"type", "json_object"}};
    }
    return request;
}

std::string OpenAIGenerator::complete(const json& request) {
    std::vector<Header> headers = {
        {"Authorization", "Bearer " + api_key_},
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(base_url_ + "/chat/completions", request.dump(),
                               headers, static_cast<long>(timeout_seconds_));

    if (response.status_code == 0) {
        throw std::runtime_error(generator_name() + " request failed: no response");
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw std::runtime_error(generator_name() + " API error (HTTP " +
                                 std::to_string(response.status_code) + "): " + response.body);
    }

    json j = json::parse(response.body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        throw std::runtime_error(generator_name() + " returned malformed JSON");
    }
    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        throw std::runtime_error(generator_name() + " response has no choices");
    }
    const auto& message = j["choices"][0].value("message", json::object());
    if (message.contains("content") && message["content"].is_string()) {
        return message["content"].get<std::string>();
    }
    return "";
}

std::string OpenAIGenerator::generate(const std::string& prompt,
                                      const std::string& system_prompt,
                                      std::optional<double> temperature,
                                      std::optional<uint32_t> max_tokens) {
    json messages = json::array();
    if (!system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", system_prompt}});
    }
    messages.push_back({{"role", "user"}, {"content", prompt}});

    return complete(build_request(messages, temperature.value_or(temperature_),
                                  max_tokens.value_or(max_tokens_), false));
}

json OpenAIGenerator::generate_json(const std::string& prompt,
                                    const std::string& system_prompt,
                                    std::optional<double> temperature) {
    json messages = json::array();
    messages.push_back({{"role", "system"}, {"content", system_prompt + kJsonOnlyInstruction}});
    messages.push_back({{"role", "user"}, {"content", prompt}});

    std::string reply = complete(build_request(messages, temperature.value_or(kJsonTemperature),
                                               max_tokens_, true));
    return parse_json_reply(reply);
}

std::string OpenAIGenerator::generate_with_history(const std::vector<ConversationMessage>& history,
                                                   const std::string& system_prompt) {
    json messages = json::array();
    if (!system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", system_prompt}});
    }
    for (const auto& msg : history) {
        messages.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    return complete(build_request(messages, temperature_, max_tokens_, false));
}

} // namespace engram

#pragma once
#include "../generator.hpp"
#include <nlohmann/json.hpp>

namespace engram {

// OpenAI-compatible /chat/completions client
class OpenAIGenerator : public Generator {
public:
    OpenAIGenerator(const std::string& api_key, HttpClient& http,
                    const std::string& model,
                    const std::string& base_url = "",
                    double temperature = 0.7,
                    uint32_t max_tokens = 2048,
                    uint32_t timeout_seconds = 120);

    std::string generate(const std::string& prompt,
                         const std::string& system_prompt,
                         std::optional<double> temperature = std::nullopt,
                         std::optional<uint32_t> max_tokens = std::nullopt) override;

    nlohmann::json generate_json(const std::string& prompt,
                                 const std::string& system_prompt,
                                 std::optional<double> temperature = std::nullopt) override;

    std::string generate_with_history(const std::vector<ConversationMessage>& messages,
                                      const std::string& system_prompt) override;

    std::string generator_name() const override { return "openai"; }

    // Exposed for testing
    nlohmann::json build_request(const nlohmann::json& messages,
                                 double temperature,
                                 uint32_t max_tokens,
                                 bool json_mode) const;

private:
    std::string complete(const nlohmann::json& request);

    std::string api_key_;
    HttpClient& http_;
    std::string model_;
    std::string base_url_;
    double temperature_;
    uint32_t max_tokens_;
    uint32_t timeout_seconds_;
};

} // namespace engram

#include "generator.hpp"
#include "generators/openai_generator.hpp"
#include "generators/reliable_generator.hpp"
#include "config.hpp"
#include "util.hpp"
#include <stdexcept>

namespace engram {

const char* const kJsonOnlyInstruction =
    "\n\nRespond with a single valid JSON object only. "
    "Do not add explanations or Markdown formatting.";

nlohmann::json Generator::generate_json(const std::string& prompt,
                                        const std::string& system_prompt,
                                        std::optional<double> temperature) {
    std::string reply = generate(prompt, system_prompt + kJsonOnlyInstruction,
                                 temperature.value_or(kJsonTemperature));
    return parse_json_reply(reply);
}

static std::optional<nlohmann::json> try_parse_object(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    return j;
}

nlohmann::json parse_json_reply(const std::string& text) {
    std::string body = trim(text);
    if (auto j = try_parse_object(body)) return *j;

    // ```json ... ``` or ``` ... ```
    size_t fence = body.find("```");
    if (fence != std::string::npos) {
        size_t start = body.find('\n', fence);
        size_t end = start == std::string::npos ? std::string::npos
                                                : body.find("```", start);
        if (end != std::string::npos) {
            if (auto j = try_parse_object(body.substr(start + 1, end - start - 1))) return *j;
        }
    }

    size_t open = body.find('{');
    size_t close = body.rfind('}');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        if (auto j = try_parse_object(body.substr(open, close - open + 1))) return *j;
    }

    return nlohmann::json::object();
}

std::unique_ptr<Generator> create_generator(const Config& config, HttpClient& http) {
    const auto& llm = config.llm;
    if (llm.provider != "openai" && llm.provider != "compatible") {
        throw std::invalid_argument("Unknown generation provider: " + llm.provider);
    }

    std::vector<std::unique_ptr<Generator>> generators;
    generators.push_back(std::make_unique<OpenAIGenerator>(
        llm.api_key, http, llm.model, llm.base_url,
        llm.temperature, llm.max_tokens, llm.timeout_seconds));
    return std::make_unique<ReliableGenerator>(std::move(generators), llm.max_retries);
}

} // namespace engram

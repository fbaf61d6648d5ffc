#pragma once
#include "models.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace engram {

class HttpClient; // forward declaration
struct Config;

// Abstract text-generation capability backed by a language model.
// Implementations throw std::runtime_error on transport or API failure.
class Generator {
public:
    virtual ~Generator() = default;

    virtual std::string generate(const std::string& prompt,
                                 const std::string& system_prompt,
                                 std::optional<double> temperature = std::nullopt,
                                 std::optional<uint32_t> max_tokens = std::nullopt) = 0;

    // Structured reply. The default asks generate() for JSON and runs the
    // reply through parse_json_reply().
    virtual nlohmann::json generate_json(const std::string& prompt,
                                         const std::string& system_prompt,
                                         std::optional<double> temperature = std::nullopt);

    virtual std::string generate_with_history(const std::vector<ConversationMessage>& messages,
                                              const std::string& system_prompt) = 0;

    virtual std::string generator_name() const = 0;
};

// Appended to the system prompt of every generate_json() call
extern const char* const kJsonOnlyInstruction;

// Default temperature for generate_json()
constexpr double kJsonTemperature = 0.3;

// Recover a JSON object from model output: plain JSON, a fenced code block,
// or the outermost {...} span. Returns an empty object when nothing parses.
nlohmann::json parse_json_reply(const std::string& text);

// Factory: build the configured generator wrapped with retry/fallback
std::unique_ptr<Generator> create_generator(const Config& config, HttpClient& http);

} // namespace engram

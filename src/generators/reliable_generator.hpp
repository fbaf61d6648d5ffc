#pragma once
#include "../generator.hpp"
#include <string>
#include <vector>
#include <memory>
#include <utility>

namespace engram {

// Wraps multiple generators with retry/fallback logic
class ReliableGenerator : public Generator {
public:
    explicit ReliableGenerator(std::vector<std::unique_ptr<Generator>> generators,
                               uint32_t max_retries = 3);

    std::string generate(const std::string& prompt,
                         const std::string& system_prompt,
                         std::optional<double> temperature = std::nullopt,
                         std::optional<uint32_t> max_tokens = std::nullopt) override;

    nlohmann::json generate_json(const std::string& prompt,
                                 const std::string& system_prompt,
                                 std::optional<double> temperature = std::nullopt) override;

    std::string generate_with_history(const std::vector<ConversationMessage>& messages,
                                      const std::string& system_prompt) override;

    std::string generator_name() const override { return "reliable"; }

private:
    template <typename Call>
    auto with_retries(Call&& call) -> decltype(call(std::declval<Generator&>()));

    std::vector<std::unique_ptr<Generator>> generators_;
    uint32_t max_retries_;
};

} // namespace engram

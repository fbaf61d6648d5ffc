#include "reliable_generator.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace engram {

ReliableGenerator::ReliableGenerator(std::vector<std::unique_ptr<Generator>> generators,
                                     uint32_t max_retries)
    : generators_(std::move(generators)), max_retries_(max_retries) {
    if (generators_.empty()) {
        throw std::invalid_argument("ReliableGenerator requires at least one generator");
    }
    if (max_retries_ == 0) max_retries_ = 1;
}

template <typename Call>
auto ReliableGenerator::with_retries(Call&& call) -> decltype(call(std::declval<Generator&>())) {
    std::string last_error;
    for (auto& generator : generators_) {
        for (uint32_t retry = 0; retry < max_retries_; ++retry) {
            try {
                return call(*generator);
            } catch (const std::exception& e) {
                last_error = e.what();
                std::cerr << "[reliable] Generator " << generator->generator_name()
                          << " attempt " << (retry + 1) << "/" << max_retries_
                          << " failed: " << last_error << '\n';
            }
        }
    }
    throw std::runtime_error("All generators failed. Last error: " + last_error);
}

std::string ReliableGenerator::generate(const std::string& prompt,
                                        const std::string& system_prompt,
                                        std::optional<double> temperature,
                                        std::optional<uint32_t> max_tokens) {
    return with_retries([&](Generator& g) {
        return g.generate(prompt, system_prompt, temperature, max_tokens);
    });
}

nlohmann::json ReliableGenerator::generate_json(const std::string& prompt,
                                                const std::string& system_prompt,
                                                std::optional<double> temperature) {
    return with_retries([&](Generator& g) {
        return g.generate_json(prompt, system_prompt, temperature);
    });
}

std::string ReliableGenerator::generate_with_history(const std::vector<ConversationMessage>& messages,
                                                     const std::string& system_prompt) {
    return with_retries([&](Generator& g) {
        return g.generate_with_history(messages, system_prompt);
    });
}

} // namespace engram

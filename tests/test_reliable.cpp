#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "generators/reliable_generator.hpp"
#include <stdexcept>

using namespace engram;
using Catch::Matchers::ContainsSubstring;

// ── Mock generator for testing retry logic ───────────────────────

class FlakyGenerator : public Generator {
public:
    int fail_count;     // how many calls should throw before succeeding
    int call_count = 0;
    std::string name;

    FlakyGenerator(const std::string& name, int fail_count)
        : fail_count(fail_count), name(name) {}

    std::string generate(const std::string&, const std::string&,
                         std::optional<double>, std::optional<uint32_t>) override {
        call_count++;
        if (call_count <= fail_count) {
            throw std::runtime_error(name + " failed attempt " + std::to_string(call_count));
        }
        return "response from " + name;
    }

    nlohmann::json generate_json(const std::string&, const std::string&,
                                 std::optional<double>) override {
        call_count++;
        if (call_count <= fail_count) {
            throw std::runtime_error(name + " json failed");
        }
        return {{"from", name}};
    }

    std::string generate_with_history(const std::vector<ConversationMessage>&,
                                      const std::string&) override {
        call_count++;
        if (call_count <= fail_count) {
            throw std::runtime_error(name + " history failed");
        }
        return "history from " + name;
    }

    std::string generator_name() const override { return name; }
};

// ── Constructor ──────────────────────────────────────────────────

TEST_CASE("ReliableGenerator: requires at least one generator", "[reliable]") {
    std::vector<std::unique_ptr<Generator>> empty;
    REQUIRE_THROWS_AS(ReliableGenerator(std::move(empty)), std::invalid_argument);
}

// ── Success paths ────────────────────────────────────────────────

TEST_CASE("ReliableGenerator: succeeds on first try", "[reliable]") {
    std::vector<std::unique_ptr<Generator>> gens;
    auto* raw = new FlakyGenerator("primary", 0);
    gens.emplace_back(raw);
    ReliableGenerator reliable(std::move(gens));

    REQUIRE(reliable.generate("p", "s") == "response from primary");
    REQUIRE(raw->call_count == 1);
}

TEST_CASE("ReliableGenerator: retries then succeeds", "[reliable]") {
    std::vector<std::unique_ptr<Generator>> gens;
    auto* raw = new FlakyGenerator("primary", 2);
    gens.emplace_back(raw);
    ReliableGenerator reliable(std::move(gens), 3);

    REQUIRE(reliable.generate_with_history({}, "s") == "history from primary");
    REQUIRE(raw->call_count == 3);
}

TEST_CASE("ReliableGenerator: falls back to next generator", "[reliable]") {
    std::vector<std::unique_ptr<Generator>> gens;
    auto* primary = new FlakyGenerator("primary", 100);
    auto* backup = new FlakyGenerator("backup", 0);
    gens.emplace_back(primary);
    gens.emplace_back(backup);
    ReliableGenerator reliable(std::move(gens), 2);

    auto j = reliable.generate_json("p", "s");
    REQUIRE(j["from"] == "backup");
    REQUIRE(primary->call_count == 2);
    REQUIRE(backup->call_count == 1);
}

// ── Failure ──────────────────────────────────────────────────────

TEST_CASE("ReliableGenerator: all failing throws last error", "[reliable]") {
    std::vector<std::unique_ptr<Generator>> gens;
    gens.push_back(std::make_unique<FlakyGenerator>("a", 100));
    gens.push_back(std::make_unique<FlakyGenerator>("b", 100));
    ReliableGenerator reliable(std::move(gens), 2);

    REQUIRE_THROWS_WITH(reliable.generate("p", "s"),
                        ContainsSubstring("All generators failed") &&
                        ContainsSubstring("b failed attempt 2"));
}

TEST_CASE("ReliableGenerator: zero retries still tries once", "[reliable]") {
    std::vector<std::unique_ptr<Generator>> gens;
    auto* raw = new FlakyGenerator("only", 0);
    gens.emplace_back(raw);
    ReliableGenerator reliable(std::move(gens), 0);

    REQUIRE(reliable.generate("p", "s") == "response from only");
    REQUIRE(raw->call_count == 1);
}

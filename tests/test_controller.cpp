#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "controller.hpp"
#include "memory_json.hpp"
#include "prompt.hpp"
#include "storage/memory_session_store.hpp"
#include "mock_services.hpp"

using namespace engram;
using json = nlohmann::json;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

class StaticProfile : public ProfileSource {
public:
    std::string text = "Enjoys hiking on weekends";
    bool fail = false;

    std::string profile_snapshot(const std::string& user_id) override {
        if (fail) throw std::runtime_error("profile backend down");
        return text + " (" + user_id + ")";
    }
};

struct ControllerFixture {
    SqliteStores stores{"controller"};
    InMemorySessionStore sessions;
    MockGenerator generator;
    KeywordEmbedder embedder{{"jazz", "coffee", "hiking"}};
    StaticProfile profile;
    MemoryConfig config;
    std::unique_ptr<Controller> controller;

    ControllerFixture() {
        config.extraction_window_size = 4;
        config.extraction_overlap = 1;
        // Extraction carries a system prompt, intent analysis does not
        generator.json_handler = [](const std::string&, const std::string& system) {
            if (system.empty()) return json::object();
            return json{{"episodic_memories", json::array({
                {{"lossless_restatement", "The user likes jazz"},
                 {"keywords", {"jazz"}},
                 {"importance", 0.7},
                 {"confidence", 0.9}}
            })}};
        };
    }

    Controller& make(ProfileSource* source = nullptr) {
        controller = std::make_unique<Controller>(sessions, generator, embedder,
                                                  *stores.vectors, *stores.documents,
                                                  *stores.graph, config, source);
        return *controller;
    }

    uint32_t episodic_count(const std::string& user) {
        return stores.documents->count(kEpisodicCollection, {{"user_id", user}});
    }
};

} // namespace

TEST_CASE("Controller: new conversation gets a session id", "[controller]") {
    ControllerFixture f;
    f.generator.text_replies = {"Hello there!"};
    auto reply = f.make().chat("u1", "hi");

    REQUIRE(reply.reply == "Hello there!");
    REQUIRE_THAT(reply.session_id, StartsWith("sess_"));

    auto session = f.sessions.get(reply.session_id);
    REQUIRE(session.has_value());
    REQUIRE(session->user_id == "u1");
    REQUIRE(session->messages.size() == 2);
    REQUIRE(session->messages[0].role == Role::User);
    REQUIRE(session->messages[0].content == "hi");
    REQUIRE(session->messages[1].role == Role::Assistant);
    REQUIRE(session->messages[1].content == "Hello there!");
}

TEST_CASE("Controller: caller-supplied session id is used", "[controller]") {
    ControllerFixture f;
    auto reply = f.make().chat("u1", "hi", "my-session");
    REQUIRE(reply.session_id == "my-session");
    REQUIRE(f.sessions.get("my-session").has_value());
}

TEST_CASE("Controller: history carries earlier turns", "[controller]") {
    ControllerFixture f;
    f.generator.text_replies = {"first answer", "second answer"};
    auto& controller = f.make();

    auto first = controller.chat("u1", "first question");
    controller.chat("u1", "second question", first.session_id);

    const auto& history = f.generator.histories.back();
    REQUIRE(history.size() == 3);
    REQUIRE(history[0].content == "first question");
    REQUIRE(history[1].content == "first answer");
    REQUIRE(history[1].role == Role::Assistant);
    REQUIRE(history[2].content == "second question");
}

TEST_CASE("Controller: history is limited to recent messages", "[controller]") {
    ControllerFixture f;
    f.config.history_messages = 2;
    auto& controller = f.make();

    auto first = controller.chat("u1", "one");
    controller.chat("u1", "two", first.session_id);

    const auto& history = f.generator.histories.back();
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].role == Role::Assistant);
    REQUIRE(history[1].content == "two");
}

TEST_CASE("Controller: generation failure gives the apology reply", "[controller]") {
    ControllerFixture f;
    f.generator.fail_text = true;
    auto reply = f.make().chat("u1", "are you there?");

    REQUIRE(reply.reply == kApologyReply);
    auto session = f.sessions.get(reply.session_id);
    REQUIRE(session->messages.back().content == kApologyReply);
}

TEST_CASE("Controller: profile text goes into the system prompt", "[controller]") {
    ControllerFixture f;
    auto& controller = f.make(&f.profile);

    controller.chat("u1", "hello");
    REQUIRE_THAT(f.generator.last_system_prompt, StartsWith(default_system_prompt().substr(0, 30)));
    REQUIRE_THAT(f.generator.last_system_prompt,
                 ContainsSubstring("## About the user\nEnjoys hiking on weekends (u1)"));

    ChatOptions no_profile;
    no_profile.include_profile = false;
    controller.chat("u1", "hello again", "", no_profile);
    REQUIRE_THAT(f.generator.last_system_prompt, !ContainsSubstring("## About the user"));
}

TEST_CASE("Controller: profile failure does not block the reply", "[controller]") {
    ControllerFixture f;
    f.profile.fail = true;
    f.generator.text_replies = {"still here"};
    auto reply = f.make(&f.profile).chat("u1", "hello");
    REQUIRE(reply.reply == "still here");
    REQUIRE_THAT(f.generator.last_system_prompt, !ContainsSubstring("## About the user"));
}

TEST_CASE("Controller: memory retrieval can be switched off", "[controller]") {
    ControllerFixture f;
    ChatOptions opts;
    opts.include_memory = false;
    auto reply = f.make().chat("u1", "hello", "", opts);

    REQUIRE(reply.memories_used == 0);
    // No intent analysis ran
    REQUIRE(f.generator.json_call_count() == 0);
    REQUIRE_THAT(f.generator.last_system_prompt, !ContainsSubstring("## Related memories"));
}

TEST_CASE("Controller: extraction starts once the window is full", "[controller]") {
    ControllerFixture f;
    auto& controller = f.make();

    auto first = controller.chat("u1", "I went to a jazz club");
    controller.wait_for_extractions();
    REQUIRE(f.episodic_count("u1") == 0);

    controller.chat("u1", "The band was great", first.session_id);
    controller.wait_for_extractions();
    REQUIRE(f.episodic_count("u1") == 1);

    auto stored = f.stores.documents->find(kEpisodicCollection, {{"user_id", "u1"}});
    REQUIRE(stored[0]["source_session_id"] == first.session_id);
    REQUIRE(stored[0]["agent_id"] == "default");
}

TEST_CASE("Controller: extracted memories feed later replies", "[controller]") {
    ControllerFixture f;
    auto& controller = f.make();

    auto first = controller.chat("u1", "I went to a jazz club");
    controller.chat("u1", "The band was great", first.session_id);
    controller.wait_for_extractions();

    auto reply = controller.chat("u1", "any jazz plans?");
    REQUIRE(reply.memories_used >= 1);
    REQUIRE(reply.retrieval.episodic_memories.front().content == "The user likes jazz");
    REQUIRE_THAT(f.generator.last_system_prompt, ContainsSubstring("## Related memories"));
    REQUIRE_THAT(f.generator.last_system_prompt, ContainsSubstring("The user likes jazz"));

    // Memories stay with their owner
    auto other = controller.chat("u2", "any jazz plans?");
    REQUIRE(other.memories_used == 0);
}

TEST_CASE("Controller: forget archives low-value memories", "[controller]") {
    ControllerFixture f;
    EpisodicMemory m;
    m.id = "weak";
    m.user_id = "u1";
    m.summary = "coffee once";
    m.lossless_restatement = "coffee once";
    m.importance = 0.05;
    m.created_at = epoch_seconds();
    f.stores.documents->insert(kEpisodicCollection, episodic_to_json(m));

    ForgettingConfig fc;
    fc.importance_threshold = 0.3;
    auto result = f.make().forget("u1", fc);
    REQUIRE(result.total_scanned == 1);
    REQUIRE(result.memories_archived == 1);
    REQUIRE(f.stores.documents->find_by_id(kEpisodicCollection, "weak")->value("is_archived", false));
}

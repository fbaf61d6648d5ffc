#include <catch2/catch_test_macros.hpp>
#include "memory_json.hpp"

using namespace engram;

TEST_CASE("episodic_to_json: optional fields serialize as null", "[models]") {
    EpisodicMemory m;
    m.id = "mem_ep_1";
    m.user_id = "u1";
    auto j = episodic_to_json(m);
    REQUIRE(j["location"].is_null());
    REQUIRE(j["last_accessed_at"].is_null());
    REQUIRE(j["is_archived"] == false);
    REQUIRE(j["keywords"].is_array());
}

TEST_CASE("episodic_from_json: restores every field", "[models]") {
    EpisodicMemory m;
    m.id = "mem_ep_2";
    m.user_id = "u1";
    m.summary = "Drove to the office";
    m.lossless_restatement = "On Monday the user drove to the office in Shanghai.";
    m.keywords = {"office", "drive"};
    m.event_type = "navigation";
    m.participants = {"Alice"};
    m.location = "Shanghai";
    m.importance = 0.7;
    m.access_count = 3;
    m.last_accessed_at = 1700000000;
    m.merged_from = {"mem_ep_0"};
    m.created_at = 1690000000;

    auto back = episodic_from_json(episodic_to_json(m));
    REQUIRE(back.id == m.id);
    REQUIRE(back.summary == m.summary);
    REQUIRE(back.keywords == m.keywords);
    REQUIRE(back.participants == m.participants);
    REQUIRE(back.location == m.location);
    REQUIRE(back.importance == m.importance);
    REQUIRE(back.access_count == 3);
    REQUIRE(back.last_accessed_at == m.last_accessed_at);
    REQUIRE(back.merged_from == m.merged_from);
    REQUIRE(back.created_at == m.created_at);
}

TEST_CASE("episodic_from_json: missing fields take defaults", "[models]") {
    auto m = episodic_from_json(nlohmann::json{{"id", "x"}});
    REQUIRE(m.agent_id == "default");
    REQUIRE(m.event_type == "general_conversation");
    REQUIRE(m.importance == 0.5);
    REQUIRE_FALSE(m.location.has_value());
}

TEST_CASE("semantic_from_json: reads triple", "[models]") {
    nlohmann::json j = {
        {"id", "mem_sem_1"}, {"user_id", "u1"},
        {"subject", "user"}, {"predicate", "likes"}, {"object", "jazz"},
        {"category", "preference"}, {"confidence", 0.9}
    };
    auto m = semantic_from_json(j);
    REQUIRE(m.subject == "user");
    REQUIRE(m.predicate == "likes");
    REQUIRE(m.object == "jazz");
    REQUIRE(m.category == "preference");
    REQUIRE(m.confidence == 0.9);
    REQUIRE(semantic_to_json(m)["object"] == "jazz");
}

TEST_CASE("string_list: skips non-string entries", "[models]") {
    nlohmann::json j = {{"keywords", {"a", 1, "b", nullptr}}};
    auto list = string_list(j, "keywords");
    REQUIRE(list.size() == 2);
    REQUIRE(list[1] == "b");
    REQUIRE(string_list(j, "missing").empty());
}

TEST_CASE("message_from_json: unknown role becomes user", "[models]") {
    auto msg = message_from_json({{"role", "tool"}, {"content", "hi"}});
    REQUIRE(msg.role == Role::User);
    REQUIRE(msg.content == "hi");
    REQUIRE(message_to_json({Role::Assistant, "yo", 5})["role"] == "assistant");
}

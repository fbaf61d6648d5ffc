#include <catch2/catch_test_macros.hpp>
#include "extractor.hpp"
#include "mock_services.hpp"

using namespace engram;
using json = nlohmann::json;

namespace {

std::vector<ConversationMessage> conversation(size_t n) {
    std::vector<ConversationMessage> msgs;
    for (size_t i = 0; i < n; ++i) {
        msgs.push_back({i % 2 == 0 ? Role::User : Role::Assistant,
                        "message " + std::to_string(i), 0});
    }
    return msgs;
}

json episodic_item(const std::string& restatement, double importance = 0.5) {
    return {
        {"lossless_restatement", restatement},
        {"summary", restatement},
        {"keywords", {"k"}},
        {"event_type", "navigation"},
        {"participants", {"Alice"}},
        {"location", "Airport"},
        {"importance", importance},
        {"confidence", 0.9}
    };
}

json semantic_item(const std::string& s, const std::string& p, const std::string& o) {
    return {{"subject", s}, {"predicate", p}, {"object", o},
            {"category", "preference"}, {"confidence", 0.9}};
}

struct ExtractorFixture {
    SqliteStores stores{"extractor"};
    MockGenerator generator;
    KeywordEmbedder embedder{{"airport", "coffee", "jazz", "gym"}};
    MemoryConfig config;

    ExtractorFixture() {
        config.extraction_window_size = 4;
        config.extraction_overlap = 1;
    }

    Extractor make() {
        return Extractor(generator, embedder, *stores.vectors, *stores.documents,
                         *stores.graph, config);
    }
};

} // namespace

// ── Windows ──────────────────────────────────────────────────────

TEST_CASE("extraction_windows: overlapping windows, short tail skipped", "[extractor]") {
    auto w = extraction_windows(7, 4, 1);
    REQUIRE(w.size() == 2);
    REQUIRE(w[0] == std::make_pair<size_t, size_t>(0, 4));
    REQUIRE(w[1] == std::make_pair<size_t, size_t>(3, 7));
}

TEST_CASE("extraction_windows: short conversation gives one window", "[extractor]") {
    auto w = extraction_windows(3, 8, 2);
    REQUIRE(w.size() == 1);
    REQUIRE(w[0] == std::make_pair<size_t, size_t>(0, 3));
    REQUIRE(extraction_windows(1, 8, 2).empty());
    REQUIRE(extraction_windows(0, 8, 2).empty());
}

TEST_CASE("extraction_windows: overlap not below window still advances", "[extractor]") {
    auto w = extraction_windows(4, 2, 5);
    REQUIRE(w.size() == 3);
    REQUIRE(w[2] == std::make_pair<size_t, size_t>(2, 4));
}

// ── Candidate parsing ────────────────────────────────────────────

TEST_CASE("parse_episodic_candidate: normalizes fields", "[extractor]") {
    json item = {
        {"lossless_restatement", "  The user parked at level 3 of the mall garage.  "},
        {"keywords", {"parking", " ", 7}},
        {"event_type", "Time Travel"},
        {"importance", 4.0}
    };
    auto mem = parse_episodic_candidate(item, 0.6);
    REQUIRE(mem.has_value());
    REQUIRE(mem->lossless_restatement == "The user parked at level 3 of the mall garage.");
    REQUIRE(mem->summary == utf8_prefix(mem->lossless_restatement, 50));
    REQUIRE(mem->keywords == std::vector<std::string>{"parking"});
    REQUIRE(mem->event_type == "custom");
    REQUIRE(mem->importance == 1.0);
    REQUIRE(mem->confidence == 0.8);
    REQUIRE_FALSE(mem->location.has_value());
}

TEST_CASE("parse_episodic_candidate: rejects invalid candidates", "[extractor]") {
    REQUIRE_FALSE(parse_episodic_candidate(json::array(), 0.6).has_value());
    REQUIRE_FALSE(parse_episodic_candidate({{"summary", "no restatement"}}, 0.6).has_value());
    REQUIRE_FALSE(parse_episodic_candidate({{"lossless_restatement", 42}}, 0.6).has_value());
    REQUIRE_FALSE(parse_episodic_candidate(
        {{"lossless_restatement", "x"}, {"confidence", 0.3}}, 0.6).has_value());
}

TEST_CASE("parse_semantic_candidate: requires full triple", "[extractor]") {
    auto ok = parse_semantic_candidate(semantic_item("user", "likes", "jazz"), 0.6);
    REQUIRE(ok.has_value());
    REQUIRE(ok->category == "preference");

    REQUIRE_FALSE(parse_semantic_candidate({{"subject", "user"}, {"predicate", "likes"}}, 0.6).has_value());
    auto unsure = semantic_item("user", "likes", "jazz");
    unsure["confidence"] = 0.1;
    REQUIRE_FALSE(parse_semantic_candidate(unsure, 0.6).has_value());

    auto odd = semantic_item("user", "likes", "jazz");
    odd["category"] = "gossip";
    REQUIRE(parse_semantic_candidate(odd, 0.6)->category == "fact");
}

TEST_CASE("relation_for_predicate: upper snake case", "[extractor]") {
    REQUIRE(relation_for_predicate("likes to drink") == "LIKES_TO_DRINK");
    REQUIRE(relation_for_predicate("is") == "IS");
}

// ── Dedup ────────────────────────────────────────────────────────

TEST_CASE("Extractor::deduplicate_semantic: case-insensitive triples", "[extractor]") {
    SemanticMemory a;
    a.subject = "User";
    a.predicate = "likes";
    a.object = "Jazz";
    SemanticMemory b = a;
    b.subject = "user";
    b.object = "jazz";
    SemanticMemory c = a;
    c.object = "rock";

    auto out = Extractor::deduplicate_semantic({a, b, c});
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].subject == "User");
    REQUIRE(out[1].object == "rock");
}

TEST_CASE("Extractor::deduplicate_episodic: keeps the more important duplicate", "[extractor]") {
    ExtractorFixture f;
    auto extractor = f.make();

    EpisodicMemory low;
    low.lossless_restatement = "Drove to the airport";
    low.importance = 0.3;
    EpisodicMemory other;
    other.lossless_restatement = "Ordered coffee";
    EpisodicMemory high;
    high.lossless_restatement = "Went to the AIRPORT again";
    high.importance = 0.9;

    auto out = extractor.deduplicate_episodic({low, other, high});
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].lossless_restatement == "Ordered coffee");
    REQUIRE(out[1].importance == 0.9);
}

TEST_CASE("Extractor::deduplicate_episodic: embedding failure keeps both", "[extractor]") {
    ExtractorFixture f;
    f.embedder.fail = true;
    auto extractor = f.make();

    EpisodicMemory a;
    a.lossless_restatement = "same";
    EpisodicMemory b = a;
    REQUIRE(extractor.deduplicate_episodic({a, b}).size() == 2);
}

// ── extract ──────────────────────────────────────────────────────

TEST_CASE("Extractor::extract: one generation call per window", "[extractor]") {
    ExtractorFixture f;
    auto extractor = f.make();

    auto result = extractor.extract(conversation(7), "u1");
    REQUIRE(f.generator.json_call_count() == 2);
    REQUIRE(result.windows_processed == 2);
    REQUIRE(result.episodic.empty());
    REQUIRE(result.semantic.empty());
}

TEST_CASE("Extractor::extract: empty conversation does nothing", "[extractor]") {
    ExtractorFixture f;
    auto extractor = f.make();
    auto result = extractor.extract({}, "u1");
    REQUIRE(f.generator.json_call_count() == 0);
    REQUIRE(result.windows_processed == 0);
}

TEST_CASE("Extractor::extract: persists to all three stores", "[extractor]") {
    ExtractorFixture f;
    f.generator.json_replies.push_back({
        {"episodic_memories", {episodic_item("Drove to the airport with Alice", 0.8)}},
        {"semantic_memories", {semantic_item("user", "likes", "jazz")}}
    });
    auto extractor = f.make();

    auto result = extractor.extract(conversation(3), "u1", "car", "sess_1");
    REQUIRE(result.write_failures.empty());
    REQUIRE(result.episodic.size() == 1);
    REQUIRE(result.semantic.size() == 1);

    const auto& ep = result.episodic[0];
    REQUIRE(ep.id.rfind("mem_ep_", 0) == 0);
    REQUIRE(ep.agent_id == "car");
    REQUIRE(ep.source_session_id == "sess_1");

    auto doc = f.stores.documents->find_by_id(kEpisodicCollection, ep.id);
    REQUIRE(doc.has_value());
    REQUIRE((*doc)["location"] == "Airport");
    REQUIRE((*doc)["user_id"] == "u1");

    auto hits = f.stores.vectors->search(f.embedder.embed("airport"), 5, kEpisodicIndex,
                                         {{"user_id", "u1"}});
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].memory_id == ep.id);
    REQUIRE(hits[0].metadata["event_type"] == "navigation");

    auto from_user = f.stores.graph->get_neighbors("user_u1", std::string("EXPERIENCED"),
                                                   Direction::Outgoing);
    REQUIRE(from_user.size() == 1);
    REQUIRE(from_user[0].node.id == ep.id);
    REQUIRE(from_user[0].weight == 0.8);
    REQUIRE(f.stores.graph->get_node("loc_Airport").has_value());
    REQUIRE(f.stores.graph->get_node("person_Alice").has_value());

    const auto& sem = result.semantic[0];
    REQUIRE(sem.id.rfind("mem_sem_", 0) == 0);
    auto triple = f.stores.graph->get_neighbors("entity_user", std::string("LIKES"),
                                                Direction::Outgoing);
    REQUIRE(triple.size() == 1);
    REQUIRE(triple[0].node.id == "entity_jazz");
    REQUIRE(triple[0].edge_properties["memory_id"] == sem.id);
}

TEST_CASE("Extractor::extract: failed window is counted and others continue", "[extractor]") {
    ExtractorFixture f;
    int calls = 0;
    f.generator.json_handler = [&](const std::string&, const std::string&) -> json {
        if (++calls == 1) throw std::runtime_error("model unavailable");
        return {{"semantic_memories", {semantic_item("user", "drinks", "coffee")}}};
    };
    auto extractor = f.make();

    auto result = extractor.extract(conversation(7), "u1");
    REQUIRE(result.windows_failed == 1);
    REQUIRE(result.windows_processed == 1);
    REQUIRE(result.semantic.size() == 1);
}

TEST_CASE("Extractor::extract: duplicates across windows are merged", "[extractor]") {
    ExtractorFixture f;
    f.generator.json_handler = [](const std::string&, const std::string&) -> json {
        return {
            {"episodic_memories", {episodic_item("Went to the gym")}},
            {"semantic_memories", {semantic_item("User", "likes", "Jazz")}}
        };
    };
    auto extractor = f.make();

    auto result = extractor.extract(conversation(7), "u1");
    REQUIRE(result.episodic.size() == 1);
    REQUIRE(result.semantic.size() == 1);
    REQUIRE(f.stores.documents->count(kEpisodicCollection, {{"user_id", "u1"}}) == 1);
    REQUIRE(f.stores.documents->count(kSemanticCollection, {{"user_id", "u1"}}) == 1);
}

TEST_CASE("Extractor::extract: embedding failure is a write failure only", "[extractor]") {
    ExtractorFixture f;
    f.generator.json_replies.push_back({
        {"episodic_memories", {episodic_item("Drove to the airport")}}
    });
    auto extractor = f.make();
    f.embedder.fail = true;

    auto result = extractor.extract(conversation(2), "u1");
    REQUIRE(result.episodic.size() == 1);
    REQUIRE(result.write_failures.size() == 1);
    REQUIRE(f.stores.documents->count(kEpisodicCollection, {{"user_id", "u1"}}) == 1);
    REQUIRE(f.stores.vectors->count(kEpisodicIndex) == 0);
}

TEST_CASE("Extractor::extract: low-confidence candidates are dropped", "[extractor]") {
    ExtractorFixture f;
    auto weak = episodic_item("maybe went somewhere");
    weak["confidence"] = 0.2;
    f.generator.json_replies.push_back({{"episodic_memories", {weak}}});
    auto extractor = f.make();

    auto result = extractor.extract(conversation(2), "u1");
    REQUIRE(result.episodic.empty());
    REQUIRE(result.windows_processed == 1);
}

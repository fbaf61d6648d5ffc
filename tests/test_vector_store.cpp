#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "storage/sqlite_vector_store.hpp"
#include "mock_services.hpp"

using namespace engram;
using json = nlohmann::json;

struct VectorStoreFixture {
    std::string path = temp_db_path("vectors");
    SqliteVectorStore store{path};
    ~VectorStoreFixture() { remove_db_files(path); }
};

// ── l2_score ─────────────────────────────────────────────────────

TEST_CASE("l2_score: identical vectors score 1", "[vector_store]") {
    REQUIRE(l2_score({1, 2, 3}, {1, 2, 3}) == Catch::Approx(1.0));
}

TEST_CASE("l2_score: decreases with distance", "[vector_store]") {
    REQUIRE(l2_score({0, 0}, {3, 4}) == Catch::Approx(1.0 / 6.0));
    REQUIRE(l2_score({0, 0}, {1, 0}) > l2_score({0, 0}, {2, 0}));
}

TEST_CASE("l2_score: mismatched dimensions score 0", "[vector_store]") {
    REQUIRE(l2_score({1, 2}, {1}) == 0.0);
    REQUIRE(l2_score({}, {}) == 0.0);
}

// ── upsert / search ──────────────────────────────────────────────

TEST_CASE("SqliteVectorStore: search ranks nearest first", "[vector_store]") {
    VectorStoreFixture f;
    f.store.upsert("near", {1.0f, 0.0f}, {{"user_id", "u1"}}, kEpisodicIndex);
    f.store.upsert("far", {0.0f, 1.0f}, {{"user_id", "u1"}}, kEpisodicIndex);
    f.store.upsert("mid", {0.7f, 0.7f}, {{"user_id", "u1"}}, kEpisodicIndex);

    auto hits = f.store.search({1.0f, 0.0f}, 10, kEpisodicIndex);
    REQUIRE(hits.size() == 3);
    REQUIRE(hits[0].memory_id == "near");
    REQUIRE(hits[0].score == Catch::Approx(1.0));
    REQUIRE(hits[1].memory_id == "mid");
    REQUIRE(hits[2].memory_id == "far");
    REQUIRE(hits[0].metadata["user_id"] == "u1");
}

TEST_CASE("SqliteVectorStore: top_k, floor and filters", "[vector_store]") {
    VectorStoreFixture f;
    f.store.upsert("a", {1.0f, 0.0f}, {{"user_id", "u1"}, {"event_type", "dining"}}, kEpisodicIndex);
    f.store.upsert("b", {0.9f, 0.1f}, {{"user_id", "u2"}}, kEpisodicIndex);
    f.store.upsert("c", {0.0f, 1.0f}, {{"user_id", "u1"}}, kEpisodicIndex);

    REQUIRE(f.store.search({1.0f, 0.0f}, 1, kEpisodicIndex).size() == 1);

    auto u1 = f.store.search({1.0f, 0.0f}, 10, kEpisodicIndex, {{"user_id", "u1"}});
    REQUIRE(u1.size() == 2);

    auto dining = f.store.search({1.0f, 0.0f}, 10, kEpisodicIndex,
                                 {{"user_id", "u1"}, {"event_type", "dining"}});
    REQUIRE(dining.size() == 1);
    REQUIRE(dining[0].memory_id == "a");

    auto close = f.store.search({1.0f, 0.0f}, 10, kEpisodicIndex, json::object(), 0.8);
    REQUIRE(close.size() == 2);
}

TEST_CASE("SqliteVectorStore: hits under the score floor are dropped", "[vector_store]") {
    VectorStoreFixture f;
    f.store.upsert("same", {1.0f, 0.0f}, json::object(), kEpisodicIndex);
    f.store.upsert("far", {0.0f, 1.0f}, json::object(), kEpisodicIndex);

    // "far" scores 1 / (1 + sqrt(2)), about 0.414
    REQUIRE(f.store.search({1.0f, 0.0f}, 10, kEpisodicIndex, json::object(), 0.4).size() == 2);

    auto hits = f.store.search({1.0f, 0.0f}, 10, kEpisodicIndex, json::object(), 0.5);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].memory_id == "same");
    REQUIRE(hits[0].score == Catch::Approx(1.0));

    REQUIRE(f.store.search({1.0f, 0.0f}, 10, kEpisodicIndex, json::object(), 1.01).empty());
}

TEST_CASE("SqliteVectorStore: collections and dimensions are separate", "[vector_store]") {
    VectorStoreFixture f;
    f.store.upsert("e", {1.0f, 0.0f}, json::object(), kEpisodicIndex);
    f.store.upsert("s", {1.0f, 0.0f}, json::object(), kSemanticIndex);
    f.store.upsert("wide", {1.0f, 0.0f, 0.0f}, json::object(), kEpisodicIndex);

    auto hits = f.store.search({1.0f, 0.0f}, 10, kEpisodicIndex);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].memory_id == "e");
    REQUIRE(f.store.count(kEpisodicIndex) == 2);
    REQUIRE(f.store.count(kSemanticIndex) == 1);
}

TEST_CASE("SqliteVectorStore: upsert replaces existing record", "[vector_store]") {
    VectorStoreFixture f;
    f.store.upsert("m", {1.0f, 0.0f}, {{"v", 1}}, kEpisodicIndex);
    f.store.upsert("m", {0.0f, 1.0f}, {{"v", 2}}, kEpisodicIndex);
    REQUIRE(f.store.count(kEpisodicIndex) == 1);

    auto hits = f.store.search({0.0f, 1.0f}, 1, kEpisodicIndex);
    REQUIRE(hits[0].score == Catch::Approx(1.0));
    REQUIRE(hits[0].metadata["v"] == 2);
}

TEST_CASE("SqliteVectorStore: batch_upsert and remove", "[vector_store]") {
    VectorStoreFixture f;
    std::vector<VectorRecord> records = {
        {"a", {1.0f}, json::object()},
        {"b", {2.0f}, json::object()},
        {"c", {3.0f}, json::object()}
    };
    REQUIRE(f.store.batch_upsert(records, kSemanticIndex) == 3);
    REQUIRE(f.store.remove("b", kSemanticIndex));
    REQUIRE_FALSE(f.store.remove("b", kSemanticIndex));
    REQUIRE_FALSE(f.store.remove("a", kEpisodicIndex));
    REQUIRE(f.store.count(kSemanticIndex) == 2);
}

TEST_CASE("SqliteVectorStore: empty query or zero top_k returns nothing", "[vector_store]") {
    VectorStoreFixture f;
    f.store.upsert("a", {1.0f}, json::object(), kEpisodicIndex);
    REQUIRE(f.store.search({}, 5, kEpisodicIndex).empty());
    REQUIRE(f.store.search({1.0f}, 0, kEpisodicIndex).empty());
}

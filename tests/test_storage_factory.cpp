#include <catch2/catch_test_macros.hpp>
#include "storage.hpp"
#include "config.hpp"
#include "mock_services.hpp"

using namespace engram;

TEST_CASE("create_storage: local mode builds all four stores", "[storage]") {
    Config cfg;
    cfg.storage.sqlite_path = temp_db_path("factory");
    {
        auto bundle = create_storage(cfg);
        REQUIRE(bundle.sessions != nullptr);
        REQUIRE(bundle.vectors != nullptr);
        REQUIRE(bundle.documents != nullptr);
        REQUIRE(bundle.graph != nullptr);

        // All stores share the one database file
        REQUIRE(bundle.documents->insert(kSemanticCollection,
                                         {{"id", "s1"}, {"user_id", "u"}, {"subject", "a"},
                                          {"predicate", "b"}, {"object", "c"}}).has_value());
        GraphNode n;
        n.id = "entity_a";
        n.label = "Entity";
        REQUIRE(bundle.graph->add_node(n));
        REQUIRE(bundle.vectors->upsert("s1", {1.0f}, nlohmann::json::object(), kSemanticIndex));
    }
    remove_db_files(cfg.storage.sqlite_path);
}

TEST_CASE("create_storage: session store uses configured limits", "[storage]") {
    Config cfg;
    cfg.storage.sqlite_path = temp_db_path("factory_limits");
    cfg.memory.working_memory_max_messages = 2;
    {
        auto bundle = create_storage(cfg);
        WorkingMemory wm;
        wm.session_id = "s";
        wm.user_id = "u";
        bundle.sessions->save(wm);
        for (int i = 0; i < 4; ++i) {
            bundle.sessions->append_message("s", {Role::User, std::to_string(i), 0});
        }
        REQUIRE(bundle.sessions->get("s")->messages.size() == 2);
    }
    remove_db_files(cfg.storage.sqlite_path);
}

TEST_CASE("create_storage: production mode is reserved", "[storage]") {
    Config cfg;
    cfg.storage.mode = "production";
    REQUIRE_THROWS_AS(create_storage(cfg), std::runtime_error);
}

TEST_CASE("create_storage: unknown mode throws", "[storage]") {
    Config cfg;
    cfg.storage.mode = "cloud";
    REQUIRE_THROWS_AS(create_storage(cfg), std::invalid_argument);
}

#include <catch2/catch_test_macros.hpp>
#include "storage/memory_session_store.hpp"
#include <algorithm>
#include <memory>

using namespace engram;

namespace {

// Manually advanced clock shared with the store
struct FakeClock {
    std::shared_ptr<uint64_t> now = std::make_shared<uint64_t>(1000);
    InMemorySessionStore::Clock fn() const {
        auto n = now;
        return [n]() { return *n; };
    }
    void advance(uint64_t s) { *now += s; }
};

WorkingMemory make_session(const std::string& id, const std::string& user = "u1") {
    WorkingMemory wm;
    wm.session_id = id;
    wm.user_id = user;
    return wm;
}

} // namespace

TEST_CASE("InMemorySessionStore: save then get", "[session_store]") {
    FakeClock clock;
    InMemorySessionStore store(60, 10, 50, clock.fn());

    store.save(make_session("s1"));
    auto got = store.get("s1");
    REQUIRE(got.has_value());
    REQUIRE(got->user_id == "u1");
    REQUIRE(got->created_at == 1000);
    REQUIRE(got->expires_at == 1060);
    REQUIRE_FALSE(store.get("missing").has_value());
}

TEST_CASE("InMemorySessionStore: expired session reads as absent", "[session_store]") {
    FakeClock clock;
    InMemorySessionStore store(60, 10, 50, clock.fn());
    store.save(make_session("s1"));

    clock.advance(59);
    REQUIRE(store.get("s1").has_value());
    clock.advance(1);
    REQUIRE_FALSE(store.get("s1").has_value());
    REQUIRE(store.size() == 0);
}

TEST_CASE("InMemorySessionStore: explicit ttl overrides default", "[session_store]") {
    FakeClock clock;
    InMemorySessionStore store(60, 10, 50, clock.fn());
    store.save(make_session("s1"), 5);
    clock.advance(5);
    REQUIRE_FALSE(store.get("s1").has_value());
}

TEST_CASE("InMemorySessionStore: append keeps order and refreshes ttl", "[session_store]") {
    FakeClock clock;
    InMemorySessionStore store(60, 10, 50, clock.fn());
    store.save(make_session("s1"));

    clock.advance(50);
    REQUIRE(store.append_message("s1", {Role::User, "first", 0}));
    REQUIRE(store.append_message("s1", {Role::Assistant, "second", 0}));

    clock.advance(50);
    auto got = store.get("s1");
    REQUIRE(got.has_value());
    REQUIRE(got->messages.size() == 2);
    REQUIRE(got->messages[0].content == "first");
    REQUIRE(got->messages[1].role == Role::Assistant);
    REQUIRE(got->turn_count == 2);
}

TEST_CASE("InMemorySessionStore: append to absent session is a no-op", "[session_store]") {
    InMemorySessionStore store;
    REQUIRE_FALSE(store.append_message("nope", {Role::User, "x", 0}));
    REQUIRE(store.size() == 0);
}

TEST_CASE("InMemorySessionStore: message cap drops oldest", "[session_store]") {
    FakeClock clock;
    InMemorySessionStore store(60, 10, 3, clock.fn());

    auto wm = make_session("s1");
    for (int i = 0; i < 5; ++i) wm.messages.push_back({Role::User, "m" + std::to_string(i), 0});
    store.save(wm);
    REQUIRE(store.get("s1")->messages.front().content == "m2");

    store.append_message("s1", {Role::User, "m5", 0});
    auto got = store.get("s1");
    REQUIRE(got->messages.size() == 3);
    REQUIRE(got->messages.front().content == "m3");
    REQUIRE(got->messages.back().content == "m5");
}

TEST_CASE("InMemorySessionStore: capacity evicts session closest to expiry", "[session_store]") {
    FakeClock clock;
    InMemorySessionStore store(60, 2, 50, clock.fn());

    store.save(make_session("a"));
    clock.advance(1);
    store.save(make_session("b"));
    clock.advance(1);
    store.save(make_session("c"));

    REQUIRE(store.size() == 2);
    REQUIRE_FALSE(store.get("a").has_value());
    REQUIRE(store.get("b").has_value());
    REQUIRE(store.get("c").has_value());
}

TEST_CASE("InMemorySessionStore: re-saving existing id does not evict", "[session_store]") {
    FakeClock clock;
    InMemorySessionStore store(60, 2, 50, clock.fn());
    store.save(make_session("a"));
    store.save(make_session("b"));
    store.save(make_session("b"));
    REQUIRE(store.size() == 2);
    REQUIRE(store.get("a").has_value());
}

TEST_CASE("InMemorySessionStore: list_active only reports live sessions", "[session_store]") {
    FakeClock clock;
    InMemorySessionStore store(60, 10, 50, clock.fn());
    store.save(make_session("s1", "alice"));
    store.save(make_session("s2", "alice"), 10);
    store.save(make_session("s3", "bob"));

    auto active = store.list_active("alice");
    std::sort(active.begin(), active.end());
    REQUIRE(active == std::vector<std::string>{"s1", "s2"});

    clock.advance(10);
    REQUIRE(store.list_active("alice") == std::vector<std::string>{"s1"});
    REQUIRE(store.list_active("nobody").empty());
}

TEST_CASE("InMemorySessionStore: remove", "[session_store]") {
    InMemorySessionStore store;
    store.save(make_session("s1"));
    REQUIRE(store.remove("s1"));
    REQUIRE_FALSE(store.remove("s1"));
    REQUIRE(store.list_active("u1").empty());
}

TEST_CASE("InMemorySessionStore: user index shrinks with evictions", "[session_store]") {
    FakeClock clock;
    InMemorySessionStore store(60, 2, 50, clock.fn());
    for (int i = 0; i < 200; ++i) {
        store.save(make_session("s" + std::to_string(i)));
        clock.advance(1);
    }
    REQUIRE(store.size() == 2);
    REQUIRE(store.indexed_count() == 2);
}

TEST_CASE("InMemorySessionStore: expiry and removal leave no index entries", "[session_store]") {
    FakeClock clock;
    InMemorySessionStore store(60, 10, 50, clock.fn());
    store.save(make_session("gone", "alice"), 10);
    store.save(make_session("kept", "alice"));
    store.save(make_session("removed", "bob"));
    REQUIRE(store.indexed_count() == 3);

    clock.advance(10);
    REQUIRE_FALSE(store.get("gone").has_value());
    REQUIRE(store.indexed_count() == 2);

    REQUIRE(store.remove("removed"));
    REQUIRE(store.indexed_count() == 1);
    REQUIRE(store.list_active("bob").empty());
    REQUIRE(store.list_active("alice") == std::vector<std::string>{"kept"});
}

TEST_CASE("InMemorySessionStore: re-saving under another user moves the index entry", "[session_store]") {
    InMemorySessionStore store;
    store.save(make_session("s1", "alice"));
    store.save(make_session("s1", "bob"));
    REQUIRE(store.indexed_count() == 1);
    REQUIRE(store.list_active("alice").empty());
    REQUIRE(store.list_active("bob") == std::vector<std::string>{"s1"});
}

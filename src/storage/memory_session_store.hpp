#pragma once
#include "../storage.hpp"
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

namespace engram {

// In-process TTL session store for local mode
class InMemorySessionStore : public SessionStore {
public:
    using Clock = std::function<uint64_t()>;

    InMemorySessionStore(uint32_t default_ttl = 1800,
                         uint32_t max_sessions = 1000,
                         uint32_t max_messages = 50,
                         Clock clock = {});

    std::optional<WorkingMemory> get(const std::string& session_id) override;
    void save(const WorkingMemory& session, uint32_t ttl_seconds = 0) override;
    bool append_message(const std::string& session_id,
                        const ConversationMessage& message) override;
    bool remove(const std::string& session_id) override;
    std::vector<std::string> list_active(const std::string& user_id) override;

    size_t size() const;
    // Session ids held in the per-user index
    size_t indexed_count() const;

private:
    struct Entry {
        WorkingMemory session;
        uint32_t ttl = 0;
    };

    uint64_t now() const;
    // Caller holds mutex_
    void unindex(const WorkingMemory& session);
    void drop_expired(uint64_t now);
    void evict_oldest();

    uint32_t default_ttl_;
    uint32_t max_sessions_;
    uint32_t max_messages_;
    Clock clock_;

    std::unordered_map<std::string, Entry> sessions_;
    std::unordered_map<std::string, std::set<std::string>> user_sessions_;
    mutable std::mutex mutex_;
};

} // namespace engram

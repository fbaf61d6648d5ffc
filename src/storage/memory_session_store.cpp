#include "memory_session_store.hpp"
#include "../util.hpp"
#include <algorithm>

namespace engram {

InMemorySessionStore::InMemorySessionStore(uint32_t default_ttl,
                                           uint32_t max_sessions,
                                           uint32_t max_messages,
                                           Clock clock)
    : default_ttl_(default_ttl),
      max_sessions_(std::max<uint32_t>(1, max_sessions)),
      max_messages_(std::max<uint32_t>(1, max_messages)),
      clock_(std::move(clock)) {}

uint64_t InMemorySessionStore::now() const {
    return clock_ ? clock_() : epoch_seconds();
}

void InMemorySessionStore::unindex(const WorkingMemory& session) {
    auto users = user_sessions_.find(session.user_id);
    if (users == user_sessions_.end()) return;
    users->second.erase(session.session_id);
    if (users->second.empty()) user_sessions_.erase(users);
}

void InMemorySessionStore::drop_expired(uint64_t now) {
    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        if (it->second.session.expires_at <= now) {
            unindex(it->second.session);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

// Evict the session closest to expiry
void InMemorySessionStore::evict_oldest() {
    auto oldest = std::min_element(sessions_.begin(), sessions_.end(),
        [](const auto& a, const auto& b) {
            return a.second.session.expires_at < b.second.session.expires_at;
        });
    if (oldest == sessions_.end()) return;
    unindex(oldest->second.session);
    sessions_.erase(oldest);
}

std::optional<WorkingMemory> InMemorySessionStore::get(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    if (it->second.session.expires_at <= now()) {
        unindex(it->second.session);
        sessions_.erase(it);
        return std::nullopt;
    }
    return it->second.session;
}

void InMemorySessionStore::save(const WorkingMemory& session, uint32_t ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t t = now();
    uint32_t ttl = ttl_seconds > 0 ? ttl_seconds : default_ttl_;

    Entry entry;
    entry.session = session;
    entry.ttl = ttl;
    entry.session.expires_at = t + ttl;
    if (entry.session.created_at == 0) entry.session.created_at = t;
    auto& msgs = entry.session.messages;
    if (msgs.size() > max_messages_) {
        msgs.erase(msgs.begin(), msgs.end() - static_cast<std::ptrdiff_t>(max_messages_));
    }

    auto existing = sessions_.find(session.session_id);
    if (existing == sessions_.end()) {
        drop_expired(t);
        while (sessions_.size() >= max_sessions_) evict_oldest();
    } else if (existing->second.session.user_id != session.user_id) {
        unindex(existing->second.session);
    }
    sessions_[session.session_id] = std::move(entry);
    user_sessions_[session.user_id].insert(session.session_id);
}

bool InMemorySessionStore::append_message(const std::string& session_id,
                                          const ConversationMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t t = now();
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second.session.expires_at <= t) return false;

    auto& session = it->second.session;
    session.messages.push_back(message);
    if (session.messages.size() > max_messages_) {
        session.messages.erase(session.messages.begin());
    }
    session.turn_count++;
    session.expires_at = t + it->second.ttl;
    return true;
}

bool InMemorySessionStore::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return false;
    unindex(it->second.session);
    sessions_.erase(it);
    return true;
}

std::vector<std::string> InMemorySessionStore::list_active(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto users = user_sessions_.find(user_id);
    if (users == user_sessions_.end()) return {};

    uint64_t t = now();
    std::vector<std::string> active;
    for (auto it = users->second.begin(); it != users->second.end(); ) {
        auto s = sessions_.find(*it);
        if (s != sessions_.end() && s->second.session.expires_at > t) {
            active.push_back(*it);
            ++it;
        } else {
            it = users->second.erase(it);
        }
    }
    if (users->second.empty()) user_sessions_.erase(users);
    return active;
}

size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

size_t InMemorySessionStore::indexed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& entry : user_sessions_) n += entry.second.size();
    return n;
}

} // namespace engram

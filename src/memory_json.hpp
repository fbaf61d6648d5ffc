#pragma once
#include "models.hpp"
#include <nlohmann/json.hpp>

namespace engram {

// Shared JSON <-> model conversion used by the stores, engines and export.

inline std::vector<std::string> string_list(const nlohmann::json& item, const char* key) {
    std::vector<std::string> out;
    if (item.contains(key) && item[key].is_array()) {
        for (const auto& v : item[key]) {
            if (v.is_string()) out.push_back(v.get<std::string>());
        }
    }
    return out;
}

inline nlohmann::json message_to_json(const ConversationMessage& msg) {
    return {
        {"role", role_to_string(msg.role)},
        {"content", msg.content},
        {"timestamp", msg.timestamp}
    };
}

inline ConversationMessage message_from_json(const nlohmann::json& item) {
    ConversationMessage msg;
    msg.role = role_from_string(item.value("role", "user"));
    msg.content = item.value("content", "");
    msg.timestamp = item.value("timestamp", uint64_t{0});
    return msg;
}

inline nlohmann::json episodic_to_json(const EpisodicMemory& m) {
    nlohmann::json item = {
        {"id", m.id},
        {"user_id", m.user_id},
        {"agent_id", m.agent_id},
        {"lossless_restatement", m.lossless_restatement},
        {"summary", m.summary},
        {"keywords", m.keywords},
        {"event_type", m.event_type},
        {"participants", m.participants},
        {"location", nullptr},
        {"importance", m.importance},
        {"confidence", m.confidence},
        {"access_count", m.access_count},
        {"last_accessed_at", nullptr},
        {"is_archived", m.is_archived},
        {"is_compressed", m.is_compressed},
        {"merged_from", m.merged_from},
        {"source_session_id", m.source_session_id},
        {"created_at", m.created_at},
        {"updated_at", m.updated_at}
    };
    if (m.location) item["location"] = *m.location;
    if (m.last_accessed_at) item["last_accessed_at"] = *m.last_accessed_at;
    return item;
}

inline EpisodicMemory episodic_from_json(const nlohmann::json& item) {
    EpisodicMemory m;
    m.id = item.value("id", "");
    m.user_id = item.value("user_id", "");
    m.agent_id = item.value("agent_id", "default");
    m.lossless_restatement = item.value("lossless_restatement", "");
    m.summary = item.value("summary", "");
    m.keywords = string_list(item, "keywords");
    m.event_type = item.value("event_type", "general_conversation");
    m.participants = string_list(item, "participants");
    if (item.contains("location") && item["location"].is_string()) {
        m.location = item["location"].get<std::string>();
    }
    m.importance = item.value("importance", 0.5);
    m.confidence = item.value("confidence", 0.8);
    m.access_count = item.value("access_count", uint32_t{0});
    if (item.contains("last_accessed_at") && item["last_accessed_at"].is_number_unsigned()) {
        m.last_accessed_at = item["last_accessed_at"].get<uint64_t>();
    }
    m.is_archived = item.value("is_archived", false);
    m.is_compressed = item.value("is_compressed", false);
    m.merged_from = string_list(item, "merged_from");
    m.source_session_id = item.value("source_session_id", "");
    m.created_at = item.value("created_at", uint64_t{0});
    m.updated_at = item.value("updated_at", uint64_t{0});
    return m;
}

inline nlohmann::json semantic_to_json(const SemanticMemory& m) {
    return {
        {"id", m.id},
        {"user_id", m.user_id},
        {"agent_id", m.agent_id},
        {"subject", m.subject},
        {"predicate", m.predicate},
        {"object", m.object},
        {"category", m.category},
        {"confidence", m.confidence},
        {"source_session_id", m.source_session_id},
        {"created_at", m.created_at},
        {"updated_at", m.updated_at}
    };
}

inline SemanticMemory semantic_from_json(const nlohmann::json& item) {
    SemanticMemory m;
    m.id = item.value("id", "");
    m.user_id = item.value("user_id", "");
    m.agent_id = item.value("agent_id", "default");
    m.subject = item.value("subject", "");
    m.predicate = item.value("predicate", "");
    m.object = item.value("object", "");
    m.category = item.value("category", "fact");
    m.confidence = item.value("confidence", 0.8);
    m.source_session_id = item.value("source_session_id", "");
    m.created_at = item.value("created_at", uint64_t{0});
    m.updated_at = item.value("updated_at", uint64_t{0});
    return m;
}

} // namespace engram

#include "models.hpp"
#include "util.hpp"
#include <algorithm>

namespace engram {

std::string role_to_string(Role role) {
    switch (role) {
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
        case Role::System:    return "system";
    }
    return "user";
}

Role role_from_string(const std::string& s) {
    if (s == "assistant") return Role::Assistant;
    if (s == "system") return Role::System;
    return Role::User;
}

std::string memory_type_to_string(MemoryType type) {
    return type == MemoryType::Episodic ? "episodic" : "semantic";
}

std::string direction_to_string(Direction dir) {
    switch (dir) {
        case Direction::Outgoing: return "outgoing";
        case Direction::Incoming: return "incoming";
        case Direction::Both:     return "both";
    }
    return "outgoing";
}

Direction direction_from_string(const std::string& s) {
    if (s == "incoming") return Direction::Incoming;
    if (s == "both") return Direction::Both;
    return Direction::Outgoing;
}

const std::vector<std::string>& event_types() {
    static const std::vector<std::string> types = {
        "navigation", "music_playback", "climate_control", "phone_call",
        "schedule_management", "vehicle_control", "general_conversation",
        "dining", "shopping", "custom"
    };
    return types;
}

std::string normalize_event_type(const std::string& s) {
    std::string lower = to_lower(trim(s));
    if (lower.empty()) return "general_conversation";
    const auto& types = event_types();
    if (std::find(types.begin(), types.end(), lower) != types.end()) return lower;
    return "custom";
}

std::string normalize_category(const std::string& s) {
    static const std::vector<std::string> categories = {
        "preference", "fact", "relationship", "habit", "knowledge"
    };
    std::string lower = to_lower(trim(s));
    if (std::find(categories.begin(), categories.end(), lower) != categories.end()) return lower;
    return "fact";
}

double clamp_unit(double v) {
    if (!(v >= 0.0)) return 0.0;  // also catches NaN
    return v > 1.0 ? 1.0 : v;
}

} // namespace engram

#include "prompt.hpp"
#include "util.hpp"
#include <algorithm>
#include <cstdio>
#include <sstream>

namespace engram {

const char* const kApologyReply =
    "Sorry, I can't reply right now. Please try again later.";

std::string build_extraction_system_prompt() {
    std::ostringstream ss;
    ss << "You are a memory extraction system. Extract the information worth "
       << "remembering from the conversation excerpt you are given.\n\n"
       << "Return JSON with exactly two arrays:\n\n"
       << "{\n"
       << "  \"episodic_memories\": [\n"
       << "    {\n"
       << "      \"lossless_restatement\": \"complete restatement that loses no information\",\n"
       << "      \"summary\": \"one-sentence summary\",\n"
       << "      \"keywords\": [\"keyword1\", \"keyword2\"],\n"
       << "      \"event_type\": \"one of: ";
    const auto& types = event_types();
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) ss << "/";
        ss << types[i];
    }
    ss << "\",\n"
       << "      \"participants\": [\"people involved\"],\n"
       << "      \"location\": \"place, if any\",\n"
       << "      \"importance\": 0.5,\n"
       << "      \"confidence\": 0.8\n"
       << "    }\n"
       << "  ],\n"
       << "  \"semantic_memories\": [\n"
       << "    {\n"
       << "      \"subject\": \"subject\",\n"
       << "      \"predicate\": \"predicate or relation\",\n"
       << "      \"object\": \"object\",\n"
       << "      \"category\": \"one of: preference/fact/relationship/habit/knowledge\",\n"
       << "      \"confidence\": 0.8\n"
       << "    }\n"
       << "  ]\n"
       << "}\n\n"
       << "Rules:\n"
       << "1. Episodic memories record concrete events, exchanges and actions.\n"
       << "2. Semantic memories capture durable knowledge: preferences, facts, "
       << "relationships and habits of the user.\n"
       << "3. lossless_restatement must keep the full original meaning.\n"
       << "4. importance (0-1) reflects the long-term value of the information.\n"
       << "5. Return empty arrays when nothing is worth remembering.\n"
       << "6. Never invent information that is not in the conversation.";
    return ss.str();
}

std::string build_extraction_prompt(const std::vector<ConversationMessage>& window) {
    std::ostringstream ss;
    ss << "Extract memories from the following conversation:\n\n";
    for (size_t i = 0; i < window.size(); ++i) {
        if (i > 0) ss << "\n";
        ss << "[" << role_to_string(window[i].role) << "] " << window[i].content;
    }
    return ss.str();
}

std::string build_intent_prompt(const std::string& query) {
    return "Analyze the intent of the following user query and return JSON:\n"
           "{\n"
           "  \"intent\": \"intent category\",\n"
           "  \"search_keywords\": [\"keyword1\", \"keyword2\"],\n"
           "  \"time_hint\": \"time reference, if any\",\n"
           "  \"entity_hint\": \"entity reference, if any\"\n"
           "}\n\n"
           "User query: " + query;
}

std::string default_system_prompt() {
    return "You are a friendly AI assistant. Reply to the user's message, "
           "using what you remember about them when it is relevant.\n"
           "Current date: " + timestamp_now();
}

std::string format_memory_context(const RetrievalResult& result, uint32_t max_items) {
    std::ostringstream ss;

    if (!result.episodic_memories.empty()) {
        ss << "### Related events\n";
        size_t n = std::min<size_t>(result.episodic_memories.size(), max_items);
        for (size_t i = 0; i < n; ++i) {
            const auto& mem = result.episodic_memories[i];
            char score[16];
            std::snprintf(score, sizeof(score), "%.2f", mem.score);
            ss << (i + 1) << ". " << mem.content << " (relevance: " << score << ")\n";
        }
    }

    if (!result.semantic_memories.empty()) {
        if (!result.episodic_memories.empty()) ss << "\n";
        ss << "### Related knowledge\n";
        size_t n = std::min<size_t>(result.semantic_memories.size(), max_items);
        for (size_t i = 0; i < n; ++i) {
            const auto& sem = result.semantic_memories[i];
            ss << "- " << sem.subject << " " << sem.predicate << " " << sem.object << "\n";
        }
    }

    return ss.str();
}

} // namespace engram

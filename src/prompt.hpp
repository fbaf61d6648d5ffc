#pragma once
#include "models.hpp"
#include <string>
#include <vector>

namespace engram {

// Instructions for turning a conversation window into memory candidates.
std::string build_extraction_system_prompt();

// "[role] content" lines, prefixed with the extraction request.
std::string build_extraction_prompt(const std::vector<ConversationMessage>& window);

// Query intent analysis: {intent, search_keywords, time_hint, entity_hint}
std::string build_intent_prompt(const std::string& query);

// Base persona used when no other system prompt is configured.
std::string default_system_prompt();

// "### Related events" / "### Related knowledge" block, empty when there is
// nothing to show.
std::string format_memory_context(const RetrievalResult& result, uint32_t max_items);

// Reply returned when generation fails.
extern const char* const kApologyReply;

} // namespace engram

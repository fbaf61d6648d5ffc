#include "controller.hpp"
#include "generator.hpp"
#include "prompt.hpp"
#include "storage.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace engram {

Controller::Controller(SessionStore& sessions, Generator& generator, Embedder& embedder,
                       VectorStore& vectors, DocumentStore& documents, GraphStore& graph,
                       const MemoryConfig& config, ProfileSource* profile)
    : sessions_(sessions), generator_(generator), config_(config), profile_(profile),
      extractor_(generator, embedder, vectors, documents, graph, config),
      retriever_(generator, embedder, vectors, documents, graph, config),
      forgetter_(embedder, vectors, documents, config) {
    worker_ = std::thread([this]() { worker_loop(); });
}

Controller::~Controller() {
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        stopping_ = true;
    }
    jobs_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

ChatReply Controller::chat(const std::string& user_id, const std::string& message,
                           const std::string& session_id, const ChatOptions& options) {
    ChatReply out;
    out.session_id = session_id.empty() ? generate_id("sess_") : session_id;

    WorkingMemory session = get_or_create_session(out.session_id, user_id, options.agent_id);
    if (!sessions_.append_message(out.session_id, {Role::User, message, epoch_seconds()})) {
        std::cerr << "[controller] Session " << out.session_id << " lost before the user message\n";
    }

    uint32_t max_items = options.max_memory_items.value_or(config_.retrieval_top_k);

    std::string memory_text;
    if (options.include_memory) {
        try {
            RetrievalQuery query;
            query.user_id = user_id;
            query.query = message;
            query.top_k = max_items;
            out.retrieval = retriever_.retrieve(query);
            out.memories_used = static_cast<uint32_t>(out.retrieval.episodic_memories.size() +
                                                      out.retrieval.semantic_memories.size());
            memory_text = format_memory_context(out.retrieval, max_items);
        } catch (const std::exception& e) {
            std::cerr << "[controller] Retrieval failed: " << e.what() << "\n";
        }
    }

    std::string profile_text;
    if (options.include_profile && profile_) {
        try {
            profile_text = profile_->profile_snapshot(user_id);
        } catch (const std::exception& e) {
            std::cerr << "[controller] Profile lookup failed: " << e.what() << "\n";
        }
    }

    std::string system_prompt = default_system_prompt();
    if (!profile_text.empty()) system_prompt += "\n\n## About the user\n" + profile_text;
    if (!memory_text.empty()) system_prompt += "\n\n## Related memories\n" + memory_text;

    try {
        out.reply = generator_.generate_with_history(build_history(out.session_id, message),
                                                     system_prompt);
    } catch (const std::exception& e) {
        std::cerr << "[controller] Generation failed: " << e.what() << "\n";
        out.reply = kApologyReply;
    }

    if (!sessions_.append_message(out.session_id, {Role::Assistant, out.reply, epoch_seconds()})) {
        std::cerr << "[controller] Session " << out.session_id << " lost before the reply\n";
    }

    auto updated = sessions_.get(out.session_id);
    if (updated && updated->messages.size() >= config_.extraction_window_size) {
        enqueue_extraction({updated->messages, user_id, session.agent_id, out.session_id});
    }
    return out;
}

ForgettingResult Controller::forget(const std::string& user_id,
                                    const std::optional<ForgettingConfig>& config) {
    return forgetter_.run_forgetting_cycle(user_id, config);
}

WorkingMemory Controller::get_or_create_session(const std::string& session_id,
                                                const std::string& user_id,
                                                const std::string& agent_id) {
    if (auto existing = sessions_.get(session_id)) return *existing;

    WorkingMemory session;
    session.session_id = session_id;
    session.user_id = user_id;
    session.agent_id = agent_id;
    session.created_at = epoch_seconds();
    session.expires_at = session.created_at + config_.working_memory_ttl;
    sessions_.save(session, config_.working_memory_ttl);
    return session;
}

std::vector<ConversationMessage> Controller::build_history(const std::string& session_id,
                                                           const std::string& message) {
    std::vector<ConversationMessage> history;
    if (auto session = sessions_.get(session_id)) {
        const auto& msgs = session->messages;
        size_t n = std::min<size_t>(msgs.size(), config_.history_messages);
        history.assign(msgs.end() - static_cast<std::ptrdiff_t>(n), msgs.end());
    }
    if (history.empty() || history.back().role != Role::User) {
        history.push_back({Role::User, message, epoch_seconds()});
    }
    return history;
}

// ── Background extraction ────────────────────────────────────

void Controller::enqueue_extraction(ExtractionJob job) {
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        jobs_.push_back(std::move(job));
    }
    jobs_cv_.notify_one();
}

void Controller::wait_for_extractions() {
    std::unique_lock<std::mutex> lock(jobs_mutex_);
    idle_cv_.wait(lock, [this]() { return jobs_.empty() && !extracting_; });
}

void Controller::worker_loop() {
    for (;;) {
        ExtractionJob job;
        {
            std::unique_lock<std::mutex> lock(jobs_mutex_);
            jobs_cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            // Pending jobs are drained before shutdown
            if (jobs_.empty()) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
            extracting_ = true;
        }

        try {
            extractor_.extract(job.messages, job.user_id, job.agent_id, job.session_id);
        } catch (const std::exception& e) {
            std::cerr << "[controller] Extraction for session " << job.session_id
                      << " failed: " << e.what() << "\n";
        }

        {
            std::lock_guard<std::mutex> lock(jobs_mutex_);
            extracting_ = false;
        }
        idle_cv_.notify_all();
    }
}

} // namespace engram

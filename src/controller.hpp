#pragma once
#include "config.hpp"
#include "extractor.hpp"
#include "forgetter.hpp"
#include "models.hpp"
#include "retriever.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace engram {

class Generator;
class Embedder;
class SessionStore;
class VectorStore;
class DocumentStore;
class GraphStore;

// Supplies a short text description of the user for the system prompt.
// Implementations may throw; the controller treats a failure as "no profile".
class ProfileSource {
public:
    virtual ~ProfileSource() = default;
    virtual std::string profile_snapshot(const std::string& user_id) = 0;
};

struct ChatOptions {
    bool include_memory = true;
    bool include_profile = true;
    std::optional<uint32_t> max_memory_items;  // default: retrieval_top_k
    std::string agent_id = "default";
};

struct ChatReply {
    std::string reply;
    std::string session_id;
    uint32_t memories_used = 0;
    RetrievalResult retrieval;
};

// One conversation turn end to end. Extraction runs on a single background
// worker and never affects the reply.
class Controller {
public:
    Controller(SessionStore& sessions, Generator& generator, Embedder& embedder,
               VectorStore& vectors, DocumentStore& documents, GraphStore& graph,
               const MemoryConfig& config, ProfileSource* profile = nullptr);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    // An empty session_id starts a new session; the id is returned in the reply.
    ChatReply chat(const std::string& user_id, const std::string& message,
                   const std::string& session_id = "", const ChatOptions& options = {});

    ForgettingResult forget(const std::string& user_id,
                            const std::optional<ForgettingConfig>& config = std::nullopt);

    // Block until every queued extraction has finished
    void wait_for_extractions();

    Retriever& retriever() { return retriever_; }
    Extractor& extractor() { return extractor_; }

private:
    struct ExtractionJob {
        std::vector<ConversationMessage> messages;
        std::string user_id;
        std::string agent_id;
        std::string session_id;
    };

    WorkingMemory get_or_create_session(const std::string& session_id,
                                        const std::string& user_id,
                                        const std::string& agent_id);
    std::vector<ConversationMessage> build_history(const std::string& session_id,
                                                   const std::string& message);
    void enqueue_extraction(ExtractionJob job);
    void worker_loop();

    SessionStore& sessions_;
    Generator& generator_;
    MemoryConfig config_;
    ProfileSource* profile_;

    Extractor extractor_;
    Retriever retriever_;
    Forgetter forgetter_;

    std::deque<ExtractionJob> jobs_;
    bool extracting_ = false;
    bool stopping_ = false;
    std::mutex jobs_mutex_;
    std::condition_variable jobs_cv_;
    std::condition_variable idle_cv_;
    std::thread worker_;
};

} // namespace engram

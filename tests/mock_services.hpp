#pragma once
#include "generator.hpp"
#include "embedder.hpp"
#include "util.hpp"
#include "storage/sqlite_document_store.hpp"
#include "storage/sqlite_graph_store.hpp"
#include "storage/sqlite_vector_store.hpp"
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

namespace engram {

// Canned generator. JSON requests are answered by json_handler when set,
// otherwise from json_replies (then an empty object). Text requests come
// from text_replies (then default_text).
class MockGenerator : public Generator {
public:
    std::function<nlohmann::json(const std::string& prompt, const std::string& system)> json_handler;
    std::deque<nlohmann::json> json_replies;
    std::deque<std::string> text_replies;
    std::string default_text = "ok";
    bool fail_json = false;
    bool fail_text = false;

    std::vector<std::string> json_prompts;
    std::vector<std::vector<ConversationMessage>> histories;
    std::string last_system_prompt;
    std::optional<double> last_temperature;

    std::string generate(const std::string& /*prompt*/,
                         const std::string& system_prompt,
                         std::optional<double> temperature = std::nullopt,
                         std::optional<uint32_t> /*max_tokens*/ = std::nullopt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_system_prompt = system_prompt;
        last_temperature = temperature;
        return next_text();
    }

    nlohmann::json generate_json(const std::string& prompt,
                                 const std::string& system_prompt,
                                 std::optional<double> temperature = std::nullopt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        json_prompts.push_back(prompt);
        last_temperature = temperature;
        if (fail_json) throw std::runtime_error("mock json failure");
        if (json_handler) return json_handler(prompt, system_prompt);
        if (json_replies.empty()) return nlohmann::json::object();
        auto reply = json_replies.front();
        json_replies.pop_front();
        return reply;
    }

    std::string generate_with_history(const std::vector<ConversationMessage>& messages,
                                      const std::string& system_prompt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        histories.push_back(messages);
        last_system_prompt = system_prompt;
        return next_text();
    }

    std::string generator_name() const override { return "mock"; }

    size_t json_call_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return json_prompts.size();
    }

private:
    std::string next_text() {
        if (fail_text) throw std::runtime_error("mock text failure");
        if (text_replies.empty()) return default_text;
        auto reply = text_replies.front();
        text_replies.pop_front();
        return reply;
    }

    std::mutex mutex_;
};

// One axis per keyword: a text embeds to 1.0 on every axis whose keyword it
// contains (case-insensitive). Texts with no keyword land on an extra axis.
// Texts sharing the same keyword set therefore have similarity 1, disjoint
// sets similarity 0.
class KeywordEmbedder : public Embedder {
public:
    explicit KeywordEmbedder(std::vector<std::string> keywords)
        : keywords_(std::move(keywords)) {}

    bool fail = false;
    int embed_calls = 0;

    Embedding embed(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        embed_calls++;
        if (fail) return {};
        Embedding e(keywords_.size() + 1, 0.0f);
        std::string lower = to_lower(text);
        bool any = false;
        for (size_t i = 0; i < keywords_.size(); ++i) {
            if (lower.find(to_lower(keywords_[i])) != std::string::npos) {
                e[i] = 1.0f;
                any = true;
            }
        }
        if (!any) e.back() = 1.0f;
        return e;
    }

    uint32_t dimensions() const override { return static_cast<uint32_t>(keywords_.size() + 1); }
    std::string embedder_name() const override { return "keyword"; }

private:
    std::vector<std::string> keywords_;
    std::mutex mutex_;
};

// Per-test SQLite file under /tmp, removed with its WAL side files
inline std::string temp_db_path(const std::string& tag) {
    return "/tmp/engram_test_" + tag + "_" + std::to_string(getpid()) + ".db";
}

inline void remove_db_files(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

// The three persistent stores over one temp database, as in local mode
struct SqliteStores {
    std::string path;
    std::unique_ptr<SqliteDocumentStore> documents;
    std::unique_ptr<SqliteVectorStore> vectors;
    std::unique_ptr<SqliteGraphStore> graph;

    explicit SqliteStores(const std::string& tag) : path(temp_db_path(tag)) {
        remove_db_files(path);
        documents = std::make_unique<SqliteDocumentStore>(path);
        vectors = std::make_unique<SqliteVectorStore>(path);
        graph = std::make_unique<SqliteGraphStore>(path);
    }

    ~SqliteStores() {
        documents.reset();
        vectors.reset();
        graph.reset();
        remove_db_files(path);
    }

    SqliteStores(const SqliteStores&) = delete;
    SqliteStores& operator=(const SqliteStores&) = delete;
};

} // namespace engram

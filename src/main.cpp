#include "config.hpp"
#include "controller.hpp"
#include "embedder.hpp"
#include "generator.hpp"
#include "http.hpp"
#include "memory_manager.hpp"
#include "storage.hpp"
#include "util.hpp"
#include <cstring>
#include <iostream>
#include <string>

#ifndef ENGRAM_VERSION
#define ENGRAM_VERSION "dev"
#endif

static void print_usage() {
    std::cout << "Usage: engram [options]\n"
              << "\n"
              << "Options:\n"
              << "  --user ID            User to chat as (default: local)\n"
              << "  --session ID         Continue an existing session\n"
              << "  -m, --message MSG    Send a single message and exit\n"
              << "  --config PATH        Load configuration from PATH\n"
              << "  --forget USER        Run a forgetting cycle for USER\n"
              << "  --stats USER         Print memory statistics for USER\n"
              << "  --export USER        Print all memories of USER as JSON\n"
              << "  --export-csv USER    Print all memories of USER as CSV\n"
              << "  -v, --version        Show version\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /stats               Show memory statistics\n"
              << "  /forget              Run a forgetting cycle\n"
              << "  /new                 Start a new session\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY       API key for the model provider\n"
              << "  OPENAI_BASE_URL      Base URL of an OpenAI-compatible API\n"
              << "  LLM_MODEL            Chat model\n"
              << "  EMBEDDING_MODEL      Embedding model\n"
              << "  STORAGE_MODE         Storage mode (local)\n"
              << "  SQLITE_DB_PATH       SQLite database path\n";
}

static void print_forgetting(const engram::ForgettingResult& r) {
    std::cout << "Forgetting cycle for " << r.user_id << "\n"
              << "  scanned:    " << r.total_scanned << "\n"
              << "  compressed: " << r.memories_compressed << "\n"
              << "  archived:   " << r.memories_archived << "\n"
              << "  deleted:    " << r.memories_deleted << "\n";
    for (const auto& d : r.details) std::cout << "  - " << d << "\n";
}

int main(int argc, char* argv[]) try {
    std::string user_id = "local";
    std::string session_id;
    std::string message;
    std::string config_path;
    std::string forget_user;
    std::string stats_user;
    std::string export_user;
    engram::ExportFormat export_format = engram::ExportFormat::Json;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            std::cout << "engram " << ENGRAM_VERSION << "\n";
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
            user_id = argv[++i];
        } else if (std::strcmp(argv[i], "--session") == 0 && i + 1 < argc) {
            session_id = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--forget") == 0 && i + 1 < argc) {
            forget_user = argv[++i];
        } else if (std::strcmp(argv[i], "--stats") == 0 && i + 1 < argc) {
            stats_user = argv[++i];
        } else if (std::strcmp(argv[i], "--export") == 0 && i + 1 < argc) {
            export_user = argv[++i];
        } else if (std::strcmp(argv[i], "--export-csv") == 0 && i + 1 < argc) {
            export_user = argv[++i];
            export_format = engram::ExportFormat::Csv;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    engram::Config config = config_path.empty() ? engram::Config::load()
                                                : engram::Config::load_file(config_path);
    engram::StorageBundle storage = engram::create_storage(config);

    // Maintenance commands need no model access
    if (!stats_user.empty() || !export_user.empty()) {
        engram::MemoryManager manager(*storage.vectors, *storage.documents, *storage.graph);
        if (!stats_user.empty()) {
            std::cout << engram::stats_to_json(manager.stats(stats_user)).dump(2) << "\n";
        }
        if (!export_user.empty()) {
            std::cout << manager.export_memories(export_user, export_format) << "\n";
        }
        return 0;
    }

    engram::http_init();
    engram::PlatformHttpClient http_client;

    std::unique_ptr<engram::Generator> generator;
    std::unique_ptr<engram::Embedder> embedder;
    try {
        generator = engram::create_generator(config, http_client);
        embedder = engram::create_embedder(config, http_client);
    } catch (const std::exception& e) {
        std::cerr << "Error creating model clients: " << e.what() << "\n";
        engram::http_cleanup();
        return 1;
    }

    {
        engram::Controller controller(*storage.sessions, *generator, *embedder,
                                      *storage.vectors, *storage.documents, *storage.graph,
                                      config.memory);

        if (!forget_user.empty()) {
            print_forgetting(controller.forget(forget_user));
        } else if (!message.empty()) {
            auto reply = controller.chat(user_id, message, session_id);
            std::cout << reply.reply << "\n";
            std::cerr << "[session " << reply.session_id << "] "
                      << reply.retrieval.retrieval_plan << "\n";
            controller.wait_for_extractions();
        } else {
            std::cout << "engram " << ENGRAM_VERSION << "\n"
                      << "User: " << user_id << " | Model: " << generator->generator_name()
                      << " | Embeddings: " << embedder->embedder_name() << "\n"
                      << "Type /help for commands, /quit to exit.\n\n";

            engram::MemoryManager manager(*storage.vectors, *storage.documents, *storage.graph);
            std::string line;
            while (true) {
                std::cout << "engram> " << std::flush;
                if (!std::getline(std::cin, line)) {
                    std::cout << "\n";
                    break;
                }
                line = engram::trim(line);
                if (line.empty()) continue;

                if (line[0] == '/') {
                    if (line == "/quit" || line == "/exit") {
                        break;
                    } else if (line == "/stats") {
                        std::cout << engram::stats_to_json(manager.stats(user_id)).dump(2) << "\n";
                    } else if (line == "/forget") {
                        controller.wait_for_extractions();
                        print_forgetting(controller.forget(user_id));
                    } else if (line == "/new") {
                        session_id.clear();
                        std::cout << "Started a new session.\n";
                    } else if (line == "/help") {
                        std::cout << "Commands:\n"
                                  << "  /stats    Show memory statistics\n"
                                  << "  /forget   Run a forgetting cycle\n"
                                  << "  /new      Start a new session\n"
                                  << "  /quit     Exit\n"
                                  << "  /exit     Exit\n"
                                  << "  /help     Show this help\n";
                    } else {
                        std::cout << "Unknown command: " << line << "\n";
                    }
                    continue;
                }

                auto reply = controller.chat(user_id, line, session_id);
                session_id = reply.session_id;
                std::cout << "\n" << reply.reply << "\n\n";
            }
            std::cerr << "[controller] Waiting for pending extractions...\n";
        }
    }

    engram::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}

#include "storage.hpp"
#include "storage/memory_session_store.hpp"
#include "storage/sqlite_document_store.hpp"
#include "storage/sqlite_graph_store.hpp"
#include "storage/sqlite_vector_store.hpp"
#include "config.hpp"
#include <iostream>
#include <stdexcept>

namespace engram {

StorageBundle create_storage(const Config& config) {
    const auto& mode = config.storage.mode;

    if (mode == "local") {
        std::string path = config.sqlite_path();
        const auto& mem = config.memory;

        StorageBundle bundle;
        bundle.sessions = std::make_unique<InMemorySessionStore>(
            mem.working_memory_ttl, mem.working_memory_max_sessions,
            mem.working_memory_max_messages);
        bundle.documents = std::make_unique<SqliteDocumentStore>(path);
        bundle.vectors = std::make_unique<SqliteVectorStore>(path);
        bundle.graph = std::make_unique<SqliteGraphStore>(path);
        std::cerr << "[storage] Local mode: " << path << "\n";
        return bundle;
    }

    if (mode == "production") {
        throw std::runtime_error("Storage mode 'production' is not implemented");
    }

    throw std::invalid_argument("Unknown storage mode: " + mode);
}

} // namespace engram

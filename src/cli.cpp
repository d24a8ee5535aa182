#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "chunker.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "vector_store.hpp"

using namespace rfpindex;

static void usage() {
    std::cerr << "rfpindex_cli usage:\n"
              << "  config [--use-case NAME] [--validate]\n"
              << "  stats\n"
              << "  add --id ID (--file PATH | --text TEXT) [--type TYPE]\n"
              << "  search --query TEXT [--top-k N] [--type TYPE] [--min-similarity S]\n"
              << "  list [--limit N] [--offset N] [--type TYPE]\n"
              << "  delete --id ID\n"
              << "  rebuild\n"
              << "Configuration is read from VECTOR_* environment variables.\n";
}

static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static Filters type_filter(const std::string& type) {
    if (type.empty()) {
        return nlohmann::json::object();
    }
    return {{"type", type}};
}

static std::unique_ptr<VectorStore> open_store() {
    IndexConfig config = IndexConfig::from_env();
    set_log_level(config.log_level);
    auto store = std::make_unique<VectorStore>(std::move(config));
    store->initialize();
    return store;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    configure_logging_from_env();
    std::string cmd = argv[1];
    try {
        if (cmd == "config") {
            std::string use_case;
            bool validate = false;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--use-case" && i + 1 < argc) use_case = argv[++i];
                else if (a == "--validate") validate = true;
            }
            IndexConfig config = use_case.empty() ? IndexConfig::from_env() : recommended_config(use_case);
            nlohmann::json out = config.to_json();
            if (validate) {
                out["validation"] = config.validate().to_json();
            }
            std::cout << out.dump(2) << "\n";
            return validate && !config.validate().valid() ? 3 : 0;
        } else if (cmd == "stats") {
            auto store = open_store();
            std::cout << store->get_stats().to_json().dump(2) << "\n";
            store->close();
            return 0;
        } else if (cmd == "add") {
            std::string id, file, text, type;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--id" && i + 1 < argc) id = argv[++i];
                else if (a == "--file" && i + 1 < argc) file = argv[++i];
                else if (a == "--text" && i + 1 < argc) text = argv[++i];
                else if (a == "--type" && i + 1 < argc) type = argv[++i];
            }
            if (id.empty() || (file.empty() == text.empty())) { usage(); return 2; }
            if (!file.empty()) text = read_file(file);

            nlohmann::json metadata = nlohmann::json::object();
            if (!type.empty()) metadata["type"] = type;
            if (!file.empty()) metadata["file"] = std::filesystem::path(file).filename().string();

            auto store = open_store();
            const IndexConfig& config = store->config();
            std::vector<VectorDocument> docs;
            if (text.size() > config.chunk_size) {
                docs = create_document_chunks(id, text, metadata, config.chunk_size, config.chunk_overlap);
            } else {
                docs.emplace_back(id, text, metadata);
            }
            for (auto& doc : docs) doc.source = "cli";
            auto ids = store->add_documents(std::move(docs));
            std::cout << "[OK] Added " << ids.size() << " document(s)\n";
            store->close();
            return 0;
        } else if (cmd == "search") {
            std::string query, type;
            size_t top_k = 5;
            float min_similarity = 0.0f;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--query" && i + 1 < argc) query = argv[++i];
                else if (a == "--top-k" && i + 1 < argc) top_k = std::stoul(argv[++i]);
                else if (a == "--type" && i + 1 < argc) type = argv[++i];
                else if (a == "--min-similarity" && i + 1 < argc) min_similarity = std::stof(argv[++i]);
            }
            if (query.empty()) { usage(); return 2; }
            auto store = open_store();
            auto results = store->search(query, top_k, type_filter(type), min_similarity);
            for (const auto& r : results) {
                std::cout << "[" << r.rank << "] " << r.document.id << "  score=" << r.similarity_score << "\n"
                          << "    " << r.document.content.substr(0, 120) << "\n";
            }
            if (results.empty()) std::cout << "No results\n";
            store->close();
            return 0;
        } else if (cmd == "list") {
            size_t limit = 20, offset = 0;
            std::string type;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--limit" && i + 1 < argc) limit = std::stoul(argv[++i]);
                else if (a == "--offset" && i + 1 < argc) offset = std::stoul(argv[++i]);
                else if (a == "--type" && i + 1 < argc) type = argv[++i];
            }
            auto store = open_store();
            for (const auto& doc : store->list_documents(limit, offset, type_filter(type))) {
                std::cout << doc.id << "\t" << format_timestamp(doc.updated_at) << "\t"
                          << doc.content.substr(0, 60) << "\n";
            }
            store->close();
            return 0;
        } else if (cmd == "delete") {
            std::string id;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--id" && i + 1 < argc) id = argv[++i];
            }
            if (id.empty()) { usage(); return 2; }
            auto store = open_store();
            bool removed = store->delete_document(id);
            std::cout << (removed ? "[OK] Deleted " : "[WARN] Not found: ") << id << "\n";
            store->close();
            return removed ? 0 : 4;
        } else if (cmd == "rebuild") {
            auto store = open_store();
            auto before = store->get_stats();
            store->rebuild_index();
            auto after = store->get_stats();
            std::cout << "[OK] Rebuilt index: " << before.total_vectors << " -> " << after.total_vectors
                      << " vectors\n";
            store->close();
            return 0;
        } else {
            usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}

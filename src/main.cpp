#include <algorithm>
#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "semsearch/errors.hpp"
#include "engine/config.hpp"
#include "engine/pipeline.hpp"
#include "engine/database.hpp"
#include "engine/service.hpp"
#include "engine/dataset.hpp"

using json = nlohmann::json;
using namespace semsearch::engine;

namespace {

    int usage() {
        std::cerr << "Usage: semsearch [--config <path>] <command> [args...]\n"
                  << "Commands:\n"
                  << "  embed <text>                              - Embedding of one text\n"
                  << "  embed-batch <text>...                     - Embeddings of several texts\n"
                  << "  similarity <text1> <text2> [--embeddings] - Cosine similarity of two texts\n"
                  << "  search <query> [--top-k N] [--embeddings] - Rank stored documents (N in 1..50)\n"
                  << "  documents                                 - List stored documents\n"
                  << "  tokenize <text>                           - Subword pieces and model ids\n"
                  << "  ingest <csv> [--reset]                    - Embed and store an id,question,answer CSV\n"
                  << "  init-config <path>                        - Write the default config\n";
        return 1;
    }

    void print_result(const json& data) {
        std::cout << to_wire(success_envelope(data)) << "\n";
    }

    bool take_flag(std::vector<std::string>& args, const std::string& flag) {
        for (auto it = args.begin(); it != args.end(); ++it) {
            if (*it == flag) {
                args.erase(it);
                return true;
            }
        }
        return false;
    }

    std::string take_option(std::vector<std::string>& args, const std::string& key, const std::string& def) {
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == key) {
                if (i + 1 >= args.size()) throw semsearch::InvalidArgument(key + " requires a value");
                std::string value = args[i + 1];
                args.erase(args.begin() + i, args.begin() + i + 2);
                return value;
            }
        }
        return def;
    }

    size_t parse_top_k(const std::string& value) {
        size_t pos = 0;
        long n = 0;
        try {
            n = std::stol(value, &pos);
        } catch (const std::logic_error&) {
            pos = 0;
        }
        if (pos != value.size() || n < 1 || static_cast<size_t>(n) > kMaxTopK) {
            throw semsearch::InvalidArgument("--top-k must be an integer between 1 and " + std::to_string(kMaxTopK) + ", got '" + value + "'");
        }
        return static_cast<size_t>(n);
    }

    void open_store(DocumentStore& store, const Config& config) {
        if (!store.open(config.database_path)) {
            throw semsearch::StorageError("Failed to open database " + config.database_path);
        }
    }

    int run(const Config& config, const std::string& command, std::vector<std::string> args) {
        if (command == "init-config") {
            if (args.size() != 1) return usage();
            config.save(args[0]);
            print_result({{"path", args[0]}});
            return 0;
        }

        bool include_embeddings = take_flag(args, "--embeddings");
        bool reset = take_flag(args, "--reset");
        const bool has_top_k = std::find(args.begin(), args.end(), "--top-k") != args.end();
        std::string top_k_flag = take_option(args, "--top-k", "");

        if (command == "embed" && args.size() != 1) return usage();
        if (command == "embed-batch" && args.empty()) return usage();
        if (command == "similarity" && args.size() != 2) return usage();
        if (command == "search" && args.size() != 1) return usage();
        if (command == "documents" && !args.empty()) return usage();
        if (command == "tokenize" && args.size() != 1) return usage();
        if (command == "ingest" && args.size() != 1) return usage();

        if (command == "documents") {
            DocumentStore store;
            open_store(store, config);
            json docs = json::array();
            for (const auto& d : store.list_all()) docs.push_back(to_json(d, include_embeddings));
            print_result(docs);
            return 0;
        }

        if (command != "embed" && command != "embed-batch" && command != "similarity" &&
            command != "search" && command != "tokenize" && command != "ingest") {
            return usage();
        }

        auto pipeline = create_pipeline(PipelineConfig::from(config));

        if (command == "tokenize") {
            auto seq = pipeline->tokenizer().tokenize(args[0]);
            json tokens = json::array();
            for (const auto& t : seq.tokens) tokens.push_back({{"piece", t.piece}, {"id", t.id}});
            print_result({{"tokens", tokens}, {"truncated", seq.truncated}});
            return 0;
        }

        DocumentStore store;
        open_store(store, config);
        SearchService service(*pipeline, store, config.query_prefix);

        if (command == "embed") {
            print_result(to_json(service.embed(args[0])));
        } else if (command == "embed-batch") {
            json results = json::array();
            for (const auto& r : service.embed_many(args)) results.push_back(to_json(r));
            print_result({{"results", results}, {"totalCount", results.size()}});
        } else if (command == "similarity") {
            print_result(to_json(service.similarity(args[0], args[1]), include_embeddings));
        } else if (command == "search") {
            print_result(to_json(service.search(args[0], !has_top_k ? config.default_top_k : parse_top_k(top_k_flag)), include_embeddings));
        } else if (command == "ingest") {
            if (reset && !store.clear()) throw semsearch::StorageError("Failed to clear documents");
            size_t stored = ingest_csv(args[0], *pipeline, store, config.passage_prefix);
            print_result({{"stored", stored}, {"database", config.database_path}});
        }
        return 0;
    }

}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        std::string config_path = take_option(args, "--config", "semsearch.json");
        if (args.empty()) return usage();

        std::string command = args.front();
        args.erase(args.begin());

        auto config = Config::load(config_path);
        return run(config, command, std::move(args));
    } catch (const semsearch::Error& e) {
        std::cout << to_wire(failure_envelope(e.what())) << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[semsearch] Fatal: " << e.what() << "\n";
        std::cout << to_wire(failure_envelope("Internal server error")) << "\n";
        return 3;
    }
}

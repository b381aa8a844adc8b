#pragma once

#include <cstdlib>
#include <string>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "semsearch/errors.hpp"
#include "tokenizer.hpp"

namespace semsearch::engine {

    enum class PoolingStrategy {
        Cls,  // Hidden state at sequence position 0
        Mean  // Average over every sequence position
    };

    inline std::string to_string(PoolingStrategy p) {
        return p == PoolingStrategy::Mean ? "mean" : "cls";
    }

    inline PoolingStrategy parse_pooling(const std::string& name) {
        if (name == "cls") return PoolingStrategy::Cls;
        if (name == "mean") return PoolingStrategy::Mean;
        throw ConfigError("Unknown pooling strategy '" + name + "' (expected cls or mean)");
    }

    constexpr size_t kMaxTopK = 50;
    constexpr size_t kMaxWorkerThreads = 1024;

    /**
     * @brief Reads a positive integer no larger than max. Negative values are rejected, not wrapped.
     * @throws ConfigError
     */
    inline size_t read_count(const nlohmann::json& j, const std::string& key, size_t max) {
        const auto v = j.at(key).get<long long>();
        if (v <= 0 || static_cast<unsigned long long>(v) > max) {
            throw ConfigError(key + " must be between 1 and " + std::to_string(max) + ", got " + std::to_string(v));
        }
        return static_cast<size_t>(v);
    }

    struct Config {
        std::string model_path = "onnx/model_O4.onnx";
        std::string tokenizer_path = "onnx/sentencepiece.bpe.model";
        std::string database_path = "embeddings.db";

        size_t max_length = 512;
        int intra_op_threads = 20;
        int inter_op_threads = 40;
        size_t worker_threads = 4;

        PoolingStrategy pooling = PoolingStrategy::Cls;
        std::string output_name = "last_hidden_state";

        // E5 models expect these markers in front of the text
        std::string query_prefix = "query: ";
        std::string passage_prefix = "passage: ";
        size_t default_top_k = 5;

        /**
         * @brief Loads the config file, falling back to defaults when it does not exist.
         * Environment variables SEMSEARCH_MODEL, SEMSEARCH_TOKENIZER and SEMSEARCH_DB override paths.
         * @throws ConfigError on malformed JSON or mistyped values.
         */
        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (!path.empty() && std::filesystem::exists(path)) {
                std::ifstream f(path);
                if (!f.is_open()) throw ConfigError("Cannot open config file: " + path.string());

                try {
                    nlohmann::json j = nlohmann::json::parse(f);

                    if (j.contains("model_path")) cfg.model_path = j["model_path"].get<std::string>();
                    if (j.contains("tokenizer_path")) cfg.tokenizer_path = j["tokenizer_path"].get<std::string>();
                    if (j.contains("database_path")) cfg.database_path = j["database_path"].get<std::string>();
                    if (j.contains("max_length")) cfg.max_length = read_count(j, "max_length", kMaxSequenceLength);
                    if (j.contains("intra_op_threads")) cfg.intra_op_threads = j["intra_op_threads"].get<int>();
                    if (j.contains("inter_op_threads")) cfg.inter_op_threads = j["inter_op_threads"].get<int>();
                    if (j.contains("worker_threads")) cfg.worker_threads = read_count(j, "worker_threads", kMaxWorkerThreads);
                    if (j.contains("pooling")) cfg.pooling = parse_pooling(j["pooling"].get<std::string>());
                    if (j.contains("output_name")) cfg.output_name = j["output_name"].get<std::string>();
                    if (j.contains("query_prefix")) cfg.query_prefix = j["query_prefix"].get<std::string>();
                    if (j.contains("passage_prefix")) cfg.passage_prefix = j["passage_prefix"].get<std::string>();
                    if (j.contains("default_top_k")) cfg.default_top_k = read_count(j, "default_top_k", kMaxTopK);
                } catch (const nlohmann::json::exception& e) {
                    throw ConfigError("Invalid config " + path.string() + ": " + e.what());
                }
            }

            if (const char* v = std::getenv("SEMSEARCH_MODEL")) cfg.model_path = v;
            if (const char* v = std::getenv("SEMSEARCH_TOKENIZER")) cfg.tokenizer_path = v;
            if (const char* v = std::getenv("SEMSEARCH_DB")) cfg.database_path = v;

            if (cfg.intra_op_threads <= 0 || cfg.inter_op_threads <= 0) {
                throw ConfigError("intra_op_threads and inter_op_threads must be positive");
            }
            return cfg;
        }

        void save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["model_path"] = model_path;
            j["tokenizer_path"] = tokenizer_path;
            j["database_path"] = database_path;
            j["max_length"] = max_length;
            j["intra_op_threads"] = intra_op_threads;
            j["inter_op_threads"] = inter_op_threads;
            j["worker_threads"] = worker_threads;
            j["pooling"] = to_string(pooling);
            j["output_name"] = output_name;
            j["query_prefix"] = query_prefix;
            j["passage_prefix"] = passage_prefix;
            j["default_top_k"] = default_top_k;

            std::ofstream f(path);
            if (!f.is_open()) throw ConfigError("Cannot write config file: " + path.string());
            f << j.dump(4);
        }
    };

}

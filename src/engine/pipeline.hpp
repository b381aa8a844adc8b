#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "semsearch/types.hpp"
#include "config.hpp"
#include "tokenizer.hpp"
#include "runtime.hpp"

namespace semsearch::engine {

    struct PipelineConfig {
        std::string model_path;
        std::string tokenizer_path;
        size_t max_length = kMaxSequenceLength;
        PoolingStrategy pooling = PoolingStrategy::Cls;
        std::string output_name = "last_hidden_state";
        SessionOptions session;
        size_t worker_threads = 4;

        static PipelineConfig from(const Config& cfg);
    };

    /**
     * @brief text -> tokens -> tensors -> inference -> pooled, unit-length vector.
     */
    class Pipeline {
    public:
        Pipeline(const PipelineConfig& config, std::shared_ptr<SubwordEncoder> encoder, std::shared_ptr<InferenceSession> session);

        /**
         * @brief Embeds one text, blocking until the worker finishes.
         * @throws InvalidArgument on empty text; any tokenizer, runtime or pooling failure unchanged.
         */
        EmbeddingVector embed(const std::string& text) const;

        /**
         * @brief Tokenizes on the calling thread, then runs inference and pooling on a worker.
         */
        std::future<EmbeddingVector> embed_async(const std::string& text) const;

        /**
         * @brief Embeds every text concurrently. All-or-nothing: the first failure in input order is rethrown.
         */
        std::vector<EmbeddingVector> embed_many(const std::vector<std::string>& texts) const;

        const Tokenizer& tokenizer() const { return m_tokenizer; }
        const PipelineConfig& config() const { return m_config; }

        /**
         * @brief Hidden size seen on the last embedding, 0 before the first one.
         */
        size_t dimension() const { return m_dimension->load(); }

    private:
        PipelineConfig m_config;
        Tokenizer m_tokenizer;
        std::shared_ptr<std::atomic<size_t>> m_dimension;
        mutable ModelRuntime m_runtime;
    };

    /**
     * @brief Loads the SentencePiece vocabulary and the ONNX model named by config.
     * @throws ModelArtifactMissing, TokenizerUnavailable
     */
    std::unique_ptr<Pipeline> create_pipeline(const PipelineConfig& config);

}

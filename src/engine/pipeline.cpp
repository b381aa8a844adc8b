#include "pipeline.hpp"
#include "tensors.hpp"
#include "pooling.hpp"
#include "semsearch/errors.hpp"

namespace semsearch::engine {

    PipelineConfig PipelineConfig::from(const Config& cfg) {
        PipelineConfig pc;
        pc.model_path = cfg.model_path;
        pc.tokenizer_path = cfg.tokenizer_path;
        pc.max_length = cfg.max_length;
        pc.pooling = cfg.pooling;
        pc.output_name = cfg.output_name;
        pc.session.intra_op_threads = cfg.intra_op_threads;
        pc.session.inter_op_threads = cfg.inter_op_threads;
        pc.worker_threads = cfg.worker_threads;
        return pc;
    }

    Pipeline::Pipeline(const PipelineConfig& config, std::shared_ptr<SubwordEncoder> encoder, std::shared_ptr<InferenceSession> session)
        : m_config(config),
          m_tokenizer(std::move(encoder), config.max_length),
          m_dimension(std::make_shared<std::atomic<size_t>>(0)),
          m_runtime(std::move(session), config.worker_threads) {}

    EmbeddingVector Pipeline::embed(const std::string& text) const {
        return embed_async(text).get();
    }

    std::future<EmbeddingVector> Pipeline::embed_async(const std::string& text) const {
        if (text.empty()) throw InvalidArgument("Text cannot be empty");

        auto tokens = m_tokenizer.tokenize(text);
        auto tensors = build_input_tensors(tokens.ids());

        auto strategy = m_config.pooling;
        auto output_name = m_config.output_name;
        auto dimension = m_dimension;
        return m_runtime.run_then(tensors.to_named(), {output_name},
            [strategy, output_name, dimension](InferenceOutputs outputs) {
                auto v = pool_and_normalize(outputs, strategy, output_name);
                dimension->store(v.size());
                return v;
            });
    }

    std::vector<EmbeddingVector> Pipeline::embed_many(const std::vector<std::string>& texts) const {
        if (texts.empty()) throw InvalidArgument("Texts cannot be empty");
        for (size_t i = 0; i < texts.size(); ++i) {
            if (texts[i].empty()) throw InvalidArgument("Text at index " + std::to_string(i) + " cannot be empty");
        }

        std::vector<std::future<EmbeddingVector>> pending;
        pending.reserve(texts.size());
        for (const auto& text : texts) {
            pending.push_back(embed_async(text));
        }

        // Let every submitted job finish before surfacing a failure
        for (auto& f : pending) f.wait();

        std::vector<EmbeddingVector> out;
        out.reserve(texts.size());
        for (auto& f : pending) out.push_back(f.get());
        return out;
    }

}

#include "pipeline.hpp"
#include <iostream>

namespace semsearch::engine {

    std::unique_ptr<Pipeline> create_pipeline(const PipelineConfig& config) {
        auto encoder = create_sentencepiece_encoder(config.tokenizer_path);
        auto session = create_onnx_session(config.model_path, config.session);

        std::clog << "[Pipeline] Ready (pooling " << to_string(config.pooling) << ", max length "
                  << config.max_length << ", " << config.worker_threads << " workers)\n";
        return std::make_unique<Pipeline>(config, std::move(encoder), std::move(session));
    }

}

#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace semsearch::engine {

    using EmbeddingVector = std::vector<float>;

    struct Token {
        std::string piece;
        int64_t id;
    };

    /**
     * @brief Remapped model ids for one input text, bounded by the maximum sequence length.
     */
    struct TokenSequence {
        std::vector<Token> tokens;
        bool truncated = false;

        std::vector<int64_t> ids() const {
            std::vector<int64_t> out;
            out.reserve(tokens.size());
            for (const auto& t : tokens) out.push_back(t.id);
            return out;
        }

        size_t size() const { return tokens.size(); }
    };

    struct IntTensor {
        std::vector<int64_t> shape;
        std::vector<int64_t> data;
    };

    struct FloatTensor {
        std::vector<int64_t> shape;
        std::vector<float> data;
    };

    using NamedInputs = std::map<std::string, IntTensor>;
    using InferenceOutputs = std::map<std::string, FloatTensor>;

    struct Document {
        int64_t id = 0;
        std::string question;
        std::string answer;
        std::string combined_text;
        EmbeddingVector embedding;
        int embedding_dimensions = 0;
        std::string created_at;
    };

    struct SimilarityResult {
        const Document* document;
        float score;
    };

}

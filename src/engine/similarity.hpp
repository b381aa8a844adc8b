#pragma once

#include <vector>
#include "semsearch/types.hpp"

namespace semsearch::engine {

    /**
     * @brief dot(a, b) / (|a| |b|), clamped to [-1, 1]. 0 when either vector has zero norm.
     * @throws InvalidArgument if the vectors differ in length.
     */
    float cosine_similarity(const EmbeddingVector& a, const EmbeddingVector& b);

    /**
     * @brief Scores every document against query and keeps the top_k best.
     *
     * Full scan, sorted by descending score. Equal scores keep the order of documents.
     * top_k beyond documents.size() returns everything. Results point into documents.
     */
    std::vector<SimilarityResult> search(const EmbeddingVector& query, const std::vector<Document>& documents, size_t top_k);

}

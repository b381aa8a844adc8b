#include "similarity.hpp"
#include "semsearch/errors.hpp"
#include <algorithm>
#include <cmath>

namespace semsearch::engine {

    float cosine_similarity(const EmbeddingVector& a, const EmbeddingVector& b) {
        if (a.size() != b.size()) {
            throw InvalidArgument("Vectors must have the same dimensions (" + std::to_string(a.size()) +
                                  " vs " + std::to_string(b.size()) + ")");
        }

        double dot = 0.0, na = 0.0, nb = 0.0;
        for (size_t i = 0; i < a.size(); ++i) {
            double x = a[i], y = b[i];
            dot += x * y;
            na += x * x;
            nb += y * y;
        }
        if (na == 0.0 || nb == 0.0) return 0.0f;

        double s = dot / (std::sqrt(na) * std::sqrt(nb));
        return static_cast<float>(std::clamp(s, -1.0, 1.0));
    }

    std::vector<SimilarityResult> search(const EmbeddingVector& query, const std::vector<Document>& documents, size_t top_k) {
        std::vector<SimilarityResult> hits;
        hits.reserve(documents.size());
        for (const auto& doc : documents) {
            hits.push_back({&doc, cosine_similarity(query, doc.embedding)});
        }

        std::stable_sort(hits.begin(), hits.end(),
                         [](const SimilarityResult& a, const SimilarityResult& b) { return a.score > b.score; });

        if (hits.size() > top_k) hits.resize(top_k);
        return hits;
    }

}

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "semsearch/types.hpp"
#include "pipeline.hpp"
#include "database.hpp"

namespace semsearch::engine {

    struct EmbeddingReport {
        std::string text;
        EmbeddingVector embedding;
    };

    struct SimilarityReport {
        std::string text1;
        std::string text2;
        float similarity = 0.0f;
        EmbeddingVector embedding1;
        EmbeddingVector embedding2;
    };

    struct RankedDocument {
        Document document;
        float similarity;
    };

    struct SearchReport {
        std::string query_text;
        EmbeddingVector query_embedding;
        std::vector<RankedDocument> results;
        size_t total_documents = 0;
    };

    /**
     * @brief Upward facing operations over one pipeline and one document store.
     * Queries get the query prefix; plain embed calls embed the text as given.
     */
    class SearchService {
    public:
        SearchService(const Pipeline& pipeline, DocumentStore& store, std::string query_prefix = "query: ");

        EmbeddingReport embed(const std::string& text) const;
        std::vector<EmbeddingReport> embed_many(const std::vector<std::string>& texts) const;
        SimilarityReport similarity(const std::string& text1, const std::string& text2) const;
        SearchReport search(const std::string& query_text, size_t top_k) const;
        std::vector<Document> documents() const;

    private:
        const Pipeline& m_pipeline;
        DocumentStore& m_store;
        std::string m_query_prefix;
    };

    nlohmann::json to_json(const Document& doc, bool include_embedding);
    nlohmann::json to_json(const EmbeddingReport& r);
    nlohmann::json to_json(const SimilarityReport& r, bool include_embeddings);
    nlohmann::json to_json(const SearchReport& r, bool include_embeddings);

    nlohmann::json success_envelope(const nlohmann::json& data);
    nlohmann::json failure_envelope(const std::string& message);

    /**
     * @brief Compact serialization for replies. Invalid UTF-8 in echoed text is replaced, never thrown on.
     */
    std::string to_wire(const nlohmann::json& j);

}

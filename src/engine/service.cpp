#include "service.hpp"
#include "similarity.hpp"
#include "semsearch/errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace semsearch::engine {

    namespace {

        bool is_blank(const std::string& s) {
            return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        }

    }

    SearchService::SearchService(const Pipeline& pipeline, DocumentStore& store, std::string query_prefix)
        : m_pipeline(pipeline), m_store(store), m_query_prefix(std::move(query_prefix)) {}

    EmbeddingReport SearchService::embed(const std::string& text) const {
        if (is_blank(text)) throw InvalidArgument("Text cannot be null or empty");
        return {text, m_pipeline.embed(text)};
    }

    std::vector<EmbeddingReport> SearchService::embed_many(const std::vector<std::string>& texts) const {
        if (texts.empty()) throw InvalidArgument("Texts cannot be null or empty");

        std::clog << "[SearchService] Generating embeddings for " << texts.size() << " texts\n";
        auto vectors = m_pipeline.embed_many(texts);

        std::vector<EmbeddingReport> out;
        out.reserve(texts.size());
        for (size_t i = 0; i < texts.size(); ++i) {
            out.push_back({texts[i], std::move(vectors[i])});
        }
        return out;
    }

    SimilarityReport SearchService::similarity(const std::string& text1, const std::string& text2) const {
        if (is_blank(text1) || is_blank(text2)) throw InvalidArgument("Both texts must be provided");

        auto vectors = m_pipeline.embed_many({m_query_prefix + text1, m_query_prefix + text2});

        SimilarityReport r;
        r.text1 = text1;
        r.text2 = text2;
        r.similarity = cosine_similarity(vectors[0], vectors[1]);
        r.embedding1 = std::move(vectors[0]);
        r.embedding2 = std::move(vectors[1]);
        return r;
    }

    SearchReport SearchService::search(const std::string& query_text, size_t top_k) const {
        if (is_blank(query_text)) throw InvalidArgument("Query text cannot be null or empty");

        SearchReport r;
        r.query_text = query_text;
        r.query_embedding = m_pipeline.embed(m_query_prefix + query_text);

        auto docs = m_store.list_all();
        r.total_documents = docs.size();

        for (const auto& hit : engine::search(r.query_embedding, docs, top_k)) {
            r.results.push_back({*hit.document, hit.score});
        }
        std::clog << "[SearchService] Ranked " << docs.size() << " documents, returning " << r.results.size() << "\n";
        return r;
    }

    std::vector<Document> SearchService::documents() const {
        return m_store.list_all();
    }

    nlohmann::json to_json(const Document& doc, bool include_embedding) {
        nlohmann::json j = {
            {"id", doc.id},
            {"question", doc.question},
            {"answer", doc.answer},
            {"combinedText", doc.combined_text},
            {"embeddingDimensions", doc.embedding_dimensions},
            {"createdAt", doc.created_at}
        };
        if (include_embedding) j["embedding"] = doc.embedding;
        return j;
    }

    nlohmann::json to_json(const EmbeddingReport& r) {
        return {
            {"text", r.text},
            {"embedding", r.embedding},
            {"dimensions", r.embedding.size()}
        };
    }

    nlohmann::json to_json(const SimilarityReport& r, bool include_embeddings) {
        nlohmann::json j = {
            {"text1", r.text1},
            {"text2", r.text2},
            {"similarity", r.similarity}
        };
        if (include_embeddings) {
            j["embedding1"] = r.embedding1;
            j["embedding2"] = r.embedding2;
        }
        return j;
    }

    nlohmann::json to_json(const SearchReport& r, bool include_embeddings) {
        nlohmann::json results = nlohmann::json::array();
        for (const auto& hit : r.results) {
            results.push_back({
                {"document", to_json(hit.document, include_embeddings)},
                {"similarity", hit.similarity}
            });
        }

        nlohmann::json j = {
            {"queryText", r.query_text},
            {"results", results},
            {"totalDocuments", r.total_documents},
            {"resultCount", r.results.size()}
        };
        if (include_embeddings) j["queryEmbedding"] = r.query_embedding;
        return j;
    }

    nlohmann::json success_envelope(const nlohmann::json& data) {
        return {{"success", true}, {"data", data}};
    }

    nlohmann::json failure_envelope(const std::string& message) {
        return {{"success", false}, {"error", message}};
    }

    std::string to_wire(const nlohmann::json& j) {
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

}

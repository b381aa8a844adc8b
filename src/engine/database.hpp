#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <sqlite3.h>
#include "semsearch/types.hpp"

namespace semsearch::engine {

    /**
     * @brief SQLite-backed collection of documents with precomputed embeddings.
     */
    class DocumentStore {
    public:
        DocumentStore();
        ~DocumentStore();

        DocumentStore(const DocumentStore&) = delete;
        DocumentStore& operator=(const DocumentStore&) = delete;

        /**
         * @brief Opens (or creates) the database and ensures the schema. ":memory:" is accepted.
         */
        bool open(const std::filesystem::path& path);
        void close();

        bool is_open() const { return m_db != nullptr; }

        /**
         * @brief Initializes the schema if it doesn't exist.
         */
        bool initialize_schema();

        /**
         * @brief Removes every stored document.
         */
        bool clear();

        /**
         * @brief Inserts or replaces a document. The embedding is stored as a JSON array.
         */
        bool insert_document(const Document& doc);

        int64_t count();

        /**
         * @brief All documents ordered by id.
         * @throws StorageError on SQL failure or an undecodable embedding.
         */
        std::vector<Document> list_all();

    private:
        sqlite3* m_db = nullptr;

        void require_open() const;
    };

}

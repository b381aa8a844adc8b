#include "database.hpp"
#include "semsearch/errors.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace semsearch::engine {

    namespace {

        std::string column_text(sqlite3_stmt* stmt, int col) {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            return text ? reinterpret_cast<const char*>(text) : std::string();
        }

    }

    DocumentStore::DocumentStore() = default;
    DocumentStore::~DocumentStore() { close(); }

    bool DocumentStore::open(const std::filesystem::path& path) {
        close();
        if (sqlite3_open(path.string().c_str(), &m_db) != SQLITE_OK) {
            std::cerr << "[DocumentStore] Failed to open " << path << ": " << sqlite3_errmsg(m_db) << "\n";
            close();
            return false;
        }
        return initialize_schema();
    }

    void DocumentStore::close() {
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    void DocumentStore::require_open() const {
        if (!m_db) throw StorageError("Document store is not open");
    }

    bool DocumentStore::initialize_schema() {
        require_open();
        const char* sql =
            "CREATE TABLE IF NOT EXISTS documents ("
            "  id INTEGER PRIMARY KEY,"
            "  question TEXT NOT NULL,"
            "  answer TEXT NOT NULL,"
            "  combined_text TEXT NOT NULL,"
            "  embedding TEXT NOT NULL,"
            "  embedding_dimensions INTEGER NOT NULL,"
            "  created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_documents_created_at ON documents(created_at);"
            "CREATE INDEX IF NOT EXISTS idx_documents_question ON documents(question);";
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::cerr << "[DocumentStore] Schema error: " << (err_msg ? err_msg : "unknown") << "\n";
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool DocumentStore::clear() {
        require_open();
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, "DELETE FROM documents;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::cerr << "[DocumentStore] Clear failed: " << (err_msg ? err_msg : "unknown") << "\n";
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool DocumentStore::insert_document(const Document& doc) {
        require_open();
        const char* sql =
            "INSERT OR REPLACE INTO documents (id, question, answer, combined_text, embedding, embedding_dimensions) "
            "VALUES (?, ?, ?, ?, ?, ?);";

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "[DocumentStore] Prepare failed: " << sqlite3_errmsg(m_db) << "\n";
            return false;
        }

        std::string embedding_json = nlohmann::json(doc.embedding).dump();

        sqlite3_bind_int64(stmt, 1, doc.id);
        sqlite3_bind_text(stmt, 2, doc.question.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, doc.answer.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, doc.combined_text.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, embedding_json.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 6, static_cast<int>(doc.embedding.size()));

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        if (!success) {
            std::cerr << "[DocumentStore] Insert of document " << doc.id << " failed: " << sqlite3_errmsg(m_db) << "\n";
        }
        sqlite3_finalize(stmt);
        return success;
    }

    int64_t DocumentStore::count() {
        require_open();
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM documents;", -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("Count failed: ") + sqlite3_errmsg(m_db));
        }
        int64_t n = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) n = sqlite3_column_int64(stmt, 0);
        sqlite3_finalize(stmt);
        return n;
    }

    std::vector<Document> DocumentStore::list_all() {
        require_open();
        const char* sql =
            "SELECT id, question, answer, combined_text, embedding, embedding_dimensions, created_at "
            "FROM documents ORDER BY id;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("Failed to query documents: ") + sqlite3_errmsg(m_db));
        }

        std::vector<Document> docs;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            Document doc;
            doc.id = sqlite3_column_int64(stmt, 0);
            doc.question = column_text(stmt, 1);
            doc.answer = column_text(stmt, 2);
            doc.combined_text = column_text(stmt, 3);
            doc.embedding_dimensions = sqlite3_column_int(stmt, 5);
            doc.created_at = column_text(stmt, 6);

            try {
                doc.embedding = nlohmann::json::parse(column_text(stmt, 4)).get<EmbeddingVector>();
            } catch (const nlohmann::json::exception& e) {
                sqlite3_finalize(stmt);
                throw StorageError("Document " + std::to_string(doc.id) + " has a malformed embedding: " + e.what());
            }

            if (static_cast<size_t>(doc.embedding_dimensions) != doc.embedding.size()) {
                std::cerr << "[DocumentStore] Document " << doc.id << " declares " << doc.embedding_dimensions
                          << " dimensions but stores " << doc.embedding.size() << "\n";
            }
            docs.push_back(std::move(doc));
        }

        if (rc != SQLITE_DONE) {
            std::string err = sqlite3_errmsg(m_db);
            sqlite3_finalize(stmt);
            throw StorageError("Failed to read documents: " + err);
        }
        sqlite3_finalize(stmt);
        return docs;
    }

}

#include "dataset.hpp"
#include "semsearch/errors.hpp"
#include <fstream>
#include <iostream>

namespace semsearch::engine {

    std::vector<std::string> parse_csv_line(const std::string& line) {
        std::vector<std::string> fields;
        std::string current;
        bool in_quotes = false;

        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (c == '"') {
                if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    in_quotes = !in_quotes;
                }
            } else if (c == ',' && !in_quotes) {
                fields.push_back(std::move(current));
                current.clear();
            } else if (c == '\r' && i + 1 == line.size()) {
                // CRLF line ending
            } else {
                current.push_back(c);
            }
        }
        fields.push_back(std::move(current));
        return fields;
    }

    size_t ingest_csv(const std::filesystem::path& csv_path, const Pipeline& pipeline, DocumentStore& store,
                      const std::string& passage_prefix) {
        std::ifstream in(csv_path);
        if (!in.is_open()) throw InvalidArgument("Dataset file not found at " + csv_path.string());

        std::string line;
        std::getline(in, line); // header

        size_t line_no = 1;
        size_t stored = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.empty() || line == "\r") continue;

            auto parts = parse_csv_line(line);
            if (parts.size() < 3) {
                std::cerr << "[Ingest] Skipping line " << line_no << ": expected id,question,answer\n";
                continue;
            }

            Document doc;
            try {
                size_t pos = 0;
                doc.id = std::stoll(parts[0], &pos);
                if (pos != parts[0].size()) throw std::invalid_argument(parts[0]);
            } catch (const std::logic_error&) {
                throw InvalidArgument("Line " + std::to_string(line_no) + ": id '" + parts[0] + "' is not a number");
            }
            doc.question = parts[1];
            doc.answer = parts[2];
            doc.combined_text = doc.question + " : " + doc.answer;

            std::clog << "[Ingest] Processing entry " << doc.id << ": " << doc.question << "\n";
            doc.embedding = pipeline.embed(passage_prefix + doc.combined_text);
            doc.embedding_dimensions = static_cast<int>(doc.embedding.size());

            if (!store.insert_document(doc)) {
                throw StorageError("Failed to store document " + std::to_string(doc.id));
            }
            ++stored;
        }

        std::clog << "[Ingest] Stored " << stored << " document embeddings\n";
        return stored;
    }

}

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "pipeline.hpp"
#include "database.hpp"

namespace semsearch::engine {

    /**
     * @brief Splits one CSV line on commas outside double quotes.
     * Quotes delimit fields and are dropped; "" inside a quoted field yields a literal quote.
     */
    std::vector<std::string> parse_csv_line(const std::string& line);

    /**
     * @brief Embeds every id,question,answer row of a CSV file (header skipped) and stores it.
     * Each document embeds passage_prefix + "question : answer".
     * @return Number of stored documents.
     * @throws InvalidArgument if the file cannot be read or an id is not numeric.
     */
    size_t ingest_csv(const std::filesystem::path& csv_path, const Pipeline& pipeline, DocumentStore& store,
                      const std::string& passage_prefix);

}

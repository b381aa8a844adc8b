#include "tokenizer.hpp"
#include "semsearch/errors.hpp"
#include <iostream>

namespace semsearch::engine {

    std::vector<Token> remap_token_ids(std::vector<Token> tokens, const std::string& start_marker, const std::string& end_marker) {
        for (size_t i = 0; i < tokens.size(); ++i) {
            Token& t = tokens[i];
            if (i == 0 && t.piece == start_marker) {
                t.id = 0;
            } else if (t.piece == end_marker) {
                continue;
            } else {
                t.id += 1;
            }
        }
        return tokens;
    }

    Tokenizer::Tokenizer(std::shared_ptr<SubwordEncoder> encoder, size_t max_length)
        : m_encoder(std::move(encoder)), m_max_length(max_length) {
        if (!m_encoder) throw TokenizerUnavailable("Tokenizer created without an encoder");
        if (m_max_length == 0) throw InvalidArgument("Tokenizer max_length must be positive");
    }

    TokenSequence Tokenizer::tokenize(const std::string& text) const {
        if (text.empty()) throw InvalidArgument("Text cannot be empty");

        TokenSequence seq;
        seq.tokens = remap_token_ids(m_encoder->encode(text), m_encoder->start_marker(), m_encoder->end_marker());

        if (seq.tokens.size() > m_max_length) {
            seq.tokens.resize(m_max_length);
            seq.truncated = true;
            std::cerr << "[Tokenizer] Truncated sequence to " << m_max_length << " tokens\n";
        }
        return seq;
    }

    std::vector<std::string> Tokenizer::tokenize_to_pieces(const std::string& text) const {
        if (text.empty()) throw InvalidArgument("Text cannot be empty");

        std::vector<std::string> pieces;
        for (const auto& t : m_encoder->encode(text)) pieces.push_back(t.piece);
        return pieces;
    }

}

#pragma once

#include <string>
#include <vector>
#include <memory>
#include "semsearch/types.hpp"

namespace semsearch::engine {

    constexpr size_t kMaxSequenceLength = 512;

    /**
     * @brief Narrow capability over a subword vocabulary: text in, native (piece, id) pairs out.
     * Native ids are the vocabulary's own, before any model specific remapping.
     */
    class SubwordEncoder {
    public:
        virtual ~SubwordEncoder() = default;

        /**
         * @brief Encodes text including the start and end markers.
         */
        virtual std::vector<Token> encode(const std::string& text) const = 0;

        virtual std::string start_marker() const = 0;
        virtual std::string end_marker() const = 0;
    };

    /**
     * @brief Loads a SentencePiece model file.
     * @throws TokenizerUnavailable if the file is missing or cannot be parsed.
     */
    std::shared_ptr<SubwordEncoder> create_sentencepiece_encoder(const std::string& model_path);

    /**
     * @brief Applies the encoder-specific id offset.
     *
     * The encoder's embedding table reserves index 0 for the start marker while the
     * vocabulary does not: a leading start marker becomes 0, an end marker keeps its
     * native id, every other token is shifted by one.
     */
    std::vector<Token> remap_token_ids(std::vector<Token> tokens, const std::string& start_marker, const std::string& end_marker);

    class Tokenizer {
    public:
        explicit Tokenizer(std::shared_ptr<SubwordEncoder> encoder, size_t max_length = kMaxSequenceLength);

        /**
         * @brief Encodes, remaps and truncates text to at most max_length tokens.
         * @throws InvalidArgument on empty text.
         */
        TokenSequence tokenize(const std::string& text) const;

        /**
         * @brief Raw subword pieces for inspection, no remapping or truncation.
         */
        std::vector<std::string> tokenize_to_pieces(const std::string& text) const;

        size_t max_length() const { return m_max_length; }

    private:
        std::shared_ptr<SubwordEncoder> m_encoder;
        size_t m_max_length;
    };

}

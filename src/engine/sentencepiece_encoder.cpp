#include "tokenizer.hpp"
#include "semsearch/errors.hpp"
#include <filesystem>
#include <iostream>
#include <sentencepiece_processor.h>

namespace semsearch::engine {

    class SentencePieceEncoder : public SubwordEncoder {
    public:
        explicit SentencePieceEncoder(const std::string& model_path) {
            if (!std::filesystem::exists(model_path)) {
                throw TokenizerUnavailable("Tokenizer model not found at " + model_path);
            }

            auto status = m_sp.Load(model_path);
            if (!status.ok()) {
                throw TokenizerUnavailable("Failed to load tokenizer model " + model_path + ": " + status.ToString());
            }

            // Surround every encoding with <s> ... </s>
            status = m_sp.SetEncodeExtraOptions("bos:eos");
            if (!status.ok()) {
                throw TokenizerUnavailable("Tokenizer model " + model_path + " rejects bos/eos markers: " + status.ToString());
            }

            if (m_sp.bos_id() < 0 || m_sp.eos_id() < 0) {
                throw TokenizerUnavailable("Tokenizer model " + model_path + " defines no start/end markers");
            }
            m_start = m_sp.IdToPiece(m_sp.bos_id());
            m_end = m_sp.IdToPiece(m_sp.eos_id());

            std::clog << "[Tokenizer] Loaded: " << model_path << " (" << m_sp.GetPieceSize() << " pieces)\n";
        }

        std::vector<Token> encode(const std::string& text) const override {
            std::vector<int> ids;
            auto status = m_sp.Encode(text, &ids);
            if (!status.ok()) {
                throw InvalidArgument("Tokenizer could not encode text: " + status.ToString());
            }

            std::vector<Token> tokens;
            tokens.reserve(ids.size());
            for (int id : ids) {
                tokens.push_back({m_sp.IdToPiece(id), static_cast<int64_t>(id)});
            }
            return tokens;
        }

        std::string start_marker() const override { return m_start; }
        std::string end_marker() const override { return m_end; }

    private:
        sentencepiece::SentencePieceProcessor m_sp;
        std::string m_start;
        std::string m_end;
    };

    std::shared_ptr<SubwordEncoder> create_sentencepiece_encoder(const std::string& model_path) {
        return std::make_shared<SentencePieceEncoder>(model_path);
    }

}

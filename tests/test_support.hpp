#pragma once
#undef NDEBUG
#include <atomic>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "engine/tokenizer.hpp"
#include "engine/runtime.hpp"
#include "semsearch/errors.hpp"

namespace semsearch::test {

    using namespace semsearch::engine;

    constexpr float EPSILON = 1e-5f;

    inline bool approx_equal(double a, double b, double eps = EPSILON) {
        return std::fabs(a - b) <= eps;
    }

    inline double l2_norm(const std::vector<float>& v) {
        double ss = 0.0;
        for (float x : v) ss += static_cast<double>(x) * x;
        return std::sqrt(ss);
    }

    template <typename E, typename F>
    bool throws(F&& fn) {
        try {
            fn();
        } catch (const E&) {
            return true;
        }
        return false;
    }

    template <typename E, typename F>
    std::string error_message(F&& fn) {
        try {
            fn();
        } catch (const E& e) {
            return e.what();
        }
        return "";
    }

    /**
     * Whitespace splitting encoder with SentencePiece style markers: <s> = 1, </s> = 2,
     * words hashed into [3, 30003).
     */
    class FakeEncoder : public SubwordEncoder {
    public:
        static int64_t word_id(const std::string& word) {
            uint32_t h = 2166136261u;
            for (unsigned char c : word) {
                h ^= c;
                h *= 16777619u;
            }
            return 3 + static_cast<int64_t>(h % 30000u);
        }

        std::vector<Token> encode(const std::string& text) const override {
            std::vector<Token> tokens;
            tokens.push_back({"<s>", 1});
            std::istringstream ss(text);
            std::string word;
            while (ss >> word) tokens.push_back({word, word_id(word)});
            tokens.push_back({"</s>", 2});
            return tokens;
        }

        std::string start_marker() const override { return "<s>"; }
        std::string end_marker() const override { return "</s>"; }
    };

    /**
     * Deterministic stand-in for an encoder model. The first sequence position mixes every
     * input id, so equal inputs give equal vectors and different inputs usually do not.
     */
    class FakeSession : public InferenceSession {
    public:
        size_t hidden = 8;
        bool zero_output = false;
        bool drop_outputs = false;
        bool flat_output = false;
        mutable std::atomic<int> calls{0};

        std::vector<std::string> input_names() const override {
            return {"input_ids", "attention_mask", "token_type_ids"};
        }

        std::vector<std::string> output_names() const override {
            return {"last_hidden_state", "pooler_output"};
        }

        std::vector<FloatTensor> run(const NamedInputs& inputs, const std::vector<std::string>& outputs) const override {
            ++calls;
            const auto& ids = inputs.at("input_ids").data;
            const size_t seq = ids.size();

            std::vector<FloatTensor> out;
            for (const auto& name : outputs) {
                FloatTensor t;
                if (name == "pooler_output") {
                    t.shape = {1, static_cast<int64_t>(hidden)};
                    t.data.assign(hidden, 0.5f);
                } else {
                    t.shape = flat_output ? std::vector<int64_t>{1, static_cast<int64_t>(seq * hidden)}
                                          : std::vector<int64_t>{1, static_cast<int64_t>(seq), static_cast<int64_t>(hidden)};
                    t.data.assign(seq * hidden, 0.0f);
                    if (!zero_output) {
                        for (size_t h = 0; h < hidden; ++h) {
                            double acc = 0.0;
                            for (size_t p = 0; p < seq; ++p) acc += std::sin(ids[p] * 0.37 * (h + 1) + p);
                            t.data[h] = static_cast<float>(acc);
                        }
                        for (size_t p = 1; p < seq; ++p) {
                            for (size_t h = 0; h < hidden; ++h) {
                                t.data[p * hidden + h] = static_cast<float>(std::cos(ids[p] * (h + 1.0)));
                            }
                        }
                    }
                }
                out.push_back(std::move(t));
            }
            if (drop_outputs && !out.empty()) out.pop_back();
            return out;
        }
    };

}

#include "pooling.hpp"
#include "semsearch/errors.hpp"
#include <cmath>
#include <sstream>

namespace semsearch::engine {

    namespace {

        std::string shape_to_string(const std::vector<int64_t>& shape) {
            std::ostringstream out;
            out << "[";
            for (size_t i = 0; i < shape.size(); ++i) {
                if (i > 0) out << ", ";
                out << shape[i];
            }
            out << "]";
            return out.str();
        }

    }

    EmbeddingVector pool(const FloatTensor& hidden_state, PoolingStrategy strategy) {
        const auto& shape = hidden_state.shape;
        if (shape.size() != 3) {
            throw InternalError("Unexpected shape for hidden state: " + shape_to_string(shape));
        }
        if (shape[0] < 1 || shape[1] < 1 || shape[2] < 1) {
            throw InternalError("Empty hidden state: " + shape_to_string(shape));
        }

        const size_t seq_length = static_cast<size_t>(shape[1]);
        const size_t hidden_size = static_cast<size_t>(shape[2]);
        if (hidden_state.data.size() < seq_length * hidden_size) {
            throw InternalError("Hidden state holds " + std::to_string(hidden_state.data.size()) +
                                " values, shape " + shape_to_string(shape) + " needs more");
        }

        const float* data = hidden_state.data.data();
        EmbeddingVector pooled(hidden_size, 0.0f);

        if (strategy == PoolingStrategy::Cls) {
            // Start marker sits at sequence position 0
            for (size_t j = 0; j < hidden_size; ++j) pooled[j] = data[j];
            return pooled;
        }

        std::vector<double> sum(hidden_size, 0.0);
        for (size_t i = 0; i < seq_length; ++i) {
            const float* row = data + i * hidden_size;
            for (size_t j = 0; j < hidden_size; ++j) sum[j] += row[j];
        }
        for (size_t j = 0; j < hidden_size; ++j) {
            pooled[j] = static_cast<float>(sum[j] / static_cast<double>(seq_length));
        }
        return pooled;
    }

    EmbeddingVector normalize(EmbeddingVector v) {
        double ss = 0.0;
        for (float x : v) ss += static_cast<double>(x) * static_cast<double>(x);
        const double norm = std::sqrt(ss);
        if (norm <= 1e-12) return v;

        for (float& x : v) x = static_cast<float>(x / norm);
        return v;
    }

    EmbeddingVector pool_and_normalize(const InferenceOutputs& outputs, PoolingStrategy strategy, const std::string& output_name) {
        auto it = outputs.find(output_name);
        if (it == outputs.end()) {
            throw InternalError("Inference outputs do not contain '" + output_name + "'");
        }
        return normalize(pool(it->second, strategy));
    }

}

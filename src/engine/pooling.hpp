#pragma once

#include <string>
#include "semsearch/types.hpp"
#include "config.hpp"

namespace semsearch::engine {

    /**
     * @brief Reduces a [batch, seq, hidden] tensor to one hidden-size vector of the first batch row.
     * @throws InternalError if the tensor rank is not 3 or its data is shorter than its shape.
     */
    EmbeddingVector pool(const FloatTensor& hidden_state, PoolingStrategy strategy);

    /**
     * @brief Scales v to unit L2 norm. Vectors with norm <= 1e-12 are returned unchanged.
     */
    EmbeddingVector normalize(EmbeddingVector v);

    /**
     * @brief Looks up output_name in outputs, pools and normalizes it.
     * @throws InternalError if the output is absent or malformed.
     */
    EmbeddingVector pool_and_normalize(const InferenceOutputs& outputs, PoolingStrategy strategy,
                                       const std::string& output_name = "last_hidden_state");

}

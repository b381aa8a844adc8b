#pragma once

#include <vector>
#include <cstdint>
#include "semsearch/types.hpp"

namespace semsearch::engine {

    /**
     * @brief The three parallel inputs of the encoder, all shaped [1, L].
     */
    struct ModelInputTensors {
        std::vector<int64_t> input_ids;
        std::vector<int64_t> attention_mask;
        std::vector<int64_t> token_type_ids;

        std::vector<int64_t> shape() const { return {1, static_cast<int64_t>(input_ids.size())}; }

        /**
         * @brief Named form handed to the runtime adapter.
         */
        NamedInputs to_named() const;
    };

    /**
     * @brief Builds an all-ones attention mask and all-zeros segment ids matching ids.
     */
    ModelInputTensors build_input_tensors(std::vector<int64_t> ids);

}

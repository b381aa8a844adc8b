#include "tensors.hpp"

namespace semsearch::engine {

    NamedInputs ModelInputTensors::to_named() const {
        const auto s = shape();
        return {
            { "input_ids", { s, input_ids } },
            { "attention_mask", { s, attention_mask } },
            { "token_type_ids", { s, token_type_ids } }
        };
    }

    ModelInputTensors build_input_tensors(std::vector<int64_t> ids) {
        ModelInputTensors t;
        const size_t seq_length = ids.size();
        t.input_ids = std::move(ids);
        t.attention_mask.assign(seq_length, 1);
        t.token_type_ids.assign(seq_length, 0);
        return t;
    }

}

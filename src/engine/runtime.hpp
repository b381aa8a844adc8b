#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>
#include "semsearch/types.hpp"
#include "semsearch/errors.hpp"
#include "worker_pool.hpp"

namespace semsearch::engine {

    /**
     * @brief Narrow capability over a loaded encoder model.
     * Implementations must allow concurrent run() calls.
     */
    class InferenceSession {
    public:
        virtual ~InferenceSession() = default;

        virtual std::vector<std::string> input_names() const = 0;
        virtual std::vector<std::string> output_names() const = 0;

        /**
         * @brief Runs the model synchronously.
         * @return One tensor per requested output, in request order.
         */
        virtual std::vector<FloatTensor> run(const NamedInputs& inputs, const std::vector<std::string>& outputs) const = 0;
    };

    struct SessionOptions {
        int intra_op_threads = 20;
        int inter_op_threads = 40;
    };

    /**
     * @brief Opens an ONNX model.
     * @throws ModelArtifactMissing if the file is absent or ONNX Runtime cannot load it.
     */
    std::shared_ptr<InferenceSession> create_onnx_session(const std::string& model_path, const SessionOptions& options);

    /**
     * @brief Checks that inputs names exactly the declared set.
     * Unexpected and missing names are reported together, along with the valid ones.
     * @throws InvalidArgument
     */
    void validate_input_names(const NamedInputs& inputs, const std::vector<std::string>& declared);

    /**
     * @throws InvalidArgument if any wanted name is not produced by the session.
     */
    void validate_output_names(const std::vector<std::string>& wanted, const std::vector<std::string>& declared);

    /**
     * @brief Validated, asynchronous front of an InferenceSession.
     *
     * Argument checks run on the calling thread and throw immediately. Inference
     * runs on the worker pool; its failures arrive through the returned future.
     */
    class ModelRuntime {
    public:
        ModelRuntime(std::shared_ptr<InferenceSession> session, size_t worker_threads);

        std::future<InferenceOutputs> run(NamedInputs inputs, std::vector<std::string> wanted_outputs = {}) {
            return run_then(std::move(inputs), std::move(wanted_outputs), [](InferenceOutputs outputs) { return outputs; });
        }

        /**
         * @brief Runs inference, then cont(outputs) on the same worker.
         */
        template <typename F>
        auto run_then(NamedInputs inputs, std::vector<std::string> wanted_outputs, F cont)
            -> std::future<std::invoke_result_t<F, InferenceOutputs>> {
            auto names = prepare(inputs, wanted_outputs);
            auto session = m_session;
            return m_pool.submit([session, inputs = std::move(inputs), names = std::move(names), cont = std::move(cont)]() {
                return cont(execute(*session, inputs, names));
            });
        }

    private:
        std::shared_ptr<InferenceSession> m_session;
        WorkerPool m_pool;

        std::vector<std::string> prepare(const NamedInputs& inputs, const std::vector<std::string>& wanted) const;
        static InferenceOutputs execute(const InferenceSession& session, const NamedInputs& inputs, const std::vector<std::string>& names);
    };

}

#include "runtime.hpp"
#include <filesystem>
#include <iostream>
#include <onnxruntime_cxx_api.h>

namespace semsearch::engine {

    class OnnxSession : public InferenceSession {
    public:
        OnnxSession(const std::string& model_path, const SessionOptions& options) {
            if (!std::filesystem::exists(model_path)) {
                throw ModelArtifactMissing("Model file not found at " + model_path);
            }

            try {
                m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "semsearch");

                Ort::SessionOptions session_options;
                session_options.SetIntraOpNumThreads(options.intra_op_threads);
                session_options.SetInterOpNumThreads(options.inter_op_threads);
                session_options.SetExecutionMode(ExecutionMode::ORT_PARALLEL);
                session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
                session_options.SetLogSeverityLevel(ORT_LOGGING_LEVEL_WARNING);
                session_options.SetLogId("semsearch-session");

                m_session = std::make_unique<Ort::Session>(*m_env, model_path.c_str(), session_options);

                Ort::AllocatorWithDefaultOptions allocator;
                for (size_t i = 0; i < m_session->GetInputCount(); ++i) {
                    m_inputs.emplace_back(m_session->GetInputNameAllocated(i, allocator).get());
                }
                for (size_t i = 0; i < m_session->GetOutputCount(); ++i) {
                    m_outputs.emplace_back(m_session->GetOutputNameAllocated(i, allocator).get());
                }
            } catch (const Ort::Exception& e) {
                throw ModelArtifactMissing("Failed to load model " + model_path + ": " + e.what());
            }

            std::clog << "[OnnxSession] Loaded: " << model_path << " (intra " << options.intra_op_threads
                      << ", inter " << options.inter_op_threads << " threads)\n";
        }

        std::vector<std::string> input_names() const override { return m_inputs; }
        std::vector<std::string> output_names() const override { return m_outputs; }

        std::vector<FloatTensor> run(const NamedInputs& inputs, const std::vector<std::string>& outputs) const override {
            auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

            // Tensors borrow these buffers until Run returns
            std::vector<std::vector<int64_t>> buffers;
            buffers.reserve(inputs.size());

            std::vector<const char*> input_names;
            std::vector<Ort::Value> input_tensors;
            for (const auto& [name, tensor] : inputs) {
                input_names.push_back(name.c_str());
                auto& buffer = buffers.emplace_back(tensor.data);
                input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(
                    memory_info, buffer.data(), buffer.size(), tensor.shape.data(), tensor.shape.size()));
            }

            std::vector<const char*> output_names;
            for (const auto& name : outputs) output_names.push_back(name.c_str());

            std::vector<Ort::Value> results;
            try {
                results = m_session->Run(Ort::RunOptions{nullptr}, input_names.data(), input_tensors.data(), input_tensors.size(),
                                         output_names.data(), output_names.size());
            } catch (const Ort::Exception& e) {
                throw InternalError(std::string("Inference failed: ") + e.what());
            }

            std::vector<FloatTensor> out;
            out.reserve(results.size());
            for (size_t i = 0; i < results.size(); ++i) {
                auto info = results[i].GetTensorTypeAndShapeInfo();
                if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
                    throw InternalError("Output '" + outputs[i] + "' is not a float tensor");
                }

                FloatTensor t;
                t.shape = info.GetShape();
                const float* data = results[i].GetTensorData<float>();
                t.data.assign(data, data + info.GetElementCount());
                out.push_back(std::move(t));
            }
            return out;
        }

    private:
        std::unique_ptr<Ort::Env> m_env;
        std::unique_ptr<Ort::Session> m_session;
        std::vector<std::string> m_inputs;
        std::vector<std::string> m_outputs;
    };

    std::shared_ptr<InferenceSession> create_onnx_session(const std::string& model_path, const SessionOptions& options) {
        return std::make_shared<OnnxSession>(model_path, options);
    }

}

#include "runtime.hpp"
#include <algorithm>
#include <sstream>

namespace semsearch::engine {

    namespace {

        bool contains(const std::vector<std::string>& names, const std::string& name) {
            return std::find(names.begin(), names.end(), name) != names.end();
        }

        std::string join(const std::vector<std::string>& names) {
            std::ostringstream out;
            for (size_t i = 0; i < names.size(); ++i) {
                if (i > 0) out << ", ";
                out << names[i];
            }
            return out.str();
        }

    }

    void validate_input_names(const NamedInputs& inputs, const std::vector<std::string>& declared) {
        std::vector<std::string> unexpected;
        std::vector<std::string> missing;

        for (const auto& [name, tensor] : inputs) {
            if (!contains(declared, name)) unexpected.push_back(name);
        }
        for (const auto& name : declared) {
            if (inputs.find(name) == inputs.end()) missing.push_back(name);
        }

        if (unexpected.empty() && missing.empty()) return;

        std::ostringstream msg;
        if (!unexpected.empty()) msg << "Invalid input name(s): " << join(unexpected) << ". ";
        if (!missing.empty()) msg << "Missing required input name(s): " << join(missing) << ". ";
        msg << "Valid input names are: " << join(declared) << ".";
        throw InvalidArgument(msg.str());
    }

    void validate_output_names(const std::vector<std::string>& wanted, const std::vector<std::string>& declared) {
        std::vector<std::string> unknown;
        for (const auto& name : wanted) {
            if (!contains(declared, name)) unknown.push_back(name);
        }
        if (unknown.empty()) return;

        throw InvalidArgument("Invalid output name(s): " + join(unknown) + ". Valid output names are: " + join(declared) + ".");
    }

    ModelRuntime::ModelRuntime(std::shared_ptr<InferenceSession> session, size_t worker_threads)
        : m_session(std::move(session)), m_pool(worker_threads) {
        if (!m_session) throw ModelArtifactMissing("ModelRuntime created without a session");
    }

    std::vector<std::string> ModelRuntime::prepare(const NamedInputs& inputs, const std::vector<std::string>& wanted) const {
        if (inputs.empty()) throw InvalidArgument("Inputs cannot be empty");
        validate_input_names(inputs, m_session->input_names());

        if (wanted.empty()) return m_session->output_names();
        validate_output_names(wanted, m_session->output_names());
        return wanted;
    }

    InferenceOutputs ModelRuntime::execute(const InferenceSession& session, const NamedInputs& inputs, const std::vector<std::string>& names) {
        auto results = session.run(inputs, names);
        if (results.size() != names.size()) {
            throw InternalError("Expected " + std::to_string(names.size()) + " outputs, but got " + std::to_string(results.size()));
        }

        InferenceOutputs outputs;
        for (size_t i = 0; i < names.size(); ++i) {
            outputs[names[i]] = std::move(results[i]);
        }
        return outputs;
    }

}

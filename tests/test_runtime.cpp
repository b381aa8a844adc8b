#include "test_support.hpp"
#include "engine/tensors.hpp"
#include "engine/pooling.hpp"
#include "engine/worker_pool.hpp"
#include <set>
#include <stdexcept>

using namespace semsearch::test;

static NamedInputs sample_inputs() {
    return build_input_tensors({0, 11, 21, 2}).to_named();
}

void test_worker_pool() {
    std::cout << "Testing worker pool..." << std::endl;

    WorkerPool pool(3);
    assert(pool.size() == 3);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        assert(results[i].get() == i * i);
    }

    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    assert(error_message<std::runtime_error>([&] { failing.get(); }) == "boom");

    // Pool still serves work after a failing job
    assert(pool.submit([]() { return 7; }).get() == 7);

    std::cout << "  Worker pool: PASSED" << std::endl;
}

void test_validate_inputs() {
    std::cout << "Testing input name validation..." << std::endl;

    std::vector<std::string> declared = {"input_ids", "attention_mask", "token_type_ids"};
    validate_input_names(sample_inputs(), declared);

    auto inputs = sample_inputs();
    inputs.erase("token_type_ids");
    inputs["position_ids"] = inputs.at("input_ids");

    auto msg = error_message<semsearch::InvalidArgument>([&] { validate_input_names(inputs, declared); });
    assert(msg.find("Invalid input name(s): position_ids") != std::string::npos);
    assert(msg.find("Missing required input name(s): token_type_ids") != std::string::npos);
    assert(msg.find("Valid input names are: input_ids, attention_mask, token_type_ids") != std::string::npos);

    auto only_missing = sample_inputs();
    only_missing.erase("attention_mask");
    msg = error_message<semsearch::InvalidArgument>([&] { validate_input_names(only_missing, declared); });
    assert(msg.find("Missing required input name(s): attention_mask") != std::string::npos);
    assert(msg.find("Invalid input name(s)") == std::string::npos);

    std::cout << "  Input validation: PASSED" << std::endl;
}

void test_validate_outputs() {
    std::cout << "Testing output name validation..." << std::endl;

    std::vector<std::string> declared = {"last_hidden_state", "pooler_output"};
    validate_output_names({"last_hidden_state"}, declared);
    validate_output_names({}, declared);

    auto msg = error_message<semsearch::InvalidArgument>([&] { validate_output_names({"logits"}, declared); });
    assert(msg.find("Invalid output name(s): logits") != std::string::npos);
    assert(msg.find("Valid output names are: last_hidden_state, pooler_output") != std::string::npos);

    std::cout << "  Output validation: PASSED" << std::endl;
}

void test_runtime_run() {
    std::cout << "Testing model runtime..." << std::endl;

    auto session = std::make_shared<FakeSession>();
    ModelRuntime runtime(session, 2);

    auto all = runtime.run(sample_inputs()).get();
    assert(all.size() == 2);
    assert(all.count("last_hidden_state") == 1);
    assert(all.count("pooler_output") == 1);
    assert(all.at("last_hidden_state").shape == (std::vector<int64_t>{1, 4, 8}));

    auto one = runtime.run(sample_inputs(), {"last_hidden_state"}).get();
    assert(one.size() == 1);
    assert(one.count("last_hidden_state") == 1);

    assert(throws<semsearch::InvalidArgument>([&] { runtime.run({}); }));
    assert(throws<semsearch::InvalidArgument>([&] { runtime.run(sample_inputs(), {"logits"}); }));

    auto bad = sample_inputs();
    bad.erase("input_ids");
    assert(throws<semsearch::InvalidArgument>([&] { runtime.run(bad); }));

    auto size = runtime.run_then(sample_inputs(), {"last_hidden_state"},
                                 [](InferenceOutputs outputs) { return outputs.at("last_hidden_state").data.size(); });
    assert(size.get() == 4 * 8);

    std::cout << "  Model runtime: PASSED" << std::endl;
}

void test_runtime_output_count_mismatch() {
    std::cout << "Testing output count mismatch..." << std::endl;

    auto session = std::make_shared<FakeSession>();
    session->drop_outputs = true;
    ModelRuntime runtime(session, 1);

    auto future = runtime.run(sample_inputs(), {"last_hidden_state", "pooler_output"});
    auto msg = error_message<semsearch::InternalError>([&] { future.get(); });
    assert(msg == "Expected 2 outputs, but got 1");

    std::cout << "  Output count mismatch: PASSED" << std::endl;
}

void test_runtime_concurrent() {
    std::cout << "Testing concurrent runs..." << std::endl;

    auto session = std::make_shared<FakeSession>();
    ModelRuntime runtime(session, 4);

    std::vector<std::future<InferenceOutputs>> pending;
    for (int i = 0; i < 32; ++i) {
        pending.push_back(runtime.run(build_input_tensors({0, 3 + i, 2}).to_named(), {"last_hidden_state"}));
    }

    std::set<float> firsts;
    for (auto& f : pending) {
        auto out = f.get();
        firsts.insert(out.at("last_hidden_state").data[0]);
    }
    assert(session->calls == 32);
    assert(firsts.size() > 1);

    std::cout << "  Concurrent runs: PASSED" << std::endl;
}

void test_pooling() {
    std::cout << "Testing pooling..." << std::endl;

    // [1, 2, 3]: rows {3, 4, 0} and {1, 2, 2}
    FloatTensor t{{1, 2, 3}, {3.0f, 4.0f, 0.0f, 1.0f, 2.0f, 2.0f}};

    auto cls = pool(t, PoolingStrategy::Cls);
    assert(cls == (std::vector<float>{3.0f, 4.0f, 0.0f}));

    auto mean = pool(t, PoolingStrategy::Mean);
    assert(approx_equal(mean[0], 2.0) && approx_equal(mean[1], 3.0) && approx_equal(mean[2], 1.0));

    auto n = normalize(cls);
    assert(approx_equal(n[0], 0.6) && approx_equal(n[1], 0.8) && n[2] == 0.0f);
    assert(approx_equal(l2_norm(n), 1.0));

    InferenceOutputs outputs;
    outputs["last_hidden_state"] = t;
    auto v = pool_and_normalize(outputs, PoolingStrategy::Cls);
    assert(approx_equal(l2_norm(v), 1.0));
    assert(approx_equal(v[0], 0.6));

    std::cout << "  Pooling: PASSED" << std::endl;
}

void test_pooling_degenerate() {
    std::cout << "Testing degenerate pooling inputs..." << std::endl;

    std::vector<float> zero(4, 0.0f);
    assert(normalize(zero) == zero);

    std::vector<float> tiny(2, 1e-14f);
    assert(normalize(tiny) == tiny);

    FloatTensor flat{{1, 6}, std::vector<float>(6, 1.0f)};
    auto msg = error_message<semsearch::InternalError>([&] { pool(flat, PoolingStrategy::Cls); });
    assert(msg.find("[1, 6]") != std::string::npos);

    FloatTensor short_data{{1, 2, 3}, std::vector<float>(4, 1.0f)};
    assert(throws<semsearch::InternalError>([&] { pool(short_data, PoolingStrategy::Cls); }));

    InferenceOutputs outputs;
    outputs["pooler_output"] = FloatTensor{{1, 3}, {1.0f, 2.0f, 3.0f}};
    assert(throws<semsearch::InternalError>([&] { pool_and_normalize(outputs, PoolingStrategy::Cls); }));

    std::cout << "  Degenerate pooling: PASSED" << std::endl;
}

int main() {
    std::cout << "=== Runtime & Pooling Test Suite ===" << std::endl << std::endl;

    test_worker_pool();
    test_validate_inputs();
    test_validate_outputs();
    test_runtime_run();
    test_runtime_output_count_mismatch();
    test_runtime_concurrent();
    test_pooling();
    test_pooling_degenerate();

    std::cout << std::endl << "=== All tests PASSED ===" << std::endl;
    return 0;
}

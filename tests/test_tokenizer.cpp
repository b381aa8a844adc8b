#include "test_support.hpp"
#include "engine/tensors.hpp"

using namespace semsearch::test;

void test_remap_ids() {
    std::cout << "Testing id remapping..." << std::endl;

    std::vector<Token> native = {{"<s>", 1}, {"▁hello", 10}, {"▁world", 20}, {"</s>", 2}};
    auto remapped = remap_token_ids(native, "<s>", "</s>");

    assert(remapped.size() == 4);
    assert(remapped[0].id == 0);   // start marker in first position
    assert(remapped[1].id == 11);
    assert(remapped[2].id == 21);
    assert(remapped[3].id == 2);   // end marker keeps its native id
    assert(remapped[1].piece == "▁hello");

    // A start marker anywhere but the front is an ordinary token
    auto later = remap_token_ids({{"▁a", 5}, {"<s>", 1}}, "<s>", "</s>");
    assert(later[0].id == 6);
    assert(later[1].id == 2);

    // An end marker in front still keeps its id
    auto end_first = remap_token_ids({{"</s>", 2}, {"▁a", 5}}, "<s>", "</s>");
    assert(end_first[0].id == 2);
    assert(end_first[1].id == 6);

    assert(remap_token_ids({}, "<s>", "</s>").empty());

    std::cout << "  Remapping: PASSED" << std::endl;
}

void test_tokenize() {
    std::cout << "Testing tokenize..." << std::endl;

    auto encoder = std::make_shared<FakeEncoder>();
    Tokenizer tok(encoder);

    auto seq = tok.tokenize("hello world");
    assert(!seq.truncated);
    assert(seq.size() == 4);
    assert(seq.tokens[0].id == 0);
    assert(seq.tokens[1].id == FakeEncoder::word_id("hello") + 1);
    assert(seq.tokens[2].id == FakeEncoder::word_id("world") + 1);
    assert(seq.tokens[3].id == 2);

    auto ids = seq.ids();
    assert(ids.size() == 4);
    assert(ids[1] == seq.tokens[1].id);

    auto pieces = tok.tokenize_to_pieces("hello world");
    assert(pieces.size() == 4);
    assert(pieces[0] == "<s>");
    assert(pieces[1] == "hello");
    assert(pieces[3] == "</s>");

    std::cout << "  Tokenize: PASSED" << std::endl;
}

void test_empty_text() {
    std::cout << "Testing empty text..." << std::endl;

    Tokenizer tok(std::make_shared<FakeEncoder>());
    assert(throws<semsearch::InvalidArgument>([&] { tok.tokenize(""); }));
    assert(throws<semsearch::InvalidArgument>([&] { tok.tokenize_to_pieces(""); }));
    assert(throws<semsearch::TokenizerUnavailable>([] { Tokenizer t(nullptr); }));

    std::cout << "  Empty text: PASSED" << std::endl;
}

void test_truncation() {
    std::cout << "Testing truncation..." << std::endl;

    auto encoder = std::make_shared<FakeEncoder>();
    Tokenizer tok(encoder);
    assert(tok.max_length() == 512);

    std::string text;
    for (int i = 0; i < 700; ++i) text += "w" + std::to_string(i) + " ";

    auto full = remap_token_ids(encoder->encode(text), "<s>", "</s>");
    assert(full.size() == 702);

    auto seq = tok.tokenize(text);
    assert(seq.truncated);
    assert(seq.size() == 512);
    for (size_t i = 0; i < 512; ++i) {
        assert(seq.tokens[i].id == full[i].id);
    }
    // No end marker re-inserted
    assert(seq.tokens.back().piece != "</s>");

    // Exactly at the limit: 510 words + 2 markers
    std::string fits;
    for (int i = 0; i < 510; ++i) fits += "x" + std::to_string(i) + " ";
    auto exact = tok.tokenize(fits);
    assert(!exact.truncated);
    assert(exact.size() == 512);
    assert(exact.tokens.back().piece == "</s>");

    Tokenizer small(encoder, 3);
    auto short_seq = small.tokenize("a b c d");
    assert(short_seq.truncated);
    assert(short_seq.size() == 3);

    std::cout << "  Truncation: PASSED" << std::endl;
}

void test_input_tensors() {
    std::cout << "Testing tensor builder..." << std::endl;

    auto t = build_input_tensors({0, 11, 21, 2});
    assert(t.input_ids.size() == 4);
    assert(t.attention_mask.size() == 4);
    assert(t.token_type_ids.size() == 4);
    for (size_t i = 0; i < 4; ++i) {
        assert(t.attention_mask[i] == 1);
        assert(t.token_type_ids[i] == 0);
    }
    assert(t.shape() == (std::vector<int64_t>{1, 4}));

    auto named = t.to_named();
    assert(named.size() == 3);
    assert(named.at("input_ids").data == t.input_ids);
    assert(named.at("attention_mask").shape == (std::vector<int64_t>{1, 4}));
    assert(named.at("token_type_ids").data == t.token_type_ids);

    auto single = build_input_tensors({0});
    assert(single.shape() == (std::vector<int64_t>{1, 1}));

    std::cout << "  Tensor builder: PASSED" << std::endl;
}

int main() {
    std::cout << "=== Tokenizer Test Suite ===" << std::endl << std::endl;

    test_remap_ids();
    test_tokenize();
    test_empty_text();
    test_truncation();
    test_input_tensors();

    std::cout << std::endl << "=== All tests PASSED ===" << std::endl;
    return 0;
}

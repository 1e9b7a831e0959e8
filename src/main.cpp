// Command-line front end: create a randomly initialized character model from
// a corpus, or load one and sample text from it.
//
//   chargpt init <model_dir> <corpus.txt> [seed]
//   chargpt generate <model_dir> <prompt> [num_chars] [seed]

#include "checkpoint.hpp"
#include "completion.hpp"
#include "gpt_model.hpp"
#include "vocabulary.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using std::string;
using std::vector;

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " init <model_dir> <corpus.txt> [seed]\n"
              << "  " << argv0 << " generate <model_dir> <prompt> [num_chars] [seed]\n";
}

void print_config(const GPTModel& model) {
    const ModelConfig& c = model.config();
    std::cout << "    n_layer    = " << c.num_blocks()     << "\n"
              << "    n_embd     = " << c.model_dim()      << "\n"
              << "    n_head     = " << c.num_heads()      << "\n"
              << "    n_ctx      = " << c.context_length() << "\n"
              << "    n_vocab    = " << c.vocab_size()     << "\n"
              << "    params     = " << model.parameter_count() << "\n\n";
}

std::uint32_t parse_seed(const int argc, char* const argv[], const int pos) {
    return argc > pos ? static_cast<std::uint32_t>(std::stoul(argv[pos])) : 1337u;
}

int run_init(const string& model_dir, const string& corpus_path, const std::uint32_t seed) {
    std::ifstream fin(corpus_path);
    if (!fin || !fin.is_open()) {
        throw std::runtime_error("Could not open corpus: " + corpus_path);
    }
    const string corpus(std::istreambuf_iterator<char>{fin}, {});
    const CharVocabulary vocab = CharVocabulary::from_corpus(corpus);

    const ModelConfig config(vocab.size(), 256, 384, 6, 6, 0.2f);
    const GPTModel model(config, seed);

    std::cout << "Initialized model from corpus: " << corpus_path
              << " (" << corpus.size() << " chars)\n";
    print_config(model);

    save_checkpoint(model_dir, model);
    write_json(model_dir + "/vocab.json", vocab.to_json());
    std::cout << "Saved checkpoint to: " << model_dir << "\n";
    return 0;
}

int run_generate(const string& model_dir,
                 const string& prompt,
                 const std::size_t num_chars,
                 const std::uint32_t seed)
{
    std::cout << "Loading model from: " << model_dir << " \n";
    const GPTModel model = load_checkpoint(model_dir);
    const CharVocabulary vocab = CharVocabulary::from_json(read_json(model_dir + "/vocab.json"));
    std::cout << "Loaded model with:\n";
    print_config(model);

    const Completion completion = complete_prompt(model, vocab, prompt, num_chars, seed);
    if (completion.dropped_chars > 0) {
        std::cerr << "Dropped " << completion.dropped_chars
                  << " prompt characters outside the vocabulary\n";
    }
    if (completion.seeded) {
        std::cerr << "Prompt is empty after encoding; sampling from index 0\n";
    }

    std::cout << "Generated text:\n" << completion.text << "\n";
    return 0;
}

}  // namespace

int main(const int argc, char* const argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }
    const string command = argv[1];
    try {
        if (command == "init") {
            return run_init(argv[2], argv[3], parse_seed(argc, argv, 4));
        }
        if (command == "generate") {
            const std::size_t num_chars = argc > 4 ? std::stoul(argv[4]) : 200;
            return run_generate(argv[2], argv[3], num_chars, parse_seed(argc, argv, 5));
        }
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

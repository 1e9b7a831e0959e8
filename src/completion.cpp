#include "completion.hpp"
#include "generator.hpp"

#include <vector>

using std::size_t;
using std::vector;

Completion complete_prompt(const LanguageModel& model,
                           const CharVocabulary& vocab,
                           const std::string& prompt,
                           const size_t num_chars,
                           const std::uint32_t seed)
{
    if (vocab.size() != model.config().vocab_size()) {
        throw ConfigError("Vocabulary has " + std::to_string(vocab.size()) +
                          " characters, model expects " +
                          std::to_string(model.config().vocab_size()));
    }

    Completion result;
    vector<int> tokens = vocab.encode(prompt);
    result.dropped_chars = utf8_to_code_points(prompt).size() - tokens.size();
    result.seeded = tokens.empty();
    if (result.seeded) {
        tokens.push_back(0);
    }

    const IndexTensor context(Shape{1, tokens.size()}, tokens);
    Generator generator(model, seed);
    const IndexTensor out = generator.generate(context, num_chars);

    // Skip the seed so it never shows up as generated text
    const vector<int>& ids = out.values();
    const size_t skip = result.seeded ? 1 : 0;
    result.text = vocab.decode(vector<int>(ids.begin() + static_cast<std::ptrdiff_t>(skip), ids.end()));
    return result;
}

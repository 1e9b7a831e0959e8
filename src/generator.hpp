// Autoregressive sampling loop.

#pragma once

#include "gpt_model.hpp"
#include "tensor.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

/**
 * @class Generator
 * @brief Extends a batch of contexts one sampled token at a time.
 *
 * Each step feeds the model only the last context_length tokens of every
 * row, takes the logits of the final position, converts them to a
 * distribution with softmax and draws one index per row. The full history
 * keeps growing, so the generated length is unbounded.
 *
 * Output is deterministic for a given seed.
 *
 * Example usage:
 * @code
 *   Generator generator(model, 1337);
 *   IndexTensor context(Shape{1, 1});
 *   IndexTensor out = generator.generate(context, 500);  // (1, 501)
 * @endcode
 */
class Generator {
public:
    Generator(const LanguageModel& model, std::uint32_t seed);

    /**
     * @param context     Starting indices of shape (B, T0), T0 > 0.
     * @param new_tokens  Number of indices to append to every row.
     * @return            Shape (B, T0 + new_tokens); the first T0 columns
     *                    are the input context.
     * @throws ShapeError if context is not a non-empty (B, T0) tensor.
     * @throws IndexError if a context index is outside [0, vocab_size).
     */
    IndexTensor generate(const IndexTensor& context, std::size_t new_tokens);

    /**
     * @brief Draws one index from a categorical distribution.
     *
     * Walks the cumulative sum with u ~ U[0, 1); rounding leftovers fall on
     * the last index with non-zero probability.
     */
    int sample(const std::vector<float>& probs);

private:
    const LanguageModel& model_;
    std::mt19937 rng_;
};

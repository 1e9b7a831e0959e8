#include "generator.hpp"
#include "ops.hpp"

#include <algorithm>

using std::size_t;
using std::vector;

Generator::Generator(const LanguageModel& model, const std::uint32_t seed)
    : model_(model), rng_(seed)
{
}

int Generator::sample(const vector<float>& probs) {
    std::uniform_real_distribution<double> distrib(0.0, 1.0);
    double u = distrib(rng_);
    int last_nonzero = -1;
    for (size_t i = 0; i < probs.size(); ++i) {
        if (probs[i] <= 0.0f) {
            continue;
        }
        if (u < probs[i]) {
            return static_cast<int>(i);
        }
        u -= probs[i];
        last_nonzero = static_cast<int>(i);
    }
    if (last_nonzero < 0) {
        throw NumericalError("Cannot sample from an all-zero distribution");
    }
    return last_nonzero;
}

IndexTensor Generator::generate(const IndexTensor& context, const size_t new_tokens) {
    if (context.rank() != 2 || context.dim(0) == 0 || context.dim(1) == 0) {
        throw ShapeError("generate: expected non-empty (B, T) context, got " +
                         shape_to_string(context.shape()));
    }
    const size_t B       = context.dim(0);
    const size_t T0      = context.dim(1);
    const size_t n_ctx   = model_.config().context_length();
    const size_t n_vocab = model_.config().vocab_size();

    for (size_t i = 0; i < context.numel(); ++i) {
        if (context[i] < 0 || static_cast<size_t>(context[i]) >= n_vocab) {
            throw IndexError("generate: context index " + std::to_string(context[i]) +
                             " out of range [0, " + std::to_string(n_vocab) + ")");
        }
    }

    // Append-only history per row, sized once for the whole run
    vector<vector<int>> history(B);
    for (size_t b = 0; b < B; ++b) {
        history[b].reserve(T0 + new_tokens);
        history[b].assign(context.data() + b * T0, context.data() + (b + 1) * T0);
    }

    const ExecutionMode mode = ExecutionMode::inference();
    for (size_t step = 0; step < new_tokens; ++step) {
        // 1) Bounded view: the last min(len, context_length) tokens of every row
        const size_t len    = history[0].size();
        const size_t window = std::min(len, n_ctx);
        IndexTensor idx(Shape{B, window});
        for (size_t b = 0; b < B; ++b) {
            std::copy(history[b].end() - static_cast<std::ptrdiff_t>(window), history[b].end(),
                      idx.data() + b * window);
        }

        // 2) Logits of the last position only
        const Tensor logits = model_.forward(idx, mode);
        if (logits.rank() != 3 || logits.dim(0) != B || logits.dim(1) != window ||
            logits.dim(2) != n_vocab) {
            throw ShapeError("generate: model returned logits of shape " +
                             shape_to_string(logits.shape()));
        }

        // 3) softmax => sample => append
        for (size_t b = 0; b < B; ++b) {
            const float* last = logits.data() + ((b * window) + window - 1) * n_vocab;
            const vector<float> probs = softmax(vector<float>(last, last + n_vocab));
            history[b].push_back(sample(probs));
        }
    }

    IndexTensor out(Shape{B, T0 + new_tokens});
    for (size_t b = 0; b < B; ++b) {
        std::copy(history[b].begin(), history[b].end(), out.data() + b * (T0 + new_tokens));
    }
    return out;
}

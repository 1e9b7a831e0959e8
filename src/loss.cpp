#include "loss.hpp"

#include <algorithm>
#include <cmath>
#include <string>

using std::size_t;

float cross_entropy(const Tensor& logits, const IndexTensor& targets) {
    if (logits.rank() != 3 || targets.rank() != 2 ||
        logits.dim(0) != targets.dim(0) || logits.dim(1) != targets.dim(1)) {
        throw ShapeError("cross_entropy: logits " + shape_to_string(logits.shape()) +
                         " do not match targets " + shape_to_string(targets.shape()));
    }
    const size_t rows    = targets.numel();
    const size_t n_vocab = logits.dim(2);
    if (rows == 0 || n_vocab == 0) {
        throw ShapeError("cross_entropy: empty input " + shape_to_string(logits.shape()));
    }

    double total = 0.0;
    for (size_t r = 0; r < rows; ++r) {
        const int target = targets[r];
        if (target < 0 || static_cast<size_t>(target) >= n_vocab) {
            throw IndexError("cross_entropy: target " + std::to_string(target) +
                             " out of range [0, " + std::to_string(n_vocab) + ")");
        }
        const float* row = logits.data() + r * n_vocab;
        float max_val = row[0];
        for (size_t v = 0; v < n_vocab; ++v) {
            if (!std::isfinite(row[v])) {
                throw NumericalError("cross_entropy: logits hold NaN or inf");
            }
            max_val = std::max(max_val, row[v]);
        }
        double sum = 0.0;
        for (size_t v = 0; v < n_vocab; ++v) {
            sum += std::exp(static_cast<double>(row[v]) - max_val);
        }
        total += std::log(sum) + max_val - row[target];
    }
    return static_cast<float>(total / rows);
}

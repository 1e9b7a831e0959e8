#include "ops.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

using std::size_t;
using std::vector;

ExecutionMode ExecutionMode::training_with(std::mt19937* rng) {
    if (rng == nullptr) {
        throw ConfigError("Training mode requires a random generator for dropout");
    }
    ExecutionMode mode;
    mode.training = true;
    mode.rng = rng;
    return mode;
}

void expect_shape(const Tensor& X, const size_t rank, const size_t last_dim, const char* op) {
    if (X.rank() != rank) {
        throw ShapeError(std::string(op) + ": expected rank " + std::to_string(rank) +
                         ", got shape " + shape_to_string(X.shape()));
    }
    if (last_dim != 0 && X.dim(rank - 1) != last_dim) {
        throw ShapeError(std::string(op) + ": expected last dimension " +
                         std::to_string(last_dim) + ", got shape " + shape_to_string(X.shape()));
    }
}

vector<float> softmax(const vector<float>& input) {
    const size_t dim = input.size();
    vector<float> output(dim);
    if (dim == 0) {
        return output;
    }
    // -inf marks masked entries; NaN or +inf anywhere is an error
    float max_val = -std::numeric_limits<float>::infinity();
    for (const float v : input) {
        if (std::isnan(v) || v == std::numeric_limits<float>::infinity()) {
            throw NumericalError("softmax: input holds NaN or +inf");
        }
        max_val = std::max(max_val, v);
    }
    if (!std::isfinite(max_val)) {
        throw NumericalError("softmax: every entry is -inf");
    }
    double sum = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        const double e = std::exp(static_cast<double>(input[i]) - max_val);
        output[i] = static_cast<float>(e);
        sum += e;
    }
    for (size_t i = 0; i < dim; ++i) {
        output[i] = static_cast<float>(output[i] / sum);
    }
    return output;
}

Tensor linear(const Tensor& X, const Tensor& W, const Tensor& b) {
    if (W.rank() != 2) {
        throw ShapeError("linear: weight must be a matrix, got " + shape_to_string(W.shape()));
    }
    const size_t in_dim  = W.dim(0);
    const size_t out_dim = W.dim(1);
    if (X.rank() == 0 || X.dim(X.rank() - 1) != in_dim) {
        throw ShapeError("linear: input " + shape_to_string(X.shape()) +
                         " does not match weight " + shape_to_string(W.shape()));
    }
    const bool has_bias = b.numel() != 0;
    if (has_bias && (b.rank() != 1 || b.dim(0) != out_dim)) {
        throw ShapeError("linear: bias " + shape_to_string(b.shape()) +
                         " does not match weight " + shape_to_string(W.shape()));
    }

    Shape out_shape = X.shape();
    out_shape.back() = out_dim;
    Tensor Y(out_shape);

    const size_t m = X.numel() / in_dim;
    const float* x = X.data();
    const float* w = W.data();
    float* y = Y.data();
    for (size_t i = 0; i < m; ++i) {
        for (size_t j = 0; j < out_dim; ++j) {
            float sum = has_bias ? b[j] : 0.0f;
            for (size_t k = 0; k < in_dim; ++k) {
                sum += x[i * in_dim + k] * w[k * out_dim + j];
            }
            y[i * out_dim + j] = sum;
        }
    }
    return Y;
}

Tensor linear(const Tensor& X, const Tensor& W) {
    return linear(X, W, Tensor());
}

Tensor layer_norm(const Tensor& X,
                  const Tensor& gamma,
                  const Tensor& beta,
                  const float eps)
{
    if (X.rank() == 0) {
        throw ShapeError("layer_norm: input must have at least one axis");
    }
    const size_t dim = X.dim(X.rank() - 1);
    expect_shape(gamma, 1, dim, "layer_norm gamma");
    expect_shape(beta, 1, dim, "layer_norm beta");

    Tensor Y(X.shape());
    const size_t rows = X.numel() / dim;
    for (size_t i = 0; i < rows; ++i) {
        const float* x = X.data() + i * dim;
        float* y = Y.data() + i * dim;

        double mean = 0.0;
        for (size_t j = 0; j < dim; ++j) {
            mean += x[j];
        }
        mean /= dim;

        double var = 0.0;
        for (size_t j = 0; j < dim; ++j) {
            const double diff = x[j] - mean;
            var += diff * diff;
        }
        var /= dim;

        const float inv_std = 1.0f / std::sqrt(static_cast<float>(var) + eps);
        for (size_t j = 0; j < dim; ++j) {
            const float normalized = (x[j] - static_cast<float>(mean)) * inv_std;
            y[j] = gamma[j] * normalized + beta[j];
        }
    }
    return Y;
}

Tensor relu(const Tensor& X) {
    Tensor Y = X;
    for (size_t i = 0; i < Y.numel(); ++i) {
        Y[i] = std::max(0.0f, Y[i]);
    }
    return Y;
}

void dropout(Tensor& X, const float p, const ExecutionMode& mode) {
    if (!mode.training || p == 0.0f) {
        return;
    }
    if (mode.rng == nullptr) {
        throw ConfigError("dropout: training mode without a random generator");
    }
    std::bernoulli_distribution keep(1.0 - p);
    const float scale = 1.0f / (1.0f - p);
    for (size_t i = 0; i < X.numel(); ++i) {
        X[i] = keep(*mode.rng) ? X[i] * scale : 0.0f;
    }
}

void add_in_place(Tensor& x, const Tensor& y) {
    if (x.shape() != y.shape()) {
        throw ShapeError("residual add: " + shape_to_string(x.shape()) + " vs " +
                         shape_to_string(y.shape()));
    }
    for (size_t i = 0; i < x.numel(); ++i) {
        x[i] += y[i];
    }
}

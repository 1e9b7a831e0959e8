#include "attention.hpp"

#include <cmath>
#include <limits>

using std::size_t;
using std::vector;

namespace {

void expect_sequence(const Tensor& x, const size_t model_dim, const char* op) {
    expect_shape(x, 3, model_dim, op);
    if (x.dim(0) == 0 || x.dim(1) == 0) {
        throw ShapeError(std::string(op) + ": empty batch or sequence " +
                         shape_to_string(x.shape()));
    }
}

}  // namespace

// ------------------------------------------------------------
//  SingleHeadAttention
// ------------------------------------------------------------

SingleHeadAttention::SingleHeadAttention(const size_t model_dim, const size_t head_size)
    : Wq(Shape{model_dim, head_size}),
      Wk(Shape{model_dim, head_size}),
      Wv(Shape{model_dim, head_size})
{
}

Tensor SingleHeadAttention::weights_from(const Tensor& Q, const Tensor& K) const {
    const size_t B  = Q.dim(0);
    const size_t T  = Q.dim(1);
    const size_t hs = Q.dim(2);
    const float scale = 1.0f / std::sqrt(static_cast<float>(hs));
    const float neg_inf = -std::numeric_limits<float>::infinity();

    Tensor P(Shape{B, T, T});
    vector<float> row(T);
    for (size_t b = 0; b < B; ++b) {
        const float* q = Q.data() + b * T * hs;
        const float* k = K.data() + b * T * hs;
        for (size_t i = 0; i < T; ++i) {
            // S[i][j] = q_i . k_j / sqrt(hs), future positions masked to -inf
            for (size_t j = 0; j < T; ++j) {
                if (j > i) {
                    row[j] = neg_inf;
                    continue;
                }
                double dot = 0.0;
                for (size_t t = 0; t < hs; ++t) {
                    dot += static_cast<double>(q[i * hs + t]) * static_cast<double>(k[j * hs + t]);
                }
                row[j] = static_cast<float>(dot * scale);
            }
            const vector<float> p = softmax(row);
            float* out = P.data() + (b * T + i) * T;
            for (size_t j = 0; j < T; ++j) {
                out[j] = p[j];
            }
        }
    }
    return P;
}

Tensor SingleHeadAttention::attention_weights(const Tensor& x) const {
    expect_sequence(x, model_dim(), "SingleHeadAttention");
    return weights_from(linear(x, Wq), linear(x, Wk));
}

Tensor SingleHeadAttention::forward(const Tensor& x) const {
    expect_sequence(x, model_dim(), "SingleHeadAttention");

    // 1) Independent projections: each (B, T, head_size)
    const Tensor K = linear(x, Wk);
    const Tensor Q = linear(x, Wq);
    const Tensor V = linear(x, Wv);

    // 2) Masked, scaled, normalized scores: (B, T, T)
    const Tensor P = weights_from(Q, K);

    // 3) P * V => (B, T, head_size)
    const size_t B  = x.dim(0);
    const size_t T  = x.dim(1);
    const size_t hs = head_size();
    Tensor out(Shape{B, T, hs});
    for (size_t b = 0; b < B; ++b) {
        const float* p = P.data() + b * T * T;
        const float* v = V.data() + b * T * hs;
        float* o = out.data() + b * T * hs;
        for (size_t i = 0; i < T; ++i) {
            for (size_t j = 0; j < hs; ++j) {
                double sum = 0.0;
                // weights beyond i are exactly zero
                for (size_t t = 0; t <= i; ++t) {
                    sum += static_cast<double>(p[i * T + t]) * static_cast<double>(v[t * hs + j]);
                }
                o[i * hs + j] = static_cast<float>(sum);
            }
        }
    }
    return out;
}

// ------------------------------------------------------------
//  MultiHeadSelfAttention
// ------------------------------------------------------------

MultiHeadSelfAttention::MultiHeadSelfAttention(const size_t model_dim,
                                               const size_t num_heads,
                                               const float dropout)
    : Wproj(Shape{model_dim, model_dim}),
      bproj(Shape{model_dim}),
      dropout_rate(dropout)
{
    if (num_heads == 0 || model_dim % num_heads != 0) {
        throw ConfigError("MultiHeadSelfAttention: model_dim " + std::to_string(model_dim) +
                          " is not divisible by num_heads " + std::to_string(num_heads));
    }
    heads.reserve(num_heads);
    for (size_t h = 0; h < num_heads; ++h) {
        heads.emplace_back(model_dim, model_dim / num_heads);
    }
}

Tensor MultiHeadSelfAttention::forward(const Tensor& x, const ExecutionMode& mode) const {
    const size_t d_model = Wproj.dim(0);
    expect_sequence(x, d_model, "MultiHeadSelfAttention");

    const size_t rows   = x.dim(0) * x.dim(1);
    const size_t d_head = d_model / heads.size();

    // 1) Run every head and write its output into its slice of the concatenation
    Tensor concat(Shape{x.dim(0), x.dim(1), d_model});
    for (size_t h = 0; h < heads.size(); ++h) {
        const Tensor head_out = heads[h].forward(x);  // (B, T, d_head)
        const size_t start = h * d_head;
        for (size_t r = 0; r < rows; ++r) {
            for (size_t j = 0; j < d_head; ++j) {
                concat[r * d_model + start + j] = head_out[r * d_head + j];
            }
        }
    }

    // 2) Output projection and dropout
    Tensor out = linear(concat, Wproj, bproj);
    dropout(out, dropout_rate, mode);
    return out;
}

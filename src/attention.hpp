// Causal self-attention: a single head and the multi-head composition.

#pragma once

#include "ops.hpp"
#include "tensor.hpp"

#include <cstddef>
#include <vector>

/**
 * @class SingleHeadAttention
 * @brief Causal scaled dot-product attention for one head.
 *
 * Owns three bias-free projections Wq, Wk, Wv of shape
 * [model_dim x head_size]. Maps (B, T, model_dim) to (B, T, head_size);
 * position i only ever attends to positions j <= i.
 */
struct SingleHeadAttention {
    SingleHeadAttention(std::size_t model_dim, std::size_t head_size);

    /**
     * @brief Post-softmax attention weights.
     *
     * Scores are Q * K^T / sqrt(head_size); entries with j > i are set to
     * -infinity before the row softmax, so they come out exactly zero. The
     * mask is built per call for the actual T.
     *
     * @param x Input of shape (B, T, model_dim).
     * @return  Weights of shape (B, T, T); each row sums to 1.
     * @throws ShapeError if x is not (B, T, model_dim) with B, T > 0.
     */
    Tensor attention_weights(const Tensor& x) const;

    /**
     * @brief softmax(mask(Q * K^T / sqrt(head_size))) * V.
     * @return Output of shape (B, T, head_size).
     */
    Tensor forward(const Tensor& x) const;

    std::size_t model_dim() const { return Wq.dim(0); }
    std::size_t head_size() const { return Wq.dim(1); }

    Tensor Wq;  // [model_dim x head_size]
    Tensor Wk;  // [model_dim x head_size]
    Tensor Wv;  // [model_dim x head_size]

private:
    Tensor weights_from(const Tensor& Q, const Tensor& K) const;
};

/**
 * @class MultiHeadSelfAttention
 * @brief num_heads independent causal heads, concatenated and projected.
 *
 * Heads do not share weights. The concatenation (B, T, model_dim) goes
 * through one more affine map (with bias) and dropout.
 */
struct MultiHeadSelfAttention {
    MultiHeadSelfAttention(std::size_t model_dim, std::size_t num_heads, float dropout);

    /**
     * @param x     Input of shape (B, T, model_dim).
     * @param mode  Dropout is applied to the projected output in training mode only.
     * @return      Output of shape (B, T, model_dim).
     */
    Tensor forward(const Tensor& x, const ExecutionMode& mode) const;

    std::vector<SingleHeadAttention> heads;
    Tensor Wproj;  // [model_dim x model_dim]
    Tensor bproj;  // [model_dim]
    float dropout_rate;
};

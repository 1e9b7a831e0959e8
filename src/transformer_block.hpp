// Pre-normalization residual transformer block.

#pragma once

#include "attention.hpp"
#include "feed_forward.hpp"
#include "ops.hpp"
#include "tensor.hpp"

#include <cstddef>

/**
 * @class TransformerBlock
 * @brief Pre-norm composition of self-attention and feed-forward.
 *
 * @code
 *   x = x + MultiHeadSelfAttention(LayerNorm_1(x))
 *   x = x + FeedForward(LayerNorm_2(x))
 * @endcode
 * Normalization is applied to each sub-layer's input only; the residual
 * adds the un-normalized value. Output shape equals input shape.
 */
struct TransformerBlock {
    TransformerBlock(std::size_t model_dim, std::size_t num_heads, float dropout);

    /**
     * @param x     Hidden states of shape (B, T, model_dim).
     * @param mode  Execution mode forwarded to both sub-layers.
     * @return      Hidden states of shape (B, T, model_dim).
     */
    Tensor forward(const Tensor& x, const ExecutionMode& mode) const;

    // LayerNorm 1 (pre-attention)
    Tensor ln1_gamma;  // [model_dim]
    Tensor ln1_beta;   // [model_dim]
    MultiHeadSelfAttention attn;
    // LayerNorm 2 (pre-FFN)
    Tensor ln2_gamma;  // [model_dim]
    Tensor ln2_beta;   // [model_dim]
    FeedForward ffn;
};

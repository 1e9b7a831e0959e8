#include "transformer_block.hpp"

TransformerBlock::TransformerBlock(const std::size_t model_dim,
                                   const std::size_t num_heads,
                                   const float dropout)
    : ln1_gamma(Shape{model_dim}, 1.0f),
      ln1_beta(Shape{model_dim}),
      attn(model_dim, num_heads, dropout),
      ln2_gamma(Shape{model_dim}, 1.0f),
      ln2_beta(Shape{model_dim}),
      ffn(model_dim, dropout)
{
}

Tensor TransformerBlock::forward(const Tensor& x_in, const ExecutionMode& mode) const {
    expect_shape(x_in, 3, ln1_gamma.dim(0), "TransformerBlock");
    Tensor x = x_in;  // copy for residual

    // 1) LayerNorm => MHA => Residual
    add_in_place(x, attn.forward(layer_norm(x, ln1_gamma, ln1_beta), mode));

    // 2) LayerNorm => FFN => Residual
    add_in_place(x, ffn.forward(layer_norm(x, ln2_gamma, ln2_beta), mode));

    return x;
}

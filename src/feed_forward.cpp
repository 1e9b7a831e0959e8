#include "feed_forward.hpp"

FeedForward::FeedForward(const std::size_t model_dim, const float dropout)
    : W_fc(Shape{model_dim, 4 * model_dim}),
      b_fc(Shape{4 * model_dim}),
      W_proj(Shape{4 * model_dim, model_dim}),
      b_proj(Shape{model_dim}),
      dropout_rate(dropout)
{
}

Tensor FeedForward::forward(const Tensor& x, const ExecutionMode& mode) const {
    expect_shape(x, 3, W_fc.dim(0), "FeedForward");
    const Tensor inner = relu(linear(x, W_fc, b_fc));  // (B, T, 4*model_dim)
    Tensor out = linear(inner, W_proj, b_proj);
    dropout(out, dropout_rate, mode);
    return out;
}

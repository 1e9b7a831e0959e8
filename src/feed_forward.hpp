// Position-wise feed-forward sub-layer.

#pragma once

#include "ops.hpp"
#include "tensor.hpp"

#include <cstddef>

/**
 * @class FeedForward
 * @brief Linear => ReLU => Linear => dropout, applied to every position alone.
 *
 * model_dim -> 4 * model_dim -> model_dim. No mixing across the T axis.
 */
struct FeedForward {
    FeedForward(std::size_t model_dim, float dropout);

    Tensor forward(const Tensor& x, const ExecutionMode& mode) const;

    Tensor W_fc;    // [model_dim x 4*model_dim]
    Tensor b_fc;    // [4*model_dim]
    Tensor W_proj;  // [4*model_dim x model_dim]
    Tensor b_proj;  // [model_dim]
    float dropout_rate;
};

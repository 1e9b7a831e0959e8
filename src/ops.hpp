// Numerical building blocks shared by every layer of the model. All
// functions treat the last tensor axis as the feature axis and every leading
// axis as independent rows.

#pragma once

#include "tensor.hpp"

#include <random>
#include <vector>

/**
 * @brief Explicit execution mode threaded through every forward call.
 *
 * Dropout is active only in training mode and draws its masks from the
 * caller-owned generator; in inference mode every forward pass is a pure
 * function of parameters and input.
 */
struct ExecutionMode {
    bool training = false;
    std::mt19937* rng = nullptr;

    static ExecutionMode inference() { return ExecutionMode{}; }

    /**
     * @throws ConfigError if rng is null.
     */
    static ExecutionMode training_with(std::mt19937* rng);
};

/**
 * @brief Computes the softmax of a single vector in a numerically stable way.
 *
 * Subtracts the maximum element before exponentiating. Entries equal to
 * -infinity receive exactly zero probability.
 *
 * @param input Logits or masked attention scores.
 * @return      Probabilities summing to 1.
 * @throws NumericalError on NaN or +inf input, or when every entry is -inf.
 */
std::vector<float> softmax(const std::vector<float>& input);

/**
 * @brief Applies an affine map to the last axis: Y = X * W + b.
 *
 * @param X  Input of shape [..., in_dim].
 * @param W  Weight matrix of shape [in_dim x out_dim].
 * @param b  Bias of shape [out_dim], or an empty tensor for a bias-free map.
 * @return   Output of shape [..., out_dim].
 * @throws ShapeError on any dimension mismatch.
 */
Tensor linear(const Tensor& X, const Tensor& W, const Tensor& b);
Tensor linear(const Tensor& X, const Tensor& W);

/**
 * @brief Layer normalization over the last axis.
 *
 * Each row is shifted to zero mean and scaled to unit (biased) variance,
 * then multiplied by gamma and shifted by beta.
 *
 * @param X      Input of shape [..., dim].
 * @param gamma  Scale, shape [dim].
 * @param beta   Shift, shape [dim].
 * @param eps    Added to the variance before the square root.
 */
Tensor layer_norm(const Tensor& X,
                  const Tensor& gamma,
                  const Tensor& beta,
                  float eps = 1e-5f);

// Element-wise max(0, x).
Tensor relu(const Tensor& X);

/**
 * @brief Inverted dropout, in place.
 *
 * In training mode each element is zeroed with probability p and survivors
 * are scaled by 1/(1-p). Identity in inference mode or when p == 0.
 */
void dropout(Tensor& X, float p, const ExecutionMode& mode);

/**
 * @brief Residual addition x += y.
 * @throws ShapeError if the shapes differ.
 */
void add_in_place(Tensor& x, const Tensor& y);

/**
 * @brief Checks that X has the given rank and, when last_dim is non-zero,
 * the given trailing dimension.
 * @throws ShapeError naming the operation otherwise.
 */
void expect_shape(const Tensor& X, std::size_t rank, std::size_t last_dim, const char* op);

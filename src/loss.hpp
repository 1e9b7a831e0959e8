// Cross-entropy between next-token logits and shifted targets.

#pragma once

#include "tensor.hpp"

/**
 * @brief Mean negative log-likelihood of the targets under softmax(logits).
 *
 * The (B, T, V) logits and (B, T) targets are flattened to (B*T, V) and
 * (B*T); each row uses a max-shifted log-sum-exp.
 *
 * @param logits   Unnormalized scores of shape (B, T, vocab_size).
 * @param targets  Next-token indices of shape (B, T).
 * @throws ShapeError if the shapes disagree.
 * @throws IndexError if a target is outside [0, vocab_size).
 */
float cross_entropy(const Tensor& logits, const IndexTensor& targets);

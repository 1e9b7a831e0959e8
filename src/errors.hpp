// Exception types raised by the character-level GPT core. Every failure is a
// local, synchronous contract violation reported to the immediate caller.

#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Invalid model hyperparameters or execution mode.
 *
 * Raised at construction time, e.g. when model_dim is not divisible by
 * num_heads. Never recovered.
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief A tensor whose shape violates an operation's contract.
 *
 * Wrong rank, mismatched trailing dimension, empty sequence or a sequence
 * longer than the context window.
 */
class ShapeError : public std::invalid_argument {
public:
    explicit ShapeError(const std::string& what) : std::invalid_argument(what) {}
};

// Token, position or element index outside its valid range.
class IndexError : public std::out_of_range {
public:
    explicit IndexError(const std::string& what) : std::out_of_range(what) {}
};

// NaN/Inf reaching a softmax row.
class NumericalError : public std::runtime_error {
public:
    explicit NumericalError(const std::string& what) : std::runtime_error(what) {}
};

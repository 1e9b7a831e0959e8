// Character-level GPT: embeddings, transformer stack and vocabulary logits.

#pragma once

#include "config.hpp"
#include "ops.hpp"
#include "tensor.hpp"
#include "transformer_block.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * @class LanguageModel
 * @brief Anything that maps a (B, T) batch of token indices to
 * (B, T, vocab_size) next-token logits.
 */
class LanguageModel {
public:
    virtual ~LanguageModel() = default;

    virtual const ModelConfig& config() const = 0;
    virtual Tensor forward(const IndexTensor& idx, const ExecutionMode& mode) const = 0;
};

/**
 * @class GPTModel
 * @brief Decoder-only transformer over a closed character alphabet.
 *
 * Parameters are owned by the model and only read by forward(); the
 * training and checkpoint collaborators reach them through
 * named_parameters(). Concurrent forward passes are safe as long as no one
 * mutates parameters at the same time.
 */
class GPTModel : public LanguageModel {
public:
    /**
     * @brief Builds a randomly initialized model.
     *
     * Projection weights and embedding tables are drawn from N(0, 0.02),
     * biases are zero, normalization scales one. Equal seeds give equal
     * parameters.
     */
    explicit GPTModel(const ModelConfig& config, std::uint32_t seed = 0);

    const ModelConfig& config() const override { return config_; }

    /**
     * @brief Performs the full forward pass on a batch of token indices.
     *
     * 1. Embeds tokens and adds the positional embedding of [0, T).
     * 2. Applies num_blocks transformer blocks.
     * 3. Applies a final layer normalization.
     * 4. Projects to vocabulary logits (no softmax).
     *
     * @param idx   Token indices of shape (B, T), 1 <= T <= context_length.
     * @param mode  Inference or training (dropout) mode.
     * @return      Logits of shape (B, T, vocab_size).
     * @throws ShapeError if idx is not (B, T) with B > 0 and 0 < T <= context_length.
     * @throws IndexError if any index lies outside [0, vocab_size).
     */
    Tensor forward(const IndexTensor& idx, const ExecutionMode& mode) const override;

    // Inference-mode forward pass.
    Tensor forward(const IndexTensor& idx) const;

    /**
     * @brief Flat name => tensor mapping over every parameter, in a fixed order.
     */
    std::vector<std::pair<std::string, Tensor*>> named_parameters();
    std::vector<std::pair<std::string, const Tensor*>> named_parameters() const;

    std::size_t parameter_count() const;

private:
    ModelConfig config_;

public:
    // Embedding layers
    Tensor Wte;  // [vocab_size x model_dim]
    Tensor Wpe;  // [context_length x model_dim]

    // Transformer blocks
    std::vector<TransformerBlock> blocks;  // size: num_blocks

    // Final layer norm
    Tensor ln_f_gamma;  // [model_dim]
    Tensor ln_f_beta;   // [model_dim]

    // Vocabulary projection
    Tensor W_lm_head;  // [model_dim x vocab_size]
    Tensor b_lm_head;  // [vocab_size]
};

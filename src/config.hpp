// Model hyperparameters.

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>

/**
 * @class ModelConfig
 * @brief Immutable hyperparameters of a character-level GPT model.
 *
 * Validated on construction: every dimension must be positive, model_dim
 * must be divisible by num_heads and dropout must lie in [0, 1).
 *
 * Serialized as the hparams.json document:
 * @code
 *   {"n_vocab": 65, "n_ctx": 256, "n_embd": 384, "n_layer": 6, "n_head": 6, "dropout": 0.2}
 * @endcode
 */
class ModelConfig {
public:
    /**
     * @throws ConfigError if any invariant is violated.
     */
    ModelConfig(std::size_t vocab_size,
                std::size_t context_length,
                std::size_t model_dim,
                std::size_t num_blocks,
                std::size_t num_heads,
                float dropout = 0.2f);

    std::size_t vocab_size() const { return vocab_size_; }
    std::size_t context_length() const { return context_length_; }
    std::size_t model_dim() const { return model_dim_; }
    std::size_t num_blocks() const { return num_blocks_; }
    std::size_t num_heads() const { return num_heads_; }
    float dropout() const { return dropout_; }

    std::size_t head_size() const { return model_dim_ / num_heads_; }
    std::size_t ffn_dim() const { return 4 * model_dim_; }

    /**
     * @brief Parses an hparams.json object.
     * @throws ConfigError on missing keys, wrong types or invalid values.
     */
    static ModelConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    bool operator==(const ModelConfig& other) const;
    bool operator!=(const ModelConfig& other) const { return !(*this == other); }

private:
    std::size_t vocab_size_;
    std::size_t context_length_;
    std::size_t model_dim_;
    std::size_t num_blocks_;
    std::size_t num_heads_;
    float dropout_;
};

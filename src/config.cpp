#include "config.hpp"
#include "errors.hpp"

#include <string>

ModelConfig::ModelConfig(const std::size_t vocab_size,
                         const std::size_t context_length,
                         const std::size_t model_dim,
                         const std::size_t num_blocks,
                         const std::size_t num_heads,
                         const float dropout)
    : vocab_size_(vocab_size),
      context_length_(context_length),
      model_dim_(model_dim),
      num_blocks_(num_blocks),
      num_heads_(num_heads),
      dropout_(dropout)
{
    if (vocab_size == 0 || context_length == 0 || model_dim == 0 ||
        num_blocks == 0 || num_heads == 0) {
        throw ConfigError("ModelConfig: all dimensions must be positive");
    }
    if (model_dim % num_heads != 0) {
        throw ConfigError("ModelConfig: model_dim " + std::to_string(model_dim) +
                          " is not divisible by num_heads " + std::to_string(num_heads));
    }
    if (!(dropout >= 0.0f && dropout < 1.0f)) {
        throw ConfigError("ModelConfig: dropout must be in [0, 1), got " +
                          std::to_string(dropout));
    }
}

ModelConfig ModelConfig::from_json(const nlohmann::json& j) {
    // Helper lambda to fetch a required positive integer
    const auto get_dim = [&](const char* key) -> std::size_t {
        if (!j.contains(key)) {
            throw ConfigError(std::string("hparams missing key: ") + key);
        }
        const nlohmann::json& v = j.at(key);
        if (!v.is_number_integer() || v.get<long long>() <= 0) {
            throw ConfigError(std::string("hparams key must be a positive integer: ") + key);
        }
        return v.get<std::size_t>();
    };

    float dropout = 0.2f;
    if (j.contains("dropout")) {
        if (!j.at("dropout").is_number()) {
            throw ConfigError("hparams key must be a number: dropout");
        }
        dropout = j.at("dropout").get<float>();
    }

    return ModelConfig(get_dim("n_vocab"),
                       get_dim("n_ctx"),
                       get_dim("n_embd"),
                       get_dim("n_layer"),
                       get_dim("n_head"),
                       dropout);
}

nlohmann::json ModelConfig::to_json() const {
    return nlohmann::json{
        {"n_vocab", vocab_size_},
        {"n_ctx", context_length_},
        {"n_embd", model_dim_},
        {"n_layer", num_blocks_},
        {"n_head", num_heads_},
        {"dropout", dropout_},
    };
}

bool ModelConfig::operator==(const ModelConfig& other) const {
    return vocab_size_ == other.vocab_size_ &&
           context_length_ == other.context_length_ &&
           model_dim_ == other.model_dim_ &&
           num_blocks_ == other.num_blocks_ &&
           num_heads_ == other.num_heads_ &&
           dropout_ == other.dropout_;
}

// Checkpoint directory I/O for GPTModel parameters.
//
// Layout of <model_dir>:
//   - hparams.json    (ModelConfig: n_vocab, n_ctx, n_embd, n_layer, n_head, dropout)
//   - metadata.json   (mapping of parameter names => shapes)
//   - <param_name>.bin (raw float32 values, row-major, one file per parameter)

#pragma once

#include "gpt_model.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

/**
 * @brief Reads and parses a JSON file into a nlohmann::json object.
 * @throws std::runtime_error if the file cannot be opened or parsed.
 */
nlohmann::json read_json(const std::string& path);

/**
 * @brief Writes a JSON document, pretty printed.
 * @throws std::runtime_error if the file cannot be written.
 */
void write_json(const std::string& path, const nlohmann::json& j);

/**
 * @brief Reads exactly expected_count float32 values from a binary file.
 * @throws std::runtime_error if the file cannot be opened, is too short or
 *                            holds trailing data.
 */
void read_floats_from_bin(const std::string& path,
                          std::vector<float>& buffer,
                          std::size_t expected_count);

void write_floats_to_bin(const std::string& path, const std::vector<float>& buffer);

/**
 * @brief Saves every parameter of the model plus its hyperparameters.
 *
 * Creates model_dir (and parents) when missing; existing files of the same
 * names are overwritten.
 */
void save_checkpoint(const std::string& model_dir, const GPTModel& model);

/**
 * @brief Loads a model saved by save_checkpoint().
 *
 * 1. Reads hparams.json into a ModelConfig.
 * 2. Reads metadata.json and checks every parameter's shape against the
 *    shape the config implies.
 * 3. Loads each <param_name>.bin into its tensor.
 *
 * @throws ConfigError for invalid hyperparameters.
 * @throws std::runtime_error if any file is missing, malformed, or a shape
 *                            disagrees with the config.
 */
GPTModel load_checkpoint(const std::string& model_dir);

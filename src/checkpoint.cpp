#include "checkpoint.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using std::ifstream;
using std::ofstream;
using std::size_t;
using std::string;
using std::vector;

nlohmann::json read_json(const string& path) {
    ifstream fin(path);
    if (!fin || !fin.is_open()) {
        throw std::runtime_error("Could not open JSON file: " + path);
    }
    try {
        nlohmann::json j;
        fin >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed JSON in " + path + ": " + e.what());
    }
}

void write_json(const string& path, const nlohmann::json& j) {
    ofstream fout(path);
    if (!fout || !fout.is_open()) {
        throw std::runtime_error("Could not create JSON file: " + path);
    }
    fout << j.dump(2) << "\n";
    if (!fout) {
        throw std::runtime_error("Failed to write JSON file: " + path);
    }
}

void read_floats_from_bin(const string& path,
                          vector<float>& buffer,
                          const size_t expected_count)
{
    ifstream fin(path, std::ios::binary);
    if (!fin || !fin.is_open()) {
        throw std::runtime_error("Could not open binary file: " + path);
    }
    buffer.resize(expected_count);
    fin.read(reinterpret_cast<char*>(buffer.data()),
             static_cast<std::streamsize>(expected_count * sizeof(float)));
    if (!fin) {
        throw std::runtime_error("Failed to read expected float count from: " + path);
    }
    if (fin.peek() != ifstream::traits_type::eof()) {
        throw std::runtime_error("Unexpected trailing data in: " + path);
    }
}

void write_floats_to_bin(const string& path, const vector<float>& buffer) {
    ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.is_open()) {
        throw std::runtime_error("Could not create binary file: " + path);
    }
    fout.write(reinterpret_cast<const char*>(buffer.data()),
               static_cast<std::streamsize>(buffer.size() * sizeof(float)));
    if (!fout) {
        throw std::runtime_error("Failed to write binary file: " + path);
    }
}

void save_checkpoint(const string& model_dir, const GPTModel& model) {
    std::filesystem::create_directories(model_dir);

    nlohmann::json meta = nlohmann::json::object();
    for (const auto& named : model.named_parameters()) {
        meta[named.first] = named.second->shape();
        write_floats_to_bin(model_dir + "/" + named.first + ".bin", named.second->values());
    }
    write_json(model_dir + "/metadata.json", meta);
    write_json(model_dir + "/hparams.json", model.config().to_json());
}

GPTModel load_checkpoint(const string& model_dir) {
    // 1) Read hparams.json
    const ModelConfig config = ModelConfig::from_json(read_json(model_dir + "/hparams.json"));

    // 2) Read metadata.json
    const nlohmann::json meta = read_json(model_dir + "/metadata.json");

    // Weights are overwritten below; the seed only matters for the shapes
    GPTModel model(config);

    // 3) Load each parameter, checking the recorded shape first
    for (auto& named : model.named_parameters()) {
        const string& key = named.first;
        Tensor& param = *named.second;
        if (!meta.contains(key)) {
            throw std::runtime_error("metadata.json missing key: " + key);
        }
        Shape shape;
        try {
            shape = meta.at(key).get<Shape>();
        } catch (const nlohmann::json::type_error& e) {
            throw std::runtime_error("metadata.json entry " + key + " is not a shape: " + e.what());
        }
        if (shape != param.shape()) {
            throw std::runtime_error("Shape mismatch for " + key + ": checkpoint has " +
                                     shape_to_string(shape) + ", config expects " +
                                     shape_to_string(param.shape()));
        }
        vector<float> flat;
        read_floats_from_bin(model_dir + "/" + key + ".bin", flat, param.numel());
        param = Tensor(shape, std::move(flat));
    }
    return model;
}

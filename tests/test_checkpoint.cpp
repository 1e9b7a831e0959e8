#include "checkpoint.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace {

class CheckpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("chargpt_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string dir() const { return dir_.string(); }

    std::filesystem::path dir_;
};

}  // namespace

TEST_F(CheckpointTest, RoundTripRestoresEveryParameter) {
    const GPTModel model(ModelConfig(5, 6, 8, 2, 2, 0.1f), 21);
    save_checkpoint(dir(), model);

    EXPECT_TRUE(std::filesystem::exists(dir_ / "hparams.json"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "metadata.json"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "blocks_1_attn_heads_0_q_w.bin"));

    const GPTModel loaded = load_checkpoint(dir());
    EXPECT_EQ(loaded.config(), model.config());
    const auto expected = model.named_parameters();
    const auto actual = loaded.named_parameters();
    ASSERT_EQ(actual.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(actual[i].first, expected[i].first);
        EXPECT_EQ(*actual[i].second, *expected[i].second) << expected[i].first;
    }

    const IndexTensor idx(Shape{1, 4}, std::vector<int>{4, 3, 2, 1});
    EXPECT_EQ(loaded.forward(idx), model.forward(idx));
}

TEST_F(CheckpointTest, MetadataRecordsShapes) {
    const GPTModel model(ModelConfig(5, 6, 8, 1, 2), 22);
    save_checkpoint(dir(), model);
    const nlohmann::json meta = read_json(dir() + "/metadata.json");
    EXPECT_EQ(meta.at("wte").get<Shape>(), (Shape{5, 8}));
    EXPECT_EQ(meta.at("blocks_0_attn_heads_1_k_w").get<Shape>(), (Shape{8, 4}));
    EXPECT_EQ(meta.at("blocks_0_mlp_c_fc_w").get<Shape>(), (Shape{8, 32}));
}

TEST_F(CheckpointTest, MissingDirectoryFails) {
    EXPECT_THROW(load_checkpoint(dir()), std::runtime_error);
}

TEST_F(CheckpointTest, MissingParameterFileFails) {
    save_checkpoint(dir(), GPTModel(ModelConfig(5, 6, 8, 1, 2), 23));
    std::filesystem::remove(dir_ / "ln_f_g.bin");
    EXPECT_THROW(load_checkpoint(dir()), std::runtime_error);
}

TEST_F(CheckpointTest, ConfigDisagreeingWithMetadataFails) {
    save_checkpoint(dir(), GPTModel(ModelConfig(5, 6, 8, 1, 2), 24));
    write_json(dir() + "/hparams.json", ModelConfig(7, 6, 8, 1, 2).to_json());
    EXPECT_THROW(load_checkpoint(dir()), std::runtime_error);
}

TEST_F(CheckpointTest, TruncatedBinaryFails) {
    save_checkpoint(dir(), GPTModel(ModelConfig(5, 6, 8, 1, 2), 25));
    write_floats_to_bin(dir() + "/wpe.bin", std::vector<float>(3, 0.0f));
    EXPECT_THROW(load_checkpoint(dir()), std::runtime_error);
}

TEST_F(CheckpointTest, InvalidHyperparametersAreConfigErrors) {
    save_checkpoint(dir(), GPTModel(ModelConfig(5, 6, 8, 1, 2), 26));
    nlohmann::json hps = read_json(dir() + "/hparams.json");
    hps["n_head"] = 3;
    write_json(dir() + "/hparams.json", hps);
    EXPECT_THROW(load_checkpoint(dir()), ConfigError);
}

TEST_F(CheckpointTest, NonArrayShapeInMetadataIsRuntimeError) {
    save_checkpoint(dir(), GPTModel(ModelConfig(5, 6, 8, 1, 2), 27));
    nlohmann::json meta = read_json(dir() + "/metadata.json");
    meta["wte"] = "five by eight";
    write_json(dir() + "/metadata.json", meta);
    EXPECT_THROW(load_checkpoint(dir()), std::runtime_error);

    meta["wte"] = nlohmann::json::array({5, "eight"});
    write_json(dir() + "/metadata.json", meta);
    EXPECT_THROW(load_checkpoint(dir()), std::runtime_error);
}

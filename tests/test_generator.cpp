#include "generator.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace {

// Always predicts `next`; records every window it is called with.
class ScriptedModel : public LanguageModel {
public:
    ScriptedModel(const ModelConfig& config, const int next) : config_(config), next_(next) {}

    const ModelConfig& config() const override { return config_; }

    Tensor forward(const IndexTensor& idx, const ExecutionMode&) const override {
        windows.push_back(idx);
        const std::size_t B = idx.dim(0);
        const std::size_t T = idx.dim(1);
        const std::size_t V = config_.vocab_size();
        Tensor logits(Shape{B, T, V}, -1e9f);
        for (std::size_t r = 0; r < B * T; ++r) {
            logits[r * V + static_cast<std::size_t>(next_)] = 0.0f;
        }
        return logits;
    }

    mutable std::vector<IndexTensor> windows;

private:
    ModelConfig config_;
    int next_;
};

}  // namespace

TEST(GeneratorTest, EndToEndExample) {
    const GPTModel model(ModelConfig(4, 8, 8, 1, 2), 1);
    Generator generator(model, 42);
    const IndexTensor context(Shape{1, 3}, std::vector<int>{0, 1, 2});
    const IndexTensor out = generator.generate(context, 2);

    ASSERT_EQ(out.shape(), (Shape{1, 5}));
    EXPECT_EQ(out[0], 0);
    EXPECT_EQ(out[1], 1);
    EXPECT_EQ(out[2], 2);
    for (std::size_t i = 3; i < 5; ++i) {
        EXPECT_GE(out[i], 0);
        EXPECT_LT(out[i], 4);
    }
}

TEST(GeneratorTest, SlidingWindowIsBoundedByContextLength) {
    const std::size_t context_length = 4;
    const ScriptedModel model(ModelConfig(6, context_length, 8, 1, 2), 5);
    Generator generator(model, 1);
    const IndexTensor context(Shape{1, 2}, std::vector<int>{2, 3});
    const IndexTensor out = generator.generate(context, 6);

    ASSERT_EQ(out.shape(), (Shape{1, 8}));
    ASSERT_EQ(model.windows.size(), 6u);
    for (std::size_t step = 0; step < model.windows.size(); ++step) {
        const std::size_t len = 2 + step;
        const std::size_t expected = std::min(len, context_length);
        const IndexTensor& window = model.windows[step];
        ASSERT_EQ(window.shape(), (Shape{1, expected})) << "step " << step;
        // The window is the tail of the history
        for (std::size_t j = 0; j < expected; ++j) {
            EXPECT_EQ(window[j], out[len - expected + j]);
        }
    }
    for (std::size_t i = 2; i < 8; ++i) {
        EXPECT_EQ(out[i], 5);
    }
}

TEST(GeneratorTest, GeneratesPastContextLength) {
    const GPTModel model(ModelConfig(4, 8, 8, 1, 2), 2);
    Generator generator(model, 3);
    const IndexTensor out = generator.generate(IndexTensor(Shape{1, 1}), 20);
    EXPECT_EQ(out.shape(), (Shape{1, 21}));
}

TEST(GeneratorTest, EveryBatchRowIsExtended) {
    const ScriptedModel model(ModelConfig(6, 4, 8, 1, 2), 1);
    Generator generator(model, 4);
    const IndexTensor context(Shape{3, 2}, std::vector<int>{0, 0, 2, 2, 4, 4});
    const IndexTensor out = generator.generate(context, 3);
    ASSERT_EQ(out.shape(), (Shape{3, 5}));
    for (std::size_t b = 0; b < 3; ++b) {
        EXPECT_EQ(out.at({b, 0}), static_cast<int>(2 * b));
        EXPECT_EQ(out.at({b, 4}), 1);
    }
    EXPECT_EQ(model.windows.front().shape(), (Shape{3, 2}));
}

TEST(GeneratorTest, SameSeedSameOutput) {
    const GPTModel model(ModelConfig(6, 8, 8, 1, 2), 5);
    const IndexTensor context(Shape{2, 2}, std::vector<int>{0, 1, 2, 3});
    Generator a(model, 99);
    Generator b(model, 99);
    EXPECT_EQ(a.generate(context, 12), b.generate(context, 12));
}

TEST(GeneratorTest, ZeroNewTokensReturnsContext) {
    const ScriptedModel model(ModelConfig(6, 4, 8, 1, 2), 1);
    Generator generator(model, 6);
    const IndexTensor context(Shape{1, 3}, std::vector<int>{1, 2, 3});
    EXPECT_EQ(generator.generate(context, 0), context);
    EXPECT_TRUE(model.windows.empty());
}

TEST(GeneratorTest, RejectsInvalidContext) {
    const ScriptedModel model(ModelConfig(6, 4, 8, 1, 2), 1);
    Generator generator(model, 7);
    EXPECT_THROW(generator.generate(IndexTensor(Shape{1, 0}), 1), ShapeError);
    EXPECT_THROW(generator.generate(IndexTensor(Shape{4}), 1), ShapeError);
    EXPECT_THROW(generator.generate(IndexTensor(Shape{1, 1}, std::vector<int>{6}), 1), IndexError);
}

TEST(SampleTest, DegenerateDistributionAlwaysPicksItsIndex) {
    const ScriptedModel model(ModelConfig(4, 4, 8, 1, 2), 0);
    Generator generator(model, 8);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(generator.sample({0.0f, 0.0f, 1.0f, 0.0f}), 2);
    }
}

TEST(SampleTest, NeverPicksZeroProbability) {
    const ScriptedModel model(ModelConfig(4, 4, 8, 1, 2), 0);
    Generator generator(model, 9);
    for (int i = 0; i < 1000; ++i) {
        const int k = generator.sample({0.5f, 0.0f, 0.5f, 0.0f});
        EXPECT_TRUE(k == 0 || k == 2);
    }
    EXPECT_THROW(generator.sample({0.0f, 0.0f}), NumericalError);
}

TEST(SampleTest, FrequenciesMatchProbabilities) {
    const ScriptedModel model(ModelConfig(3, 4, 8, 1, 2), 0);
    Generator generator(model, 10);
    const std::vector<float> probs = {0.2f, 0.5f, 0.3f};
    std::vector<int> counts(3, 0);
    const int draws = 20000;
    for (int i = 0; i < draws; ++i) {
        ++counts[static_cast<std::size_t>(generator.sample(probs))];
    }
    for (std::size_t k = 0; k < 3; ++k) {
        EXPECT_NEAR(static_cast<double>(counts[k]) / draws, probs[k], 0.02);
    }
}

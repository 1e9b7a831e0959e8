#include "completion.hpp"

#include <gtest/gtest.h>

namespace {

ModelConfig four_char_config() {
    return ModelConfig(4, 8, 8, 1, 2);
}

}  // namespace

TEST(CompletePromptTest, KeepsPromptAndAppendsSampledCharacters) {
    const GPTModel model(four_char_config(), 1);
    const CharVocabulary vocab(u8"ab“d");
    const Completion c = complete_prompt(model, vocab, u8"a“", 5, 7);
    EXPECT_FALSE(c.seeded);
    EXPECT_EQ(c.dropped_chars, 0u);
    const std::u32string chars = utf8_to_code_points(c.text);
    ASSERT_EQ(chars.size(), 7u);
    EXPECT_EQ(chars[0], U'a');
    EXPECT_EQ(chars[1], U'“');
}

TEST(CompletePromptTest, EmptyPromptSeedIsNotPrinted) {
    const GPTModel model(four_char_config(), 2);
    const CharVocabulary vocab("abcd");
    const Completion c = complete_prompt(model, vocab, "", 5, 8);
    EXPECT_TRUE(c.seeded);
    EXPECT_EQ(c.text.size(), 5u);
}

TEST(CompletePromptTest, FullyDroppedPromptCountsCharacters) {
    const GPTModel model(four_char_config(), 3);
    const CharVocabulary vocab("abcd");
    // Two characters, five bytes, none in the vocabulary
    const Completion c = complete_prompt(model, vocab, u8"é“", 3, 9);
    EXPECT_TRUE(c.seeded);
    EXPECT_EQ(c.dropped_chars, 2u);
    EXPECT_EQ(c.text.size(), 3u);
}

TEST(CompletePromptTest, SameSeedSameText) {
    const GPTModel model(four_char_config(), 4);
    const CharVocabulary vocab("abcd");
    EXPECT_EQ(complete_prompt(model, vocab, "ab", 10, 5).text,
              complete_prompt(model, vocab, "ab", 10, 5).text);
}

TEST(CompletePromptTest, RejectsMismatchedVocabulary) {
    const GPTModel model(four_char_config(), 5);
    EXPECT_THROW(complete_prompt(model, CharVocabulary("abc"), "a", 1, 1), ConfigError);
}

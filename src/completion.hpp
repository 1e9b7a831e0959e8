// Prompt-in, text-out sampling on top of Generator and CharVocabulary.

#pragma once

#include "gpt_model.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

struct Completion {
    std::string text;            // encoded prompt followed by the sampled characters
    std::size_t dropped_chars;   // prompt characters outside the vocabulary
    bool seeded;                 // prompt encoded to nothing; sampling started from index 0
};

/**
 * @brief Encodes a UTF-8 prompt, samples num_chars characters and decodes.
 *
 * When nothing of the prompt survives encoding, the context is seeded with
 * index 0; that seed is not part of the returned text, which then holds
 * exactly num_chars characters.
 *
 * @throws ConfigError if the vocabulary size differs from the model's.
 */
Completion complete_prompt(const LanguageModel& model,
                           const CharVocabulary& vocab,
                           const std::string& prompt,
                           std::size_t num_chars,
                           std::uint32_t seed);

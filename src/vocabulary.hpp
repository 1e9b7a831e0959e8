// Character vocabulary: a bijection between a closed alphabet of Unicode
// characters and [0, size). Text crosses this boundary as UTF-8.

#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Splits UTF-8 text into Unicode code points.
 *
 * Malformed sequences (stray continuation bytes, truncated or overlong
 * encodings, surrogates, values above U+10FFFF) are skipped one byte at a
 * time.
 */
std::u32string utf8_to_code_points(const std::string& text);

/**
 * @brief Encodes code points as UTF-8.
 * @throws ConfigError on a surrogate or a value above U+10FFFF.
 */
std::string code_points_to_utf8(const std::u32string& code_points);

/**
 * @class CharVocabulary
 * @brief Maps characters of a fixed alphabet to token indices and back.
 *
 * A character is one Unicode code point, so "é" or "“" is a single token
 * whatever its UTF-8 length. Index i corresponds to code_points()[i].
 * Characters outside the alphabet are dropped by encode(); callers that need
 * another policy (reject, map to an explicit unknown symbol) should check
 * char_to_index() themselves.
 *
 * Example usage:
 * @code
 *   CharVocabulary vocab = CharVocabulary::from_corpus(text);
 *   std::vector<int> ids = vocab.encode("To be");
 *   std::string back = vocab.decode(ids);
 * @endcode
 */
class CharVocabulary {
public:
    /**
     * @param alphabet  UTF-8 string of distinct characters, in index order.
     * @throws ConfigError if the alphabet is empty, not valid UTF-8 or
     *                     contains duplicates.
     */
    explicit CharVocabulary(const std::string& alphabet);

    // Sorted set of the distinct code points of the corpus.
    static CharVocabulary from_corpus(const std::string& corpus);

    std::size_t size() const { return code_points_.size(); }
    const std::string& alphabet() const { return alphabet_; }
    const std::u32string& code_points() const { return code_points_; }

    /**
     * @throws IndexError if index is outside [0, size()).
     */
    char32_t index_to_char(int index) const;
    std::optional<int> char_to_index(char32_t c) const;

    // Unmapped characters and malformed UTF-8 are skipped.
    std::vector<int> encode(const std::string& text) const;

    /**
     * @return UTF-8 text.
     * @throws IndexError on any index outside [0, size()).
     */
    std::string decode(const std::vector<int>& tokens) const;

    /**
     * @brief vocab.json document: {"alphabet": "<chars>"}.
     */
    nlohmann::json to_json() const;
    static CharVocabulary from_json(const nlohmann::json& j);

private:
    std::string alphabet_;                 // UTF-8
    std::u32string code_points_;           // index => char
    std::map<char32_t, int> index_of_;     // char => index
};

#include "vocabulary.hpp"
#include "errors.hpp"

#include <set>

using std::size_t;
using std::string;
using std::u32string;
using std::vector;

u32string utf8_to_code_points(const string& text) {
    u32string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        const unsigned char lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            out += static_cast<char32_t>(lead);
            ++i;
            continue;
        }

        size_t len = 0;
        char32_t cp = 0;
        char32_t min_cp = 0;
        if ((lead & 0xE0) == 0xC0) {
            len = 2; cp = lead & 0x1F; min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3; cp = lead & 0x0F; min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4; cp = lead & 0x07; min_cp = 0x10000;
        }

        bool valid = len != 0 && i + len <= text.size();
        for (size_t k = 1; valid && k < len; ++k) {
            const unsigned char cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (cont & 0x3F);
            }
        }
        if (valid && (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) {
            valid = false;
        }

        if (valid) {
            out += cp;
            i += len;
        } else {
            ++i;
        }
    }
    return out;
}

string code_points_to_utf8(const u32string& code_points) {
    string out;
    out.reserve(code_points.size());
    for (const char32_t cp : code_points) {
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            throw ConfigError("Invalid Unicode code point " + std::to_string(static_cast<unsigned long>(cp)));
        }
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }
    return out;
}

CharVocabulary::CharVocabulary(const string& alphabet)
    : alphabet_(alphabet),
      code_points_(utf8_to_code_points(alphabet))
{
    if (code_points_.empty()) {
        throw ConfigError("CharVocabulary: empty alphabet");
    }
    // Anything the decoder skipped makes the round trip differ
    if (code_points_to_utf8(code_points_) != alphabet_) {
        throw ConfigError("CharVocabulary: alphabet is not valid UTF-8");
    }
    for (size_t i = 0; i < code_points_.size(); ++i) {
        if (!index_of_.emplace(code_points_[i], static_cast<int>(i)).second) {
            throw ConfigError("CharVocabulary: duplicate character with code point " +
                              std::to_string(static_cast<unsigned long>(code_points_[i])));
        }
    }
}

CharVocabulary CharVocabulary::from_corpus(const string& corpus) {
    const u32string text = utf8_to_code_points(corpus);
    const std::set<char32_t> chars(text.begin(), text.end());
    return CharVocabulary(code_points_to_utf8(u32string(chars.begin(), chars.end())));
}

char32_t CharVocabulary::index_to_char(const int index) const {
    if (index < 0 || static_cast<size_t>(index) >= code_points_.size()) {
        throw IndexError("Token ID " + std::to_string(index) + " out of range [0, " +
                         std::to_string(code_points_.size()) + ")");
    }
    return code_points_[static_cast<size_t>(index)];
}

std::optional<int> CharVocabulary::char_to_index(const char32_t c) const {
    const auto it = index_of_.find(c);
    if (it == index_of_.end()) {
        return std::nullopt;
    }
    return it->second;
}

vector<int> CharVocabulary::encode(const string& text) const {
    vector<int> tokens;
    tokens.reserve(text.size());
    for (const char32_t c : utf8_to_code_points(text)) {
        const std::optional<int> index = char_to_index(c);
        if (index) {
            tokens.push_back(*index);
        }
    }
    return tokens;
}

string CharVocabulary::decode(const vector<int>& tokens) const {
    u32string text;
    text.reserve(tokens.size());
    for (const int id : tokens) {
        text += index_to_char(id);
    }
    return code_points_to_utf8(text);
}

nlohmann::json CharVocabulary::to_json() const {
    return nlohmann::json{{"alphabet", alphabet_}};
}

CharVocabulary CharVocabulary::from_json(const nlohmann::json& j) {
    if (!j.contains("alphabet") || !j.at("alphabet").is_string()) {
        throw ConfigError("vocab.json missing string key: alphabet");
    }
    return CharVocabulary(j.at("alphabet").get<string>());
}

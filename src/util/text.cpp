#include "mailclass/util/text.hpp"

#include <algorithm>
#include <cctype>

namespace mailclass::util {

static constexpr size_t kMinTokenLength = 2;
static constexpr size_t kMaxTokenLength = 40;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return s;
}

static inline bool is_word_byte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c) || c == '\'' || c == '_' || c == '$' || c == '-';
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : text) {
        if (is_word_byte(c)) {
            current.push_back(static_cast<char>(c));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

static bool is_decimal_number(const std::string& word) {
    size_t i = 0;
    if (!word.empty() && word[0] == '-') ++i;
    if (i == word.size()) return false;
    for (; i < word.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(word[i]))) return false;
    }
    return true;
}

bool is_acceptable_token(const std::string& word) {
    if (word.size() < kMinTokenLength || word.size() > kMaxTokenLength) return false;
    bool has_alnum = std::any_of(word.begin(), word.end(), [](unsigned char c) {
        return c >= 0x80 || std::isalnum(c);
    });
    if (!has_alnum) return false;
    return !is_decimal_number(word);
}

std::string encode_utf8(uint32_t cp) {
    std::string result;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = 0xFFFD;
    }
    if (cp < 0x80) {
        result.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return result;
}

} // namespace mailclass::util

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mailclass::util {

// ASCII case folding; bytes >= 0x80 are left untouched.
std::string to_lower(std::string s);

// Split on every byte that is not alphanumeric, ' _ $ - or part of a
// UTF-8 sequence. Empty pieces are dropped.
std::vector<std::string> split_words(const std::string& text);

// Length 2..40, at least one letter or digit, not a plain (signed) number.
bool is_acceptable_token(const std::string& word);

// Encode a Unicode codepoint as UTF-8 bytes.
std::string encode_utf8(uint32_t codepoint);

} // namespace mailclass::util

#ifndef UTIL_UTF8_HPP
#define UTIL_UTF8_HPP

#include <cstdint>
#include <string>

namespace util {

// Decodes the UTF-8 sequence starting at text[pos]. Returns its length in
// bytes and sets code_point, or returns 0 if the sequence is not well formed
// (overlong encodings and surrogates included).
size_t DecodeUtf8(const std::string& text, size_t pos, uint32_t* code_point);

bool IsValidUtf8(const std::string& text);

// Replaces every byte that is not part of a well formed sequence with U+FFFD.
std::string ToValidUtf8(const std::string& text);

}  // namespace util

#endif

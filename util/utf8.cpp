#include "util/utf8.hpp"

namespace util {

size_t DecodeUtf8(const std::string& text, size_t pos, uint32_t* code_point) {
  unsigned char lead = text[pos];
  if (lead < 0x80) {
    *code_point = lead;
    return 1;
  }
  size_t length = 0;
  unsigned char low = 0x80;
  unsigned char high = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
    *code_point = lead & 0x1F;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    *code_point = lead & 0x0F;
    if (lead == 0xE0) low = 0xA0;
    if (lead == 0xED) high = 0x9F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    *code_point = lead & 0x07;
    if (lead == 0xF0) low = 0x90;
    if (lead == 0xF4) high = 0x8F;
  } else {
    return 0;
  }
  if (pos + length > text.size()) return 0;
  for (size_t i = 1; i < length; i++) {
    unsigned char c = text[pos + i];
    if (c < (i == 1 ? low : 0x80) || c > (i == 1 ? high : 0xBF)) return 0;
    *code_point = (*code_point << 6) | (c & 0x3F);
  }
  return length;
}

bool IsValidUtf8(const std::string& text) {
  uint32_t code_point = 0;
  for (size_t pos = 0; pos < text.size();) {
    size_t length = DecodeUtf8(text, pos, &code_point);
    if (length == 0) return false;
    pos += length;
  }
  return true;
}

std::string ToValidUtf8(const std::string& text) {
  static const constexpr char* kReplacement = "\xEF\xBF\xBD";
  std::string valid;
  valid.reserve(text.size());
  uint32_t code_point = 0;
  for (size_t pos = 0; pos < text.size();) {
    size_t length = DecodeUtf8(text, pos, &code_point);
    if (length == 0) {
      valid += kReplacement;
      pos++;
    } else {
      valid.append(text, pos, length);
      pos += length;
    }
  }
  return valid;
}

}  // namespace util

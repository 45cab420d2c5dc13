#include "validator/confusables.h"

#include <cstdint>
#include <unordered_map>

#include "validator/lexer.h"

namespace slotbox {

namespace {

const std::unordered_map<uint32_t, char> kLookAlikes = {
    // Cyrillic lowercase
    {0x0430, 'a'}, {0x0432, 'B'}, {0x0435, 'e'}, {0x043E, 'o'}, {0x0440, 'p'},
    {0x0441, 'c'}, {0x0443, 'y'}, {0x0445, 'x'}, {0x0455, 's'}, {0x0456, 'i'},
    {0x0458, 'j'}, {0x04BB, 'h'}, {0x0501, 'd'}, {0x051B, 'q'}, {0x051D, 'w'},
    {0x0457, 'i'}, {0x04CF, 'l'},
    // Cyrillic uppercase
    {0x0405, 'S'}, {0x0406, 'I'}, {0x0408, 'J'}, {0x0410, 'A'}, {0x0412, 'B'},
    {0x0415, 'E'}, {0x041A, 'K'}, {0x041C, 'M'}, {0x041D, 'H'}, {0x041E, 'O'},
    {0x0420, 'P'}, {0x0421, 'C'}, {0x0422, 'T'}, {0x0425, 'X'}, {0x04AE, 'Y'},
    {0x051C, 'W'},
    // Greek lowercase
    {0x03B1, 'a'}, {0x03B9, 'i'}, {0x03BA, 'k'}, {0x03BD, 'v'}, {0x03BF, 'o'},
    {0x03C1, 'p'}, {0x03C5, 'u'}, {0x03C7, 'x'},
    // Greek uppercase
    {0x0391, 'A'}, {0x0392, 'B'}, {0x0395, 'E'}, {0x0396, 'Z'}, {0x0397, 'H'},
    {0x0399, 'I'}, {0x039A, 'K'}, {0x039C, 'M'}, {0x039D, 'N'}, {0x039F, 'O'},
    {0x03A1, 'P'}, {0x03A4, 'T'}, {0x03A5, 'Y'}, {0x03A7, 'X'},
    // Latin variants
    {0x0131, 'i'}, {0x017F, 's'}, {0x0251, 'a'}, {0x0261, 'g'}, {0x026A, 'I'},
    {0x1D00, 'A'}, {0x0299, 'B'}, {0x1D04, 'C'}, {0x1D05, 'D'}, {0x1D07, 'E'},
};

bool IsInvisible(uint32_t cp) {
  return cp == 0x00AD || cp == 0x034F || cp == 0x180E || cp == 0xFEFF ||
         (cp >= 0x200B && cp <= 0x200F) || (cp >= 0x2060 && cp <= 0x2064) ||
         (cp >= 0xFE00 && cp <= 0xFE0F);
}

// Lenient decode; identifiers were validated by the lexer
uint32_t NextCodePoint(std::string_view s, size_t* pos) {
  unsigned char c = static_cast<unsigned char>(s[*pos]);
  size_t extra = c < 0x80 ? 0 : (c & 0xE0) == 0xC0 ? 1 : (c & 0xF0) == 0xE0 ? 2 : 3;
  uint32_t cp = extra == 0 ? c : extra == 1 ? (c & 0x1F) : extra == 2 ? (c & 0x0F) : (c & 0x07);
  ++*pos;
  for (size_t i = 0; i < extra && *pos < s.size(); ++i, ++*pos) {
    cp = (cp << 6) | (static_cast<unsigned char>(s[*pos]) & 0x3F);
  }
  return cp;
}

}  // namespace

std::string FoldConfusables(std::string_view utf8) {
  std::string out;
  out.reserve(utf8.size());
  size_t pos = 0;
  while (pos < utf8.size()) {
    uint32_t cp = NextCodePoint(utf8, &pos);
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
      continue;
    }
    if (IsInvisible(cp)) {
      continue;
    }
    // Fullwidth ASCII
    if (cp >= 0xFF01 && cp <= 0xFF5E) {
      out.push_back(static_cast<char>(cp - 0xFEE0));
      continue;
    }
    // Mathematical alphanumeric letters: 13 styles of A-Z then a-z
    if (cp >= 0x1D400 && cp <= 0x1D6A3) {
      uint32_t offset = (cp - 0x1D400) % 52;
      out.push_back(static_cast<char>(offset < 26 ? 'A' + offset : 'a' + (offset - 26)));
      continue;
    }
    // Mathematical digits: 5 styles of 0-9
    if (cp >= 0x1D7CE && cp <= 0x1D7FF) {
      out.push_back(static_cast<char>('0' + (cp - 0x1D7CE) % 10));
      continue;
    }
    auto it = kLookAlikes.find(cp);
    if (it != kLookAlikes.end()) {
      out.push_back(it->second);
      continue;
    }
    AppendUtf8(cp, &out);
  }
  return out;
}

}  // namespace slotbox

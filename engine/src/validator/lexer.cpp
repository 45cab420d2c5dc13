#include "validator/lexer.h"

#include <cstring>

#include <fmt/format.h>

namespace slotbox {

namespace {

constexpr uint32_t kInvalidCodePoint = 0xFFFFFFFF;

// Longest first so maximal munch falls out of a linear scan
const char* const kPunctuators[] = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=", "??=",
    "=>", "==", "!=", "<=", ">=", "&&", "||", "??", "?.", "++", "--", "+=", "-=",
    "*=", "/=", "%=", "&=", "|=", "^=", "<<", ">>", "**",
    "{", "}", "(", ")", "[", "]", ";", ",", "<", ">", "+", "-", "*", "/", "%",
    "&", "|", "^", "!", "~", "?", ":", "=", "."};

uint32_t DecodeUtf8(std::string_view s, size_t pos, size_t* length) {
  unsigned char c = static_cast<unsigned char>(s[pos]);
  *length = 1;
  if (c < 0x80) {
    return c;
  }
  size_t extra = 0;
  uint32_t cp = 0;
  if ((c & 0xE0) == 0xC0) {
    extra = 1;
    cp = c & 0x1F;
  } else if ((c & 0xF0) == 0xE0) {
    extra = 2;
    cp = c & 0x0F;
  } else if ((c & 0xF8) == 0xF0) {
    extra = 3;
    cp = c & 0x07;
  } else {
    return kInvalidCodePoint;
  }
  if (pos + extra >= s.size()) {
    return kInvalidCodePoint;
  }
  for (size_t i = 1; i <= extra; ++i) {
    unsigned char b = static_cast<unsigned char>(s[pos + i]);
    if ((b & 0xC0) != 0x80) {
      return kInvalidCodePoint;
    }
    cp = (cp << 6) | (b & 0x3F);
  }
  static const uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
  if (cp < kMinForLength[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return kInvalidCodePoint;
  }
  *length = extra + 1;
  return cp;
}

bool IsAsciiDigit(uint32_t c) {
  return c >= '0' && c <= '9';
}

bool IsHexDigit(char c) {
  return IsAsciiDigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f') ||
         (c >= 'A' && c <= 'F');
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return c - 'A' + 10;
}

bool IsAsciiIdStart(uint32_t c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '$' || c == '_';
}

// Non-ASCII code points are accepted wholesale; the confusable fold decides
// what they look like.
bool IsIdStart(uint32_t cp) {
  if (cp < 0x80) {
    return IsAsciiIdStart(cp);
  }
  return cp != kInvalidCodePoint && !IsJsWhitespace(cp) && !IsJsLineTerminator(cp);
}

bool IsIdPart(uint32_t cp) {
  return IsIdStart(cp) || IsAsciiDigit(cp);
}

}  // namespace

void AppendUtf8(uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool IsJsWhitespace(uint32_t cp) {
  switch (cp) {
    case ' ':
    case '\t':
    case '\v':
    case '\f':
    case 0xA0:
    case 0xFEFF:
    case 0x1680:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

bool IsJsLineTerminator(uint32_t cp) {
  return cp == '\n' || cp == '\r' || cp == 0x2028 || cp == 0x2029;
}

Lexer::Lexer(std::string_view source) : source_(source) {}

void Lexer::Restore(const State& state) {
  pos_ = state.pos;
  line_ = state.line;
  line_start_ = state.line_start;
  at_line_start_ = state.at_line_start;
}

std::vector<LexHazard> Lexer::Hazards() const {
  std::vector<LexHazard> out;
  for (const auto& [offset, hazard] : hazards_) {
    out.push_back(hazard);
  }
  return out;
}

void Lexer::Fail(const std::string& message) const {
  throw ParseError(message, line_, static_cast<int>(pos_ - line_start_) + 1);
}

uint32_t Lexer::PeekCodePoint(size_t offset, size_t* length) const {
  return DecodeUtf8(source_, pos_ + offset, length);
}

void Lexer::NewLine(size_t next_line_start) {
  ++line_;
  line_start_ = next_line_start;
  at_line_start_ = true;
}

bool Lexer::SkipTrivia() {
  bool newline = false;
  while (!AtEnd()) {
    size_t len = 0;
    uint32_t cp = PeekCodePoint(0, &len);

    if (IsJsLineTerminator(cp)) {
      pos_ += len;
      if (cp == '\r' && !AtEnd() && source_[pos_] == '\n') {
        ++pos_;
      }
      NewLine(pos_);
      newline = true;
      continue;
    }
    if (IsJsWhitespace(cp)) {
      pos_ += len;
      continue;
    }

    std::string_view rest = source_.substr(pos_);
    bool html_open = rest.compare(0, 4, "<!--") == 0;
    bool html_close = at_line_start_ && rest.compare(0, 3, "-->") == 0;
    if (html_open || html_close) {
      hazards_[pos_] = LexHazard{html_open ? "<!--" : "-->", line_,
                                 static_cast<int>(pos_ - line_start_) + 1};
    }

    if (rest.compare(0, 2, "//") == 0 || html_open || html_close) {
      while (!AtEnd()) {
        uint32_t c = PeekCodePoint(0, &len);
        if (IsJsLineTerminator(c)) {
          break;
        }
        pos_ += len;
      }
      continue;
    }

    if (rest.compare(0, 2, "/*") == 0) {
      size_t close = source_.find("*/", pos_ + 2);
      if (close == std::string_view::npos) {
        Fail("Unterminated comment");
      }
      pos_ += 2;
      while (pos_ < close) {
        uint32_t c = PeekCodePoint(0, &len);
        pos_ += len;
        if (IsJsLineTerminator(c)) {
          if (c == '\r' && pos_ < close && source_[pos_] == '\n') {
            ++pos_;
          }
          NewLine(pos_);
          newline = true;
        }
      }
      pos_ = close + 2;
      continue;
    }
    break;
  }
  return newline;
}

Token Lexer::MakeToken(TokenKind kind, size_t start, int line, int column) const {
  Token tok;
  tok.kind = kind;
  tok.start = start;
  tok.end = pos_;
  tok.line = line;
  tok.column = column;
  return tok;
}

Token Lexer::Next() {
  bool newline = SkipTrivia();
  size_t start = pos_;
  int line = line_;
  int column = static_cast<int>(pos_ - line_start_) + 1;

  Token tok;
  if (AtEnd()) {
    tok = MakeToken(TokenKind::kEof, start, line, column);
  } else {
    char c = source_[pos_];
    size_t len = 0;
    uint32_t cp = PeekCodePoint(0, &len);
    if (cp == kInvalidCodePoint) {
      Fail("Invalid UTF-8 in source");
    }
    if (c == '"' || c == '\'') {
      tok = ScanString(start, line, column);
    } else if (c == '`') {
      ++pos_;
      tok = ScanTemplateChunk(start, line, column);
    } else if (IsAsciiDigit(static_cast<unsigned char>(c)) ||
               (c == '.' && pos_ + 1 < source_.size() &&
                IsAsciiDigit(static_cast<unsigned char>(source_[pos_ + 1])))) {
      tok = ScanNumber(start, line, column);
    } else if (c == '\\' || IsIdStart(cp)) {
      tok = ScanName(start, line, column);
    } else {
      tok = ScanPunct(start, line, column);
    }
  }
  tok.newline_before = newline;
  at_line_start_ = false;
  return tok;
}

uint32_t Lexer::ReadUnicodeEscape() {
  uint32_t value = 0;
  if (!AtEnd() && source_[pos_] == '{') {
    ++pos_;
    size_t digits = 0;
    while (!AtEnd() && source_[pos_] != '}') {
      if (!IsHexDigit(source_[pos_])) {
        Fail("Invalid Unicode escape");
      }
      value = value * 16 + HexValue(source_[pos_]);
      if (value > 0x10FFFF) {
        Fail("Unicode escape out of range");
      }
      ++pos_;
      ++digits;
    }
    if (AtEnd() || digits == 0) {
      Fail("Invalid Unicode escape");
    }
    ++pos_;
    return value;
  }
  for (int i = 0; i < 4; ++i) {
    if (AtEnd() || !IsHexDigit(source_[pos_])) {
      Fail("Invalid Unicode escape");
    }
    value = value * 16 + HexValue(source_[pos_]);
    ++pos_;
  }
  return value;
}

void Lexer::DecodeEscape(std::string* out) {
  ++pos_;  // backslash
  if (AtEnd()) {
    Fail("Unterminated escape sequence");
  }
  char e = source_[pos_];
  switch (e) {
    case 'n': out->push_back('\n'); ++pos_; return;
    case 't': out->push_back('\t'); ++pos_; return;
    case 'r': out->push_back('\r'); ++pos_; return;
    case 'b': out->push_back('\b'); ++pos_; return;
    case 'f': out->push_back('\f'); ++pos_; return;
    case 'v': out->push_back('\v'); ++pos_; return;
    case 'x': {
      ++pos_;
      if (pos_ + 2 > source_.size() || !IsHexDigit(source_[pos_]) || !IsHexDigit(source_[pos_ + 1])) {
        Fail("Invalid hexadecimal escape");
      }
      AppendUtf8(static_cast<uint32_t>(HexValue(source_[pos_]) * 16 + HexValue(source_[pos_ + 1])),
                 out);
      pos_ += 2;
      return;
    }
    case 'u':
      ++pos_;
      AppendUtf8(ReadUnicodeEscape(), out);
      return;
    case '\r':
      ++pos_;
      if (!AtEnd() && source_[pos_] == '\n') {
        ++pos_;
      }
      NewLine(pos_);
      return;
    case '\n':
      ++pos_;
      NewLine(pos_);
      return;
    default:
      break;
  }
  size_t len = 0;
  uint32_t cp = PeekCodePoint(0, &len);
  if (cp == kInvalidCodePoint) {
    Fail("Invalid UTF-8 in source");
  }
  pos_ += len;
  if (cp == 0x2028 || cp == 0x2029) {
    NewLine(pos_);
    return;
  }
  if (cp == '0' && (AtEnd() || !IsAsciiDigit(static_cast<unsigned char>(source_[pos_])))) {
    out->push_back('\0');
    return;
  }
  AppendUtf8(cp, out);
}

Token Lexer::ScanName(size_t start, int line, int column) {
  std::string name;
  bool escaped = false;
  bool non_ascii = false;
  while (!AtEnd()) {
    if (source_[pos_] == '\\') {
      if (pos_ + 1 >= source_.size() || source_[pos_ + 1] != 'u') {
        Fail("Invalid escape in identifier");
      }
      pos_ += 2;
      uint32_t cp = ReadUnicodeEscape();
      if (!(name.empty() ? IsIdStart(cp) : IsIdPart(cp))) {
        Fail("Escaped character is not valid in an identifier");
      }
      non_ascii = non_ascii || cp >= 0x80;
      escaped = true;
      AppendUtf8(cp, &name);
      continue;
    }
    size_t len = 0;
    uint32_t cp = PeekCodePoint(0, &len);
    if (cp == kInvalidCodePoint) {
      Fail("Invalid UTF-8 in source");
    }
    if (!(name.empty() ? IsIdStart(cp) : IsIdPart(cp))) {
      break;
    }
    non_ascii = non_ascii || cp >= 0x80;
    name.append(source_.substr(pos_, len));
    pos_ += len;
  }
  Token tok = MakeToken(TokenKind::kName, start, line, column);
  tok.text = std::move(name);
  tok.escaped = escaped;
  tok.non_ascii = non_ascii;
  return tok;
}

Token Lexer::ScanNumber(size_t start, int line, int column) {
  auto consume_digits = [this](auto is_digit) {
    size_t count = 0;
    while (!AtEnd() && (is_digit(source_[pos_]) || source_[pos_] == '_')) {
      ++pos_;
      ++count;
    }
    return count;
  };
  auto decimal = [](char c) { return IsAsciiDigit(static_cast<unsigned char>(c)); };

  char next = pos_ + 1 < source_.size() ? source_[pos_ + 1] : '\0';
  if (source_[pos_] == '0' && std::strchr("xXoObB", next) != nullptr && next != '\0') {
    pos_ += 2;
    size_t count = 0;
    if (next == 'x' || next == 'X') {
      count = consume_digits(IsHexDigit);
    } else if (next == 'o' || next == 'O') {
      count = consume_digits([](char c) { return c >= '0' && c <= '7'; });
    } else {
      count = consume_digits([](char c) { return c == '0' || c == '1'; });
    }
    if (count == 0) {
      Fail("Missing digits in numeric literal");
    }
  } else {
    consume_digits(decimal);
    if (!AtEnd() && source_[pos_] == '.') {
      ++pos_;
      consume_digits(decimal);
    }
    if (!AtEnd() && (source_[pos_] == 'e' || source_[pos_] == 'E')) {
      ++pos_;
      if (!AtEnd() && (source_[pos_] == '+' || source_[pos_] == '-')) {
        ++pos_;
      }
      if (consume_digits(decimal) == 0) {
        Fail("Missing exponent in numeric literal");
      }
    }
  }
  if (!AtEnd() && source_[pos_] == 'n') {
    ++pos_;
  }
  if (!AtEnd()) {
    size_t len = 0;
    uint32_t cp = PeekCodePoint(0, &len);
    if (IsIdPart(cp) || source_[pos_] == '\\') {
      Fail("Identifier starts immediately after numeric literal");
    }
  }
  Token tok = MakeToken(TokenKind::kNumber, start, line, column);
  tok.text = std::string(source_.substr(start, pos_ - start));
  return tok;
}

Token Lexer::ScanString(size_t start, int line, int column) {
  char quote = source_[pos_];
  ++pos_;
  std::string value;
  while (true) {
    if (AtEnd()) {
      Fail("Unterminated string literal");
    }
    char c = source_[pos_];
    if (c == quote) {
      ++pos_;
      break;
    }
    if (c == '\\') {
      DecodeEscape(&value);
      continue;
    }
    if (c == '\n' || c == '\r') {
      Fail("Unterminated string literal");
    }
    size_t len = 0;
    uint32_t cp = PeekCodePoint(0, &len);
    if (cp == kInvalidCodePoint) {
      Fail("Invalid UTF-8 in source");
    }
    value.append(source_.substr(pos_, len));
    pos_ += len;
  }
  Token tok = MakeToken(TokenKind::kString, start, line, column);
  tok.text = std::move(value);
  return tok;
}

Token Lexer::ScanTemplateChunk(size_t start, int line, int column) {
  std::string chunk;
  bool tail = false;
  while (true) {
    if (AtEnd()) {
      Fail("Unterminated template literal");
    }
    char c = source_[pos_];
    if (c == '`') {
      ++pos_;
      tail = true;
      break;
    }
    if (c == '$' && pos_ + 1 < source_.size() && source_[pos_ + 1] == '{') {
      pos_ += 2;
      break;
    }
    if (c == '\\') {
      DecodeEscape(&chunk);
      continue;
    }
    size_t len = 0;
    uint32_t cp = PeekCodePoint(0, &len);
    if (cp == kInvalidCodePoint) {
      Fail("Invalid UTF-8 in source");
    }
    pos_ += len;
    if (IsJsLineTerminator(cp)) {
      if (cp == '\r' && !AtEnd() && source_[pos_] == '\n') {
        ++pos_;
      }
      chunk.push_back('\n');
      NewLine(pos_);
      continue;
    }
    AppendUtf8(cp, &chunk);
  }
  Token tok = MakeToken(TokenKind::kTemplate, start, line, column);
  tok.text = std::move(chunk);
  tok.template_tail = tail;
  return tok;
}

Token Lexer::ScanPunct(size_t start, int line, int column) {
  std::string_view rest = source_.substr(pos_);
  for (const char* punct : kPunctuators) {
    size_t len = std::strlen(punct);
    if (rest.compare(0, len, punct) != 0) {
      continue;
    }
    // `a?.5:0` is a conditional, not optional chaining
    if (len == 2 && punct[0] == '?' && punct[1] == '.' && rest.size() > 2 &&
        IsAsciiDigit(static_cast<unsigned char>(rest[2]))) {
      continue;
    }
    pos_ += len;
    Token tok = MakeToken(TokenKind::kPunct, start, line, column);
    tok.text = punct;
    return tok;
  }
  Fail(fmt::format("Unexpected character '{}'", rest.substr(0, 1)));
}

Token Lexer::RescanAsRegex(const Token& slash) {
  pos_ = slash.start + 1;
  line_ = slash.line;
  line_start_ = slash.start - static_cast<size_t>(slash.column - 1);

  bool in_class = false;
  while (true) {
    if (AtEnd()) {
      Fail("Unterminated regular expression");
    }
    size_t len = 0;
    uint32_t cp = PeekCodePoint(0, &len);
    if (cp == kInvalidCodePoint) {
      Fail("Invalid UTF-8 in source");
    }
    if (IsJsLineTerminator(cp)) {
      Fail("Unterminated regular expression");
    }
    pos_ += len;
    if (cp == '\\') {
      if (AtEnd()) {
        Fail("Unterminated regular expression");
      }
      uint32_t escaped = PeekCodePoint(0, &len);
      if (IsJsLineTerminator(escaped) || escaped == kInvalidCodePoint) {
        Fail("Unterminated regular expression");
      }
      pos_ += len;
    } else if (cp == '[') {
      in_class = true;
    } else if (cp == ']') {
      in_class = false;
    } else if (cp == '/' && !in_class) {
      break;
    }
  }
  while (!AtEnd() && IsAsciiIdStart(static_cast<unsigned char>(source_[pos_]))) {
    ++pos_;
  }
  Token tok = MakeToken(TokenKind::kRegex, slash.start, slash.line, slash.column);
  tok.text = std::string(source_.substr(slash.start, pos_ - slash.start));
  tok.newline_before = slash.newline_before;
  at_line_start_ = false;
  return tok;
}

Token Lexer::ContinueTemplate(const Token& close_brace) {
  pos_ = close_brace.start + 1;
  line_ = close_brace.line;
  line_start_ = close_brace.start - static_cast<size_t>(close_brace.column - 1);
  Token tok = ScanTemplateChunk(close_brace.start, close_brace.line, close_brace.column);
  at_line_start_ = false;
  return tok;
}

}  // namespace slotbox

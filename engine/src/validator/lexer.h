#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace slotbox {

/**
 * Thrown by the lexer and parser when the source leaves the supported grammar.
 */
class ParseError : public std::runtime_error {
 public:
  ParseError(const std::string& message, int line, int column)
      : std::runtime_error(message), line_(line), column_(column) {}

  int Line() const { return line_; }
  int Column() const { return column_; }

 private:
  int line_;
  int column_;
};

enum class TokenKind {
  kEof,
  kName,       // identifiers and keywords; text is the decoded name
  kNumber,
  kString,     // text is the decoded value
  kTemplate,   // one template chunk; text is the decoded chunk
  kRegex,
  kPunct
};

struct Token {
  TokenKind kind = TokenKind::kEof;
  std::string text;
  size_t start = 0;
  size_t end = 0;
  int line = 1;
  int column = 1;
  bool newline_before = false;
  bool escaped = false;        // name contained \u escapes
  bool non_ascii = false;      // name contained code points >= 0x80
  bool template_tail = false;  // template chunk ended with a backtick
};

/**
 * Source construct whose meaning differs between engines (HTML-like comments).
 * Reported as a violation, never silently skipped.
 */
struct LexHazard {
  std::string what;
  int line = 0;
  int column = 0;
};

/**
 * On-demand JavaScript tokenizer.
 *
 * `/` and `}` are ambiguous without grammar context, so the parser asks for
 * a regex or template continuation explicitly via RescanAsRegex and
 * ContinueTemplate.
 */
class Lexer {
 public:
  struct State {
    size_t pos;
    int line;
    size_t line_start;
    bool at_line_start;
  };

  explicit Lexer(std::string_view source);

  Token Next();
  Token RescanAsRegex(const Token& slash);
  Token ContinueTemplate(const Token& close_brace);

  State Save() const { return State{pos_, line_, line_start_, at_line_start_}; }
  void Restore(const State& state);

  // Keyed by source offset so lookahead does not report twice
  std::vector<LexHazard> Hazards() const;

 private:
  [[noreturn]] void Fail(const std::string& message) const;

  uint32_t PeekCodePoint(size_t offset, size_t* length) const;
  bool AtEnd() const { return pos_ >= source_.size(); }
  void NewLine(size_t next_line_start);

  // Returns true if a line terminator was crossed
  bool SkipTrivia();
  Token MakeToken(TokenKind kind, size_t start, int line, int column) const;

  Token ScanName(size_t start, int line, int column);
  Token ScanNumber(size_t start, int line, int column);
  Token ScanString(size_t start, int line, int column);
  Token ScanTemplateChunk(size_t start, int line, int column);
  Token ScanPunct(size_t start, int line, int column);

  // Decodes one escape after a backslash into out; pos_ is on the backslash
  void DecodeEscape(std::string* out);
  uint32_t ReadUnicodeEscape();

  std::string_view source_;
  size_t pos_ = 0;
  int line_ = 1;
  size_t line_start_ = 0;
  bool at_line_start_ = true;
  std::map<size_t, LexHazard> hazards_;
};

// UTF-8 helpers shared with the confusable folding
void AppendUtf8(uint32_t code_point, std::string* out);
bool IsJsWhitespace(uint32_t code_point);
bool IsJsLineTerminator(uint32_t code_point);

}  // namespace slotbox

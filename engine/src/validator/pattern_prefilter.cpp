#include "validator/pattern_prefilter.h"

#include <regex>
#include <string>

#include <fmt/format.h>

#include "validator/rules.h"

namespace slotbox {

namespace {

struct Pattern {
  const char* rule_id;
  std::regex regex;
  // "{}" is replaced by the text of capture group 1
  const char* message;
};

// Repeats are bounded: std::regex recurses once per repetition, and slot
// sources may carry arbitrarily long whitespace runs.
const std::vector<Pattern>& Patterns() {
  static const std::vector<Pattern> patterns = {
      {rules::kBlacklistedIdentifier,
       std::regex(R"((?:^|[^\w$])(window|document|globalThis|self|fetch|XMLHttpRequest|WebSocket|)"
                  R"(importScripts|eval|Function|require|module|exports|process|__proto__)(?![\w$]))"),
       "Use of blacklisted identifier '{}'"},
      {rules::kPrototypeEscape,
       std::regex(R"((constructor)\s{0,32}(?:\.\s{0,32}|\[\s{0,32}["'`])constructor)"),
       "Access to constructor.constructor is forbidden"},
      {rules::kDynamicImport, std::regex(R"((?:^|[^\w$.])(import)\s{0,32}\()"),
       "Dynamic import() is forbidden"},
      {rules::kModuleDeclaration,
       std::regex(R"((?:^|[\n;{}])[ \t]{0,32}(import[ \t]{0,32}[\w${*'"]|export\b))"),
       "import/export declarations are not allowed"},
      {rules::kModuleDeclaration,
       std::regex(R"((?:^|[^\w$.])(import)\s{0,32}\.\s{0,32}meta\b)"),
       "import.meta is not allowed"},
      {rules::kNewFunction, std::regex(R"(\b(new)\s{1,32}Function\b)"),
       "new Function() is forbidden"},
      {rules::kForbiddenSyntax, std::regex(R"(\b(with)\s{0,32}\()"),
       "with statements are not allowed"},
      {rules::kForbiddenSyntax, std::regex(R"((<!--)|(?:^|\n)[ \t]{0,32}(-->))"),
       "HTML-like comments are not allowed"},
  };
  return patterns;
}

void Locate(const std::string& text, size_t offset, int* line, int* column) {
  *line = 1;
  size_t line_start = 0;
  for (size_t i = 0; i < offset && i < text.size(); ++i) {
    if (text[i] == '\n') {
      ++*line;
      line_start = i + 1;
    }
  }
  *column = static_cast<int>(offset - line_start) + 1;
}

}  // namespace

std::vector<Violation> ScanForbiddenPatterns(std::string_view code) {
  const std::string text(code);
  std::vector<Violation> out;

  for (const auto& pattern : Patterns()) {
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern.regex);
         it != std::sregex_iterator(); ++it) {
      const std::smatch& match = *it;
      size_t group = 0;
      for (size_t i = 1; i < match.size(); ++i) {
        if (match[i].matched) {
          group = i;
          break;
        }
      }
      Violation v;
      v.rule_id = pattern.rule_id;
      v.message = fmt::format(fmt::runtime(pattern.message), match.str(group));
      Locate(text, static_cast<size_t>(match.position(group)), &v.line, &v.column);
      out.push_back(std::move(v));
    }
  }

  static const std::regex return_pattern(R"((?:^|[^\w$])return(?![\w$]))");
  if (!std::regex_search(text, return_pattern)) {
    out.push_back(Violation{rules::kMissingReturn, "Slot code must contain a return statement", 0, 0});
  }
  return out;
}

}  // namespace slotbox

#pragma once

#include <string_view>

#include "protocol/messages.h"

namespace slotbox {

/**
 * Static gate run before any slot code executes.
 *
 * The snippet is parsed as a function body and the AST is walked; every rule
 * runs and every violation is reported, in source order. Code that does not
 * parse fails closed with "parse-error" plus whatever the pattern pre-filter
 * recognises in the raw text.
 *
 * Rules:
 *   missing-return          slot body lacks `return <expr>` outside nested functions
 *   blacklisted-identifier  forbidden global name in any position, after
 *                           escape decoding and confusable folding
 *   prototype-escape        constructor.constructor, ["__proto__"]
 *   dynamic-import          import(...)
 *   module-declaration      import/export declarations, import.meta
 *   new-function            new Function(...)
 *   forbidden-syntax        with, new.target, HTML-like comments
 *   parse-error             outside the supported grammar
 *   code-too-large          source above rules::kMaxCodeBytes; nothing else runs
 */
class CodeValidator {
 public:
  static ValidationReport Validate(std::string_view code);
};

}  // namespace slotbox

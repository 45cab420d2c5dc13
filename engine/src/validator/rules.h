#pragma once

#include <cstddef>
#include <set>
#include <string>

namespace slotbox {
namespace rules {

constexpr const char* kMissingReturn = "missing-return";
constexpr const char* kBlacklistedIdentifier = "blacklisted-identifier";
constexpr const char* kPrototypeEscape = "prototype-escape";
constexpr const char* kDynamicImport = "dynamic-import";
constexpr const char* kModuleDeclaration = "module-declaration";
constexpr const char* kNewFunction = "new-function";
constexpr const char* kForbiddenSyntax = "forbidden-syntax";
constexpr const char* kParseError = "parse-error";
constexpr const char* kCodeTooLarge = "code-too-large";

// Slot source above this size is rejected before parsing
constexpr size_t kMaxCodeBytes = 64 * 1024;

/**
 * Names slot code may not mention in any position.
 */
inline const std::set<std::string>& BlacklistedIdentifiers() {
  static const std::set<std::string> names = {
      "window", "document", "globalThis", "self",    "fetch",
      "XMLHttpRequest", "WebSocket", "importScripts", "eval", "Function",
      "require", "module", "exports", "process", "__proto__"};
  return names;
}

}  // namespace rules
}  // namespace slotbox

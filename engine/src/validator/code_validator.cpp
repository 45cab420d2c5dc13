#include "validator/code_validator.h"

#include <algorithm>
#include <climits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "validator/ast.h"
#include "validator/confusables.h"
#include "validator/parser.h"
#include "validator/pattern_prefilter.h"
#include "validator/rules.h"

namespace slotbox {

namespace {

bool IsFunctionNode(NodeKind kind) {
  return kind == NodeKind::kFunctionDeclaration || kind == NodeKind::kFunctionExpression ||
         kind == NodeKind::kArrowFunction;
}

// Matches `name` literally or through its confusable skeleton
bool NameIs(const std::string& name, const char* expected) {
  return name == expected || FoldConfusables(name) == expected;
}

// Property name of a member access when it is statically known
std::optional<std::string> StaticPropertyName(const Node& member) {
  const Node& property = *member.children[1];
  if (!member.computed && property.kind == NodeKind::kIdentifier) {
    return property.text;
  }
  if (member.computed && property.kind == NodeKind::kStringLiteral) {
    return property.text;
  }
  // obj[`name`] with no substitutions
  if (member.computed && property.kind == NodeKind::kTemplateLiteral &&
      property.children.size() == 1) {
    return property.children[0]->text;
  }
  return std::nullopt;
}

class RuleWalker {
 public:
  explicit RuleWalker(std::vector<Violation>* out) : out_(out) {}

  void Walk(const Node& node, int function_depth) {
    switch (node.kind) {
      case NodeKind::kIdentifier:
        CheckIdentifier(node);
        break;
      case NodeKind::kMemberExpression:
        CheckMember(node);
        break;
      case NodeKind::kNewExpression: {
        const Node& callee = *node.children[0];
        if (callee.kind == NodeKind::kIdentifier && NameIs(callee.text, "Function")) {
          Report(rules::kNewFunction, "new Function() is forbidden", node);
        }
        break;
      }
      case NodeKind::kImportCall:
        Report(rules::kDynamicImport, "Dynamic import() is forbidden", node);
        break;
      case NodeKind::kImportDeclaration:
      case NodeKind::kExportDeclaration:
        Report(rules::kModuleDeclaration,
               fmt::format("{} declarations are not allowed", node.text), node);
        break;
      case NodeKind::kMetaProperty:
        if (node.text == "import.meta") {
          Report(rules::kModuleDeclaration, "import.meta is not allowed", node);
        } else {
          Report(rules::kForbiddenSyntax, fmt::format("{} is not allowed", node.text), node);
        }
        break;
      case NodeKind::kWithStatement:
        Report(rules::kForbiddenSyntax, "with statements are not allowed", node);
        break;
      case NodeKind::kReturnStatement:
        if (function_depth == 0 && !node.children.empty()) {
          found_return_ = true;
        }
        break;
      default:
        break;
    }

    int child_depth = IsFunctionNode(node.kind) ? function_depth + 1 : function_depth;
    for (const auto& child : node.children) {
      Walk(*child, child_depth);
    }
  }

  bool FoundReturn() const { return found_return_; }

 private:
  void Report(const char* rule_id, std::string message, const Node& at) {
    out_->push_back(Violation{rule_id, std::move(message), at.line, at.column});
  }

  void CheckName(const std::string& name, bool escaped, const Node& at) {
    const auto& blacklist = rules::BlacklistedIdentifiers();
    if (blacklist.count(name) > 0) {
      Report(rules::kBlacklistedIdentifier,
             escaped ? fmt::format("Use of blacklisted identifier '{}' (written with escapes)", name)
                     : fmt::format("Use of blacklisted identifier '{}'", name),
             at);
      return;
    }
    std::string skeleton = FoldConfusables(name);
    if (skeleton != name && blacklist.count(skeleton) > 0) {
      Report(rules::kBlacklistedIdentifier,
             fmt::format("Use of blacklisted identifier '{}' (disguised with look-alike characters)",
                         skeleton),
             at);
    }
  }

  void CheckIdentifier(const Node& node) { CheckName(node.text, node.escaped, node); }

  void CheckMember(const Node& member) {
    const Node& object = *member.children[0];
    const Node& property = *member.children[1];
    std::optional<std::string> name = StaticPropertyName(member);
    if (!name) {
      return;
    }

    if (member.computed) {
      // Dotted names are identifier nodes and get checked when walked
      CheckName(*name, false, property);
      if (NameIs(*name, "__proto__")) {
        Report(rules::kPrototypeEscape, "Access to __proto__ is forbidden", member);
      }
    }

    if (NameIs(*name, "constructor") && object.kind == NodeKind::kMemberExpression) {
      std::optional<std::string> inner = StaticPropertyName(object);
      if (inner && NameIs(*inner, "constructor")) {
        Report(rules::kPrototypeEscape, "Access to constructor.constructor is forbidden", member);
      }
    }
  }

  std::vector<Violation>* out_;
  bool found_return_ = false;
};

// Source order; position-less violations last
void SortBySource(std::vector<Violation>* violations) {
  auto key = [](const Violation& v) {
    return std::make_pair(v.line == 0 ? INT_MAX : v.line, v.column);
  };
  std::stable_sort(violations->begin(), violations->end(),
                   [&key](const Violation& a, const Violation& b) { return key(a) < key(b); });
}

}  // namespace

ValidationReport CodeValidator::Validate(std::string_view code) {
  ValidationReport report;
  if (code.size() > rules::kMaxCodeBytes) {
    report.violations.push_back(
        Violation{rules::kCodeTooLarge,
                  fmt::format("Slot code is {} bytes; the limit is {} bytes", code.size(),
                              rules::kMaxCodeBytes),
                  0, 0});
    report.ok = false;
    return report;
  }

  Parser parser(code);
  NodePtr body;
  try {
    body = parser.ParseFunctionBody();
  } catch (const ParseError& e) {
    report.violations.push_back(
        Violation{rules::kParseError, fmt::format("Syntax error: {}", e.what()), e.Line(), e.Column()});
    for (auto& hit : ScanForbiddenPatterns(code)) {
      report.violations.push_back(std::move(hit));
    }
    SortBySource(&report.violations);
    report.ok = false;
    return report;
  }

  RuleWalker walker(&report.violations);
  walker.Walk(*body, 0);
  for (const auto& hazard : parser.Hazards()) {
    report.violations.push_back(Violation{
        rules::kForbiddenSyntax,
        fmt::format("HTML-like comment '{}' is not allowed", hazard.what), hazard.line,
        hazard.column});
  }
  if (!walker.FoundReturn()) {
    report.violations.push_back(
        Violation{rules::kMissingReturn, "Slot code must contain a return statement", 0, 0});
  }

  SortBySource(&report.violations);
  report.ok = report.violations.empty();
  return report;
}

}  // namespace slotbox

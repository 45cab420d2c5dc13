#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace slotbox {

/**
 * Closed set of syntax node tags produced by the slot parser.
 *
 * The parser covers the statement/expression subset slots are written in.
 * Anything outside it is a parse error, so the walker never meets a node it
 * cannot classify.
 */
enum class NodeKind {
  // Statements
  kFunctionBody,
  kBlockStatement,
  kEmptyStatement,
  kExpressionStatement,
  kVariableDeclaration,   // text: var | let | const
  kVariableDeclarator,
  kFunctionDeclaration,
  kReturnStatement,
  kIfStatement,
  kForStatement,
  kForInStatement,
  kForOfStatement,
  kWhileStatement,
  kDoWhileStatement,
  kBreakStatement,
  kContinueStatement,
  kThrowStatement,
  kTryStatement,
  kCatchClause,
  kSwitchStatement,
  kSwitchCase,
  kLabeledStatement,
  kDebuggerStatement,
  kWithStatement,
  kImportDeclaration,
  kExportDeclaration,

  // Functions
  kFunctionExpression,
  kArrowFunction,
  kParameters,

  // Expressions
  kIdentifier,
  kThisExpression,
  kNumericLiteral,
  kStringLiteral,         // text: decoded value
  kBooleanLiteral,
  kNullLiteral,
  kRegExpLiteral,
  kTemplateLiteral,
  kTemplateElement,       // text: decoded chunk
  kTaggedTemplate,
  kArrayExpression,
  kObjectExpression,
  kProperty,              // text: init | shorthand | method | get | set
  kSpreadElement,
  kElision,
  kMemberExpression,      // children: object, property; computed/optional flags
  kCallExpression,        // children: callee, arguments...
  kNewExpression,
  kImportCall,
  kMetaProperty,          // text: import.meta | new.target
  kUnaryExpression,       // text: operator
  kUpdateExpression,      // text: operator, prefix flag in `computed`
  kBinaryExpression,
  kLogicalExpression,
  kAssignmentExpression,
  kConditionalExpression,
  kSequenceExpression
};

std::string_view NodeKindName(NodeKind kind);

/**
 * A syntax node: a kind tag, a text payload whose meaning depends on the
 * kind, and ordered children. Positions are 1-based.
 */
struct Node {
  NodeKind kind;
  std::string text;
  bool computed = false;
  bool optional = false;
  bool escaped = false;   // identifier spelled with \u escapes
  int line = 0;
  int column = 0;
  std::vector<std::unique_ptr<Node>> children;

  Node(NodeKind k, int l, int c) : kind(k), line(l), column(c) {}

  Node* Add(std::unique_ptr<Node> child) {
    children.push_back(std::move(child));
    return children.back().get();
  }
};

using NodePtr = std::unique_ptr<Node>;

}  // namespace slotbox

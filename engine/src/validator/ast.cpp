#include "validator/ast.h"

namespace slotbox {

std::string_view NodeKindName(NodeKind kind) {
  switch (kind) {
    case NodeKind::kFunctionBody:
      return "FunctionBody";
    case NodeKind::kBlockStatement:
      return "BlockStatement";
    case NodeKind::kEmptyStatement:
      return "EmptyStatement";
    case NodeKind::kExpressionStatement:
      return "ExpressionStatement";
    case NodeKind::kVariableDeclaration:
      return "VariableDeclaration";
    case NodeKind::kVariableDeclarator:
      return "VariableDeclarator";
    case NodeKind::kFunctionDeclaration:
      return "FunctionDeclaration";
    case NodeKind::kReturnStatement:
      return "ReturnStatement";
    case NodeKind::kIfStatement:
      return "IfStatement";
    case NodeKind::kForStatement:
      return "ForStatement";
    case NodeKind::kForInStatement:
      return "ForInStatement";
    case NodeKind::kForOfStatement:
      return "ForOfStatement";
    case NodeKind::kWhileStatement:
      return "WhileStatement";
    case NodeKind::kDoWhileStatement:
      return "DoWhileStatement";
    case NodeKind::kBreakStatement:
      return "BreakStatement";
    case NodeKind::kContinueStatement:
      return "ContinueStatement";
    case NodeKind::kThrowStatement:
      return "ThrowStatement";
    case NodeKind::kTryStatement:
      return "TryStatement";
    case NodeKind::kCatchClause:
      return "CatchClause";
    case NodeKind::kSwitchStatement:
      return "SwitchStatement";
    case NodeKind::kSwitchCase:
      return "SwitchCase";
    case NodeKind::kLabeledStatement:
      return "LabeledStatement";
    case NodeKind::kDebuggerStatement:
      return "DebuggerStatement";
    case NodeKind::kWithStatement:
      return "WithStatement";
    case NodeKind::kImportDeclaration:
      return "ImportDeclaration";
    case NodeKind::kExportDeclaration:
      return "ExportDeclaration";
    case NodeKind::kFunctionExpression:
      return "FunctionExpression";
    case NodeKind::kArrowFunction:
      return "ArrowFunction";
    case NodeKind::kParameters:
      return "Parameters";
    case NodeKind::kIdentifier:
      return "Identifier";
    case NodeKind::kThisExpression:
      return "ThisExpression";
    case NodeKind::kNumericLiteral:
      return "NumericLiteral";
    case NodeKind::kStringLiteral:
      return "StringLiteral";
    case NodeKind::kBooleanLiteral:
      return "BooleanLiteral";
    case NodeKind::kNullLiteral:
      return "NullLiteral";
    case NodeKind::kRegExpLiteral:
      return "RegExpLiteral";
    case NodeKind::kTemplateLiteral:
      return "TemplateLiteral";
    case NodeKind::kTemplateElement:
      return "TemplateElement";
    case NodeKind::kTaggedTemplate:
      return "TaggedTemplate";
    case NodeKind::kArrayExpression:
      return "ArrayExpression";
    case NodeKind::kObjectExpression:
      return "ObjectExpression";
    case NodeKind::kProperty:
      return "Property";
    case NodeKind::kSpreadElement:
      return "SpreadElement";
    case NodeKind::kElision:
      return "Elision";
    case NodeKind::kMemberExpression:
      return "MemberExpression";
    case NodeKind::kCallExpression:
      return "CallExpression";
    case NodeKind::kNewExpression:
      return "NewExpression";
    case NodeKind::kImportCall:
      return "ImportCall";
    case NodeKind::kMetaProperty:
      return "MetaProperty";
    case NodeKind::kUnaryExpression:
      return "UnaryExpression";
    case NodeKind::kUpdateExpression:
      return "UpdateExpression";
    case NodeKind::kBinaryExpression:
      return "BinaryExpression";
    case NodeKind::kLogicalExpression:
      return "LogicalExpression";
    case NodeKind::kAssignmentExpression:
      return "AssignmentExpression";
    case NodeKind::kConditionalExpression:
      return "ConditionalExpression";
    case NodeKind::kSequenceExpression:
      return "SequenceExpression";
  }
  return "Unknown";
}

}  // namespace slotbox

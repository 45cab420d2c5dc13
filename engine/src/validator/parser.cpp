#include "validator/parser.h"

#include <set>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace slotbox {

namespace {

constexpr int kMaxNesting = 512;

const std::set<std::string> kReservedWords = {
    "break",   "case",     "catch",  "class",      "const",  "continue", "debugger",
    "default", "delete",   "do",     "else",       "enum",   "export",   "extends",
    "false",   "finally",  "for",    "function",   "if",     "import",   "in",
    "instanceof", "new",   "null",   "return",     "super",  "switch",   "this",
    "throw",   "true",     "try",    "typeof",     "var",    "void",     "while",
    "with"};

const std::set<std::string> kAssignmentOperators = {
    "=", "+=", "-=", "*=", "/=", "%=", "**=", "<<=", ">>=", ">>>=",
    "&=", "|=", "^=", "&&=", "||=", "??="};

bool IsReserved(const Token& tok) {
  return tok.kind == TokenKind::kName && !tok.escaped && kReservedWords.count(tok.text) > 0;
}

bool IsPunctToken(const Token& tok, const char* text) {
  return tok.kind == TokenKind::kPunct && tok.text == text;
}

bool IsAssignable(const Node& node) {
  switch (node.kind) {
    case NodeKind::kIdentifier:
    case NodeKind::kMemberExpression:
    case NodeKind::kArrayExpression:
    case NodeKind::kObjectExpression:
      return true;
    default:
      return false;
  }
}

}  // namespace

void Parser::DepthGuard::Extend() {
  if (parser_->depth_ >= kMaxNesting) {
    parser_->Fail("Nesting too deep");
  }
  ++parser_->depth_;
  ++count_;
}

Parser::Parser(std::string_view source) : lexer_(source) {}

// ---------------------------------------------------------------------------
// Token stream
// ---------------------------------------------------------------------------

void Parser::Advance() {
  tok_ = lexer_.Next();
}

Token Parser::Peek() {
  Lexer::State saved = lexer_.Save();
  Token next = lexer_.Next();
  lexer_.Restore(saved);
  return next;
}

bool Parser::IsPunct(const char* text) const {
  return IsPunctToken(tok_, text);
}

bool Parser::IsKeyword(const char* text) const {
  return tok_.kind == TokenKind::kName && !tok_.escaped && tok_.text == text;
}

void Parser::Expect(const char* punct) {
  if (!IsPunct(punct)) {
    Unexpected();
  }
  Advance();
}

void Parser::ConsumeSemicolon() {
  if (IsPunct(";")) {
    Advance();
    return;
  }
  if (IsPunct("}") || tok_.kind == TokenKind::kEof || tok_.newline_before) {
    return;
  }
  Unexpected();
}

void Parser::Fail(const std::string& message) const {
  throw ParseError(message, tok_.line, tok_.column);
}

void Parser::Unexpected() const {
  if (tok_.kind == TokenKind::kEof) {
    Fail("Unexpected end of input");
  }
  if (tok_.kind == TokenKind::kString) {
    Fail("Unexpected string");
  }
  Fail(fmt::format("Unexpected token '{}'", tok_.text));
}

NodePtr Parser::MakeNode(NodeKind kind) const {
  return std::make_unique<Node>(kind, tok_.line, tok_.column);
}

NodePtr Parser::MakeNode(NodeKind kind, const Token& at) const {
  return std::make_unique<Node>(kind, at.line, at.column);
}

NodePtr Parser::ParseIdentifier() {
  if (tok_.kind != TokenKind::kName || IsReserved(tok_)) {
    Unexpected();
  }
  auto id = MakeNode(NodeKind::kIdentifier);
  id->text = tok_.text;
  id->escaped = tok_.escaped;
  Advance();
  return id;
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

NodePtr Parser::ParseFunctionBody() {
  auto body = std::make_unique<Node>(NodeKind::kFunctionBody, 1, 1);
  Advance();
  while (tok_.kind != TokenKind::kEof) {
    body->Add(ParseStatement());
  }
  return body;
}

NodePtr Parser::ParseStatement() {
  DepthGuard guard(this);

  if (IsPunct("{")) {
    return ParseBlock();
  }
  if (IsPunct(";")) {
    auto empty = MakeNode(NodeKind::kEmptyStatement);
    Advance();
    return empty;
  }

  if (tok_.kind == TokenKind::kName && !tok_.escaped) {
    const std::string word = tok_.text;
    if (word == "var" || word == "const") {
      auto decl = ParseVariableDeclaration();
      ConsumeSemicolon();
      return decl;
    }
    if (word == "let") {
      Token next = Peek();
      if (next.kind == TokenKind::kName || IsPunctToken(next, "[") || IsPunctToken(next, "{")) {
        auto decl = ParseVariableDeclaration();
        ConsumeSemicolon();
        return decl;
      }
    }
    if (word == "function") {
      return ParseFunction(NodeKind::kFunctionDeclaration);
    }
    if (word == "async") {
      Token next = Peek();
      if (!next.newline_before && next.kind == TokenKind::kName && next.text != "in" &&
          next.text != "instanceof") {
        Fail("Async functions are not supported");
      }
    }
    if (word == "class") Fail("Classes are not supported");
    if (word == "if") return ParseIf();
    if (word == "for") return ParseFor();
    if (word == "while") return ParseWhile();
    if (word == "do") return ParseDoWhile();
    if (word == "return") return ParseReturn();
    if (word == "break") return ParseJump(NodeKind::kBreakStatement);
    if (word == "continue") return ParseJump(NodeKind::kContinueStatement);
    if (word == "throw") return ParseThrow();
    if (word == "try") return ParseTry();
    if (word == "switch") return ParseSwitch();
    if (word == "with") return ParseWith();
    if (word == "debugger") {
      auto stmt = MakeNode(NodeKind::kDebuggerStatement);
      Advance();
      ConsumeSemicolon();
      return stmt;
    }
    if (word == "import") {
      Token next = Peek();
      if (!IsPunctToken(next, "(") && !IsPunctToken(next, ".")) {
        return ParseImportDeclaration();
      }
    }
    if (word == "export") {
      return ParseExportDeclaration();
    }
  }

  if (tok_.kind == TokenKind::kName && !IsReserved(tok_) && IsPunctToken(Peek(), ":")) {
    auto labeled = MakeNode(NodeKind::kLabeledStatement);
    labeled->text = tok_.text;
    labeled->Add(ParseIdentifier());
    Advance();  // ':'
    labeled->Add(ParseStatement());
    return labeled;
  }

  auto stmt = MakeNode(NodeKind::kExpressionStatement);
  stmt->Add(ParseExpression());
  ConsumeSemicolon();
  return stmt;
}

NodePtr Parser::ParseBlock() {
  auto block = MakeNode(NodeKind::kBlockStatement);
  Expect("{");
  while (!IsPunct("}")) {
    if (tok_.kind == TokenKind::kEof) {
      Unexpected();
    }
    block->Add(ParseStatement());
  }
  Advance();
  return block;
}

NodePtr Parser::ParseVariableDeclaration() {
  auto decl = MakeNode(NodeKind::kVariableDeclaration);
  decl->text = tok_.text;
  Advance();
  while (true) {
    auto declarator = MakeNode(NodeKind::kVariableDeclarator);
    declarator->Add(ParseBindingTarget());
    if (IsPunct("=")) {
      Advance();
      declarator->Add(ParseAssignment());
    }
    decl->Add(std::move(declarator));
    if (!IsPunct(",")) {
      break;
    }
    Advance();
  }
  return decl;
}

NodePtr Parser::ParseFunction(NodeKind kind) {
  auto fn = MakeNode(kind);
  Advance();  // function
  if (IsPunct("*")) {
    Fail("Generators are not supported");
  }
  if (tok_.kind == TokenKind::kName) {
    fn->Add(ParseIdentifier());
  } else if (kind == NodeKind::kFunctionDeclaration) {
    Unexpected();
  }
  fn->Add(ParseParameters());
  fn->Add(ParseFunctionBlock());
  return fn;
}

NodePtr Parser::ParseIf() {
  auto stmt = MakeNode(NodeKind::kIfStatement);
  Advance();
  Expect("(");
  stmt->Add(ParseExpression());
  Expect(")");
  stmt->Add(ParseStatement());
  if (IsKeyword("else")) {
    Advance();
    stmt->Add(ParseStatement());
  }
  return stmt;
}

NodePtr Parser::ParseFor() {
  Token at = tok_;
  Advance();
  if (IsKeyword("await")) {
    Fail("for await is not supported");
  }
  Expect("(");

  NodePtr init;
  if (IsPunct(";")) {
    init = MakeNode(NodeKind::kEmptyStatement);
  } else {
    NoInScope scope(this, true);
    bool declaration = IsKeyword("var") || IsKeyword("const");
    if (IsKeyword("let")) {
      Token next = Peek();
      declaration = next.kind == TokenKind::kName || IsPunctToken(next, "[") ||
                    IsPunctToken(next, "{");
    }
    init = declaration ? ParseVariableDeclaration() : ParseExpression();
  }

  if (IsKeyword("of") || IsKeyword("in")) {
    bool of = tok_.text == "of";
    auto loop = MakeNode(of ? NodeKind::kForOfStatement : NodeKind::kForInStatement, at);
    Advance();
    loop->Add(std::move(init));
    loop->Add(of ? ParseAssignment() : ParseExpression());
    Expect(")");
    loop->Add(ParseStatement());
    return loop;
  }

  auto loop = MakeNode(NodeKind::kForStatement, at);
  loop->Add(std::move(init));
  Expect(";");
  loop->Add(IsPunct(";") ? MakeNode(NodeKind::kEmptyStatement) : ParseExpression());
  Expect(";");
  loop->Add(IsPunct(")") ? MakeNode(NodeKind::kEmptyStatement) : ParseExpression());
  Expect(")");
  loop->Add(ParseStatement());
  return loop;
}

NodePtr Parser::ParseWhile() {
  auto loop = MakeNode(NodeKind::kWhileStatement);
  Advance();
  Expect("(");
  loop->Add(ParseExpression());
  Expect(")");
  loop->Add(ParseStatement());
  return loop;
}

NodePtr Parser::ParseDoWhile() {
  auto loop = MakeNode(NodeKind::kDoWhileStatement);
  Advance();
  loop->Add(ParseStatement());
  if (!IsKeyword("while")) {
    Unexpected();
  }
  Advance();
  Expect("(");
  loop->Add(ParseExpression());
  Expect(")");
  if (IsPunct(";")) {
    Advance();
  }
  return loop;
}

NodePtr Parser::ParseJump(NodeKind kind) {
  auto stmt = MakeNode(kind);
  Advance();
  if (tok_.kind == TokenKind::kName && !tok_.newline_before && !IsReserved(tok_)) {
    stmt->Add(ParseIdentifier());
  }
  ConsumeSemicolon();
  return stmt;
}

NodePtr Parser::ParseReturn() {
  auto stmt = MakeNode(NodeKind::kReturnStatement);
  Advance();
  if (!IsPunct(";") && !IsPunct("}") && tok_.kind != TokenKind::kEof && !tok_.newline_before) {
    stmt->Add(ParseExpression());
  }
  ConsumeSemicolon();
  return stmt;
}

NodePtr Parser::ParseThrow() {
  auto stmt = MakeNode(NodeKind::kThrowStatement);
  Advance();
  if (tok_.newline_before) {
    Fail("Illegal newline after throw");
  }
  stmt->Add(ParseExpression());
  ConsumeSemicolon();
  return stmt;
}

NodePtr Parser::ParseTry() {
  auto stmt = MakeNode(NodeKind::kTryStatement);
  Advance();
  stmt->Add(ParseBlock());
  bool handled = false;
  if (IsKeyword("catch")) {
    auto clause = MakeNode(NodeKind::kCatchClause);
    Advance();
    if (IsPunct("(")) {
      Advance();
      clause->Add(ParseBindingTarget());
      Expect(")");
    }
    clause->Add(ParseBlock());
    stmt->Add(std::move(clause));
    handled = true;
  }
  if (IsKeyword("finally")) {
    Advance();
    stmt->Add(ParseBlock());
    handled = true;
  }
  if (!handled) {
    Fail("Missing catch or finally after try");
  }
  return stmt;
}

NodePtr Parser::ParseSwitch() {
  auto stmt = MakeNode(NodeKind::kSwitchStatement);
  Advance();
  Expect("(");
  stmt->Add(ParseExpression());
  Expect(")");
  Expect("{");
  while (!IsPunct("}")) {
    auto clause = MakeNode(NodeKind::kSwitchCase);
    if (IsKeyword("case")) {
      Advance();
      clause->Add(ParseExpression());
    } else if (IsKeyword("default")) {
      clause->text = "default";
      Advance();
    } else {
      Unexpected();
    }
    Expect(":");
    while (!IsPunct("}") && !IsKeyword("case") && !IsKeyword("default")) {
      if (tok_.kind == TokenKind::kEof) {
        Unexpected();
      }
      clause->Add(ParseStatement());
    }
    stmt->Add(std::move(clause));
  }
  Advance();
  return stmt;
}

NodePtr Parser::ParseWith() {
  auto stmt = MakeNode(NodeKind::kWithStatement);
  Advance();
  Expect("(");
  stmt->Add(ParseExpression());
  Expect(")");
  stmt->Add(ParseStatement());
  return stmt;
}

NodePtr Parser::ParseImportDeclaration() {
  auto decl = MakeNode(NodeKind::kImportDeclaration);
  decl->text = "import";
  Advance();
  SkipModuleClause(decl.get());
  return decl;
}

NodePtr Parser::ParseExportDeclaration() {
  auto decl = MakeNode(NodeKind::kExportDeclaration);
  decl->text = "export";
  Advance();
  if (IsKeyword("var") || IsKeyword("let") || IsKeyword("const")) {
    decl->Add(ParseVariableDeclaration());
    ConsumeSemicolon();
  } else if (IsKeyword("function")) {
    decl->Add(ParseFunction(NodeKind::kFunctionDeclaration));
  } else if (IsKeyword("class")) {
    Fail("Classes are not supported");
  } else if (IsKeyword("default")) {
    Advance();
    if (IsKeyword("function")) {
      decl->Add(ParseFunction(NodeKind::kFunctionExpression));
    } else {
      decl->Add(ParseAssignment());
      ConsumeSemicolon();
    }
  } else {
    SkipModuleClause(decl.get());
  }
  return decl;
}

// Import/export clauses carry no executable code: bindings in braces, `*`,
// `as` renames and a module specifier string. The clause ends after the
// specifier, or after the closing brace when no `from` follows.
void Parser::SkipModuleClause(Node* decl) {
  int depth = 0;
  while (tok_.kind != TokenKind::kEof) {
    if (depth == 0 && IsPunct(";")) {
      Advance();
      return;
    }
    bool closes_clause = false;
    if (IsPunct("{")) {
      ++depth;
    } else if (IsPunct("}")) {
      if (depth == 0) {
        Unexpected();
      }
      closes_clause = --depth == 0;
    } else if (tok_.kind == TokenKind::kString && depth == 0) {
      auto specifier = MakeNode(NodeKind::kStringLiteral);
      specifier->text = tok_.text;
      decl->Add(std::move(specifier));
      closes_clause = true;
    }
    Advance();
    if (closes_clause && !IsKeyword("from") && !IsKeyword("as")) {
      ConsumeSemicolon();
      return;
    }
  }
}

// ---------------------------------------------------------------------------
// Functions and bindings
// ---------------------------------------------------------------------------

NodePtr Parser::ParseParameters() {
  auto params = MakeNode(NodeKind::kParameters);
  Expect("(");
  NoInScope scope(this, false);
  while (!IsPunct(")")) {
    if (IsPunct("...")) {
      auto rest = MakeNode(NodeKind::kSpreadElement);
      Advance();
      rest->Add(ParseBindingTarget());
      params->Add(std::move(rest));
    } else {
      params->Add(ParseBindingElement());
    }
    if (!IsPunct(",")) {
      break;
    }
    Advance();
  }
  Expect(")");
  return params;
}

NodePtr Parser::ParseFunctionBlock() {
  NoInScope scope(this, false);
  return ParseBlock();
}

NodePtr Parser::ParseBindingElement() {
  Token at = tok_;
  auto target = ParseBindingTarget();
  if (!IsPunct("=")) {
    return target;
  }
  auto with_default = MakeNode(NodeKind::kAssignmentExpression, at);
  with_default->text = "=";
  Advance();
  with_default->Add(std::move(target));
  with_default->Add(ParseAssignment());
  return with_default;
}

NodePtr Parser::ParseBindingTarget() {
  DepthGuard guard(this);

  if (IsPunct("[")) {
    auto pattern = MakeNode(NodeKind::kArrayExpression);
    Advance();
    while (!IsPunct("]")) {
      if (IsPunct(",")) {
        pattern->Add(MakeNode(NodeKind::kElision));
        Advance();
        continue;
      }
      if (IsPunct("...")) {
        auto rest = MakeNode(NodeKind::kSpreadElement);
        Advance();
        rest->Add(ParseBindingTarget());
        pattern->Add(std::move(rest));
      } else {
        pattern->Add(ParseBindingElement());
      }
      if (!IsPunct(",")) {
        break;
      }
      Advance();
    }
    Expect("]");
    return pattern;
  }

  if (IsPunct("{")) {
    auto pattern = MakeNode(NodeKind::kObjectExpression);
    Advance();
    while (!IsPunct("}")) {
      if (IsPunct("...")) {
        auto rest = MakeNode(NodeKind::kSpreadElement);
        Advance();
        rest->Add(ParseBindingTarget());
        pattern->Add(std::move(rest));
      } else {
        Token key_token = tok_;
        auto prop = MakeNode(NodeKind::kProperty);
        prop->Add(ParsePropertyKey(prop.get()));
        if (IsPunct(":")) {
          prop->text = "init";
          Advance();
          prop->Add(ParseBindingElement());
        } else {
          if (prop->computed || key_token.kind != TokenKind::kName || IsReserved(key_token)) {
            Unexpected();
          }
          prop->text = "shorthand";
          if (IsPunct("=")) {
            Advance();
            prop->Add(ParseAssignment());
          }
        }
        pattern->Add(std::move(prop));
      }
      if (!IsPunct(",")) {
        break;
      }
      Advance();
    }
    Expect("}");
    return pattern;
  }

  return ParseIdentifier();
}

// Arrow parameters look like a parenthesized expression until `=>`, so scan
// ahead to the matching paren. One scan settles every paren nested inside it,
// keeping nested groups linear. Scan failures mean "not an arrow"; the real
// parse reports them.
bool Parser::ArrowAhead() {
  if (tok_.kind == TokenKind::kName && !IsReserved(tok_)) {
    Token next = Peek();
    return IsPunctToken(next, "=>") && !next.newline_before;
  }
  if (!IsPunct("(")) {
    return false;
  }
  auto known = arrow_after_paren_.find(tok_.start);
  if (known != arrow_after_paren_.end()) {
    return known->second;
  }

  Lexer::State saved = lexer_.Save();
  // (offset, is_paren) of every opener still waiting for its closer
  std::vector<std::pair<size_t, bool>> open = {{tok_.start, true}};
  try {
    while (!open.empty()) {
      Token t = lexer_.Next();
      if (t.kind == TokenKind::kEof) {
        break;
      }
      if (t.kind != TokenKind::kPunct) {
        continue;
      }
      if (t.text == "(" || t.text == "[" || t.text == "{") {
        open.emplace_back(t.start, t.text == "(");
      } else if (t.text == ")" || t.text == "]" || t.text == "}") {
        auto [offset, is_paren] = open.back();
        open.pop_back();
        if (is_paren) {
          Lexer::State after_close = lexer_.Save();
          Token next = lexer_.Next();
          lexer_.Restore(after_close);
          arrow_after_paren_[offset] = IsPunctToken(next, "=>") && !next.newline_before;
        }
      }
    }
  } catch (const ParseError&) {
    // Unscannable tail: whatever is still open below is not an arrow head
  }
  for (const auto& [offset, is_paren] : open) {
    if (is_paren) arrow_after_paren_[offset] = false;
  }
  lexer_.Restore(saved);
  return arrow_after_paren_[tok_.start];
}

NodePtr Parser::ParseArrow() {
  auto fn = MakeNode(NodeKind::kArrowFunction);
  if (tok_.kind == TokenKind::kName) {
    auto params = MakeNode(NodeKind::kParameters);
    params->Add(ParseIdentifier());
    fn->Add(std::move(params));
  } else {
    fn->Add(ParseParameters());
  }
  Expect("=>");
  if (IsPunct("{")) {
    fn->Add(ParseFunctionBlock());
  } else {
    fn->Add(ParseAssignment());
  }
  return fn;
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

NodePtr Parser::ParseExpression() {
  Token at = tok_;
  auto first = ParseAssignment();
  if (!IsPunct(",")) {
    return first;
  }
  auto sequence = MakeNode(NodeKind::kSequenceExpression, at);
  sequence->Add(std::move(first));
  while (IsPunct(",")) {
    Advance();
    sequence->Add(ParseAssignment());
  }
  return sequence;
}

NodePtr Parser::ParseAssignment() {
  DepthGuard guard(this);

  if (ArrowAhead()) {
    return ParseArrow();
  }
  if (IsKeyword("async")) {
    Token next = Peek();
    if (!next.newline_before && next.kind == TokenKind::kName && next.text != "in" &&
        next.text != "instanceof") {
      Fail("Async functions are not supported");
    }
  }

  Token at = tok_;
  auto left = ParseConditional();
  if (tok_.kind != TokenKind::kPunct || kAssignmentOperators.count(tok_.text) == 0) {
    return left;
  }
  if (!IsAssignable(*left)) {
    Fail("Invalid assignment target");
  }
  auto assign = MakeNode(NodeKind::kAssignmentExpression, at);
  assign->text = tok_.text;
  Advance();
  assign->Add(std::move(left));
  assign->Add(ParseAssignment());
  return assign;
}

NodePtr Parser::ParseConditional() {
  Token at = tok_;
  auto test = ParseBinary(0);
  if (!IsPunct("?")) {
    return test;
  }
  auto cond = MakeNode(NodeKind::kConditionalExpression, at);
  Advance();
  cond->Add(std::move(test));
  {
    NoInScope scope(this, false);
    cond->Add(ParseAssignment());
  }
  Expect(":");
  cond->Add(ParseAssignment());
  return cond;
}

int Parser::BinaryPrecedence() const {
  if (tok_.kind == TokenKind::kName && !tok_.escaped) {
    if (tok_.text == "instanceof") return 7;
    if (tok_.text == "in") return no_in_ ? -1 : 7;
    return -1;
  }
  if (tok_.kind != TokenKind::kPunct) {
    return -1;
  }
  const std::string& op = tok_.text;
  if (op == "??" || op == "||") return 1;
  if (op == "&&") return 2;
  if (op == "|") return 3;
  if (op == "^") return 4;
  if (op == "&") return 5;
  if (op == "==" || op == "!=" || op == "===" || op == "!==") return 6;
  if (op == "<" || op == ">" || op == "<=" || op == ">=") return 7;
  if (op == "<<" || op == ">>" || op == ">>>") return 8;
  if (op == "+" || op == "-") return 9;
  if (op == "*" || op == "/" || op == "%") return 10;
  if (op == "**") return 11;
  return -1;
}

NodePtr Parser::ParseBinary(int min_precedence) {
  Token at = tok_;
  auto left = ParseUnary();
  DepthGuard chain(this);
  while (true) {
    int precedence = BinaryPrecedence();
    if (precedence < 0 || precedence < min_precedence) {
      break;
    }
    chain.Extend();
    std::string op = tok_.text;
    Advance();
    // ** is right-associative
    auto right = ParseBinary(op == "**" ? precedence : precedence + 1);
    bool logical = op == "||" || op == "&&" || op == "??";
    auto node = MakeNode(logical ? NodeKind::kLogicalExpression : NodeKind::kBinaryExpression, at);
    node->text = op;
    node->Add(std::move(left));
    node->Add(std::move(right));
    left = std::move(node);
  }
  return left;
}

NodePtr Parser::ParseUnary() {
  DepthGuard guard(this);

  if (IsPunct("!") || IsPunct("~") || IsPunct("+") || IsPunct("-") || IsKeyword("typeof") ||
      IsKeyword("void") || IsKeyword("delete")) {
    auto unary = MakeNode(NodeKind::kUnaryExpression);
    unary->text = tok_.text;
    Advance();
    unary->Add(ParseUnary());
    return unary;
  }
  if (IsPunct("++") || IsPunct("--")) {
    auto update = MakeNode(NodeKind::kUpdateExpression);
    update->text = tok_.text;
    update->computed = true;  // prefix
    Advance();
    update->Add(ParseUnary());
    return update;
  }

  Token at = tok_;
  auto expr = ParseLeftHandSide(true);
  if ((IsPunct("++") || IsPunct("--")) && !tok_.newline_before) {
    auto update = MakeNode(NodeKind::kUpdateExpression, at);
    update->text = tok_.text;
    Advance();
    update->Add(std::move(expr));
    return update;
  }
  return expr;
}

NodePtr Parser::ParseLeftHandSide(bool allow_call) {
  Token at = tok_;
  NodePtr expr;
  if (IsKeyword("new")) {
    expr = ParseNew();
  } else if (IsKeyword("import")) {
    expr = ParseImportExpression();
  } else if (IsKeyword("super")) {
    Fail("super is not supported");
  } else {
    expr = ParsePrimary();
  }

  auto property_name = [this]() {
    if (tok_.kind != TokenKind::kName) {
      Unexpected();
    }
    auto name = MakeNode(NodeKind::kIdentifier);
    name->text = tok_.text;
    name->escaped = tok_.escaped;
    Advance();
    return name;
  };

  DepthGuard chain(this);
  while (true) {
    chain.Extend();
    if (IsPunct(".")) {
      Advance();
      auto member = MakeNode(NodeKind::kMemberExpression, at);
      member->Add(std::move(expr));
      member->Add(property_name());
      expr = std::move(member);
    } else if (IsPunct("?.")) {
      if (!allow_call) {
        Fail("Optional chain is not allowed in a new expression");
      }
      Advance();
      if (IsPunct("(")) {
        auto call = MakeNode(NodeKind::kCallExpression, at);
        call->optional = true;
        call->Add(std::move(expr));
        ParseArguments(call.get());
        expr = std::move(call);
      } else if (IsPunct("[")) {
        auto member = MakeNode(NodeKind::kMemberExpression, at);
        member->computed = true;
        member->optional = true;
        Advance();
        NoInScope scope(this, false);
        member->Add(std::move(expr));
        member->Add(ParseExpression());
        Expect("]");
        expr = std::move(member);
      } else {
        auto member = MakeNode(NodeKind::kMemberExpression, at);
        member->optional = true;
        member->Add(std::move(expr));
        member->Add(property_name());
        expr = std::move(member);
      }
    } else if (IsPunct("[")) {
      auto member = MakeNode(NodeKind::kMemberExpression, at);
      member->computed = true;
      Advance();
      NoInScope scope(this, false);
      member->Add(std::move(expr));
      member->Add(ParseExpression());
      Expect("]");
      expr = std::move(member);
    } else if (IsPunct("(") && allow_call) {
      auto call = MakeNode(NodeKind::kCallExpression, at);
      call->Add(std::move(expr));
      ParseArguments(call.get());
      expr = std::move(call);
    } else if (tok_.kind == TokenKind::kTemplate) {
      auto tagged = MakeNode(NodeKind::kTaggedTemplate, at);
      tagged->Add(std::move(expr));
      tagged->Add(ParseTemplate());
      expr = std::move(tagged);
    } else {
      break;
    }
  }
  return expr;
}

NodePtr Parser::ParseNew() {
  // new new new ... recurses through ParseLeftHandSide before its chain guard
  DepthGuard guard(this);
  Token at = tok_;
  Advance();  // new
  if (IsPunct(".")) {
    Advance();
    if (tok_.kind != TokenKind::kName || tok_.text != "target") {
      Unexpected();
    }
    auto meta = MakeNode(NodeKind::kMetaProperty, at);
    meta->text = "new.target";
    Advance();
    return meta;
  }
  auto node = MakeNode(NodeKind::kNewExpression, at);
  node->Add(ParseLeftHandSide(false));
  if (IsPunct("(")) {
    ParseArguments(node.get());
  }
  return node;
}

NodePtr Parser::ParseImportExpression() {
  Token at = tok_;
  Advance();  // import
  if (IsPunct("(")) {
    auto call = MakeNode(NodeKind::kImportCall, at);
    ParseArguments(call.get());
    return call;
  }
  if (IsPunct(".")) {
    Advance();
    if (tok_.kind != TokenKind::kName || tok_.text != "meta") {
      Unexpected();
    }
    auto meta = MakeNode(NodeKind::kMetaProperty, at);
    meta->text = "import.meta";
    Advance();
    return meta;
  }
  Unexpected();
}

void Parser::ParseArguments(Node* call) {
  Expect("(");
  NoInScope scope(this, false);
  while (!IsPunct(")")) {
    if (IsPunct("...")) {
      auto spread = MakeNode(NodeKind::kSpreadElement);
      Advance();
      spread->Add(ParseAssignment());
      call->Add(std::move(spread));
    } else {
      call->Add(ParseAssignment());
    }
    if (!IsPunct(",")) {
      break;
    }
    Advance();
  }
  Expect(")");
}

NodePtr Parser::ParsePrimary() {
  switch (tok_.kind) {
    case TokenKind::kName: {
      if (!tok_.escaped) {
        const std::string& word = tok_.text;
        if (word == "this") {
          auto node = MakeNode(NodeKind::kThisExpression);
          Advance();
          return node;
        }
        if (word == "null") {
          auto node = MakeNode(NodeKind::kNullLiteral);
          Advance();
          return node;
        }
        if (word == "true" || word == "false") {
          auto node = MakeNode(NodeKind::kBooleanLiteral);
          node->text = word;
          Advance();
          return node;
        }
        if (word == "function") {
          return ParseFunction(NodeKind::kFunctionExpression);
        }
        if (word == "class") {
          Fail("Classes are not supported");
        }
      }
      return ParseIdentifier();
    }
    case TokenKind::kNumber: {
      auto node = MakeNode(NodeKind::kNumericLiteral);
      node->text = tok_.text;
      Advance();
      return node;
    }
    case TokenKind::kString: {
      auto node = MakeNode(NodeKind::kStringLiteral);
      node->text = tok_.text;
      Advance();
      return node;
    }
    case TokenKind::kTemplate:
      return ParseTemplate();
    case TokenKind::kPunct: {
      if (IsPunct("(")) {
        Advance();
        NoInScope scope(this, false);
        auto inner = ParseExpression();
        Expect(")");
        return inner;
      }
      if (IsPunct("[")) {
        return ParseArrayLiteral();
      }
      if (IsPunct("{")) {
        return ParseObjectLiteral();
      }
      if (IsPunct("/") || IsPunct("/=")) {
        tok_ = lexer_.RescanAsRegex(tok_);
        auto node = MakeNode(NodeKind::kRegExpLiteral);
        node->text = tok_.text;
        Advance();
        return node;
      }
      break;
    }
    case TokenKind::kRegex:
    case TokenKind::kEof:
      break;
  }
  Unexpected();
}

NodePtr Parser::ParseArrayLiteral() {
  auto array = MakeNode(NodeKind::kArrayExpression);
  Advance();
  NoInScope scope(this, false);
  while (!IsPunct("]")) {
    if (IsPunct(",")) {
      array->Add(MakeNode(NodeKind::kElision));
      Advance();
      continue;
    }
    if (IsPunct("...")) {
      auto spread = MakeNode(NodeKind::kSpreadElement);
      Advance();
      spread->Add(ParseAssignment());
      array->Add(std::move(spread));
    } else {
      array->Add(ParseAssignment());
    }
    if (!IsPunct(",")) {
      break;
    }
    Advance();
  }
  Expect("]");
  return array;
}

NodePtr Parser::ParseObjectLiteral() {
  auto object = MakeNode(NodeKind::kObjectExpression);
  Advance();
  NoInScope scope(this, false);
  while (!IsPunct("}")) {
    if (IsPunct("...")) {
      auto spread = MakeNode(NodeKind::kSpreadElement);
      Advance();
      spread->Add(ParseAssignment());
      object->Add(std::move(spread));
    } else {
      if (IsPunct("*")) {
        Fail("Generators are not supported");
      }
      Token start = tok_;
      auto prop = MakeNode(NodeKind::kProperty);

      bool accessor = false;
      if (tok_.kind == TokenKind::kName && !tok_.escaped &&
          (tok_.text == "get" || tok_.text == "set" || tok_.text == "async")) {
        Token next = Peek();
        bool plain_key = next.kind == TokenKind::kPunct &&
                         (next.text == "," || next.text == ":" || next.text == "(" ||
                          next.text == "}" || next.text == "=");
        if (!plain_key) {
          if (start.text == "async") {
            Fail("Async functions are not supported");
          }
          accessor = true;
        }
      }

      if (accessor) {
        prop->text = start.text;
        Advance();
        prop->Add(ParsePropertyKey(prop.get()));
        prop->Add(ParseMethod(start));
      } else {
        prop->Add(ParsePropertyKey(prop.get()));
        if (IsPunct(":")) {
          prop->text = "init";
          Advance();
          prop->Add(ParseAssignment());
        } else if (IsPunct("(")) {
          prop->text = "method";
          prop->Add(ParseMethod(start));
        } else if (start.kind == TokenKind::kName && !prop->computed && !IsReserved(start)) {
          prop->text = "shorthand";
          if (IsPunct("=")) {
            Advance();
            prop->Add(ParseAssignment());
          }
        } else {
          Unexpected();
        }
      }
      object->Add(std::move(prop));
    }
    if (!IsPunct(",")) {
      break;
    }
    Advance();
  }
  Expect("}");
  return object;
}

NodePtr Parser::ParsePropertyKey(Node* property) {
  if (tok_.kind == TokenKind::kName) {
    auto key = MakeNode(NodeKind::kIdentifier);
    key->text = tok_.text;
    key->escaped = tok_.escaped;
    Advance();
    return key;
  }
  if (tok_.kind == TokenKind::kString || tok_.kind == TokenKind::kNumber) {
    auto key = MakeNode(tok_.kind == TokenKind::kString ? NodeKind::kStringLiteral
                                                        : NodeKind::kNumericLiteral);
    key->text = tok_.text;
    Advance();
    return key;
  }
  if (IsPunct("[")) {
    property->computed = true;
    Advance();
    NoInScope scope(this, false);
    auto key = ParseAssignment();
    Expect("]");
    return key;
  }
  Unexpected();
}

NodePtr Parser::ParseMethod(const Token& at) {
  auto fn = MakeNode(NodeKind::kFunctionExpression, at);
  fn->Add(ParseParameters());
  fn->Add(ParseFunctionBlock());
  return fn;
}

NodePtr Parser::ParseTemplate() {
  auto tpl = MakeNode(NodeKind::kTemplateLiteral);
  while (true) {
    auto chunk = MakeNode(NodeKind::kTemplateElement);
    chunk->text = tok_.text;
    tpl->Add(std::move(chunk));
    if (tok_.template_tail) {
      Advance();
      return tpl;
    }
    Advance();
    {
      NoInScope scope(this, false);
      tpl->Add(ParseExpression());
    }
    if (!IsPunct("}")) {
      Unexpected();
    }
    tok_ = lexer_.ContinueTemplate(tok_);
  }
}

}  // namespace slotbox

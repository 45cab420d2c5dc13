#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "validator/ast.h"
#include "validator/lexer.h"

namespace slotbox {

/**
 * Recursive-descent parser for slot bodies.
 *
 * The source is parsed as the body of a function, so top-level `return` is
 * legal. Constructs outside the supported subset (classes, generators, async
 * functions, private names, decorators, `super`) throw ParseError.
 *
 * import/export declarations are kept as opaque nodes so the walker can name
 * them; export of a declaration still parses the declaration.
 */
class Parser {
 public:
  explicit Parser(std::string_view source);

  /**
   * Parse the whole source. Returns a kFunctionBody node.
   * Throws ParseError on unsupported or malformed input.
   */
  NodePtr ParseFunctionBody();

  std::vector<LexHazard> Hazards() const { return lexer_.Hazards(); }

 private:
  // Token stream
  void Advance();
  Token Peek();
  bool IsPunct(const char* text) const;
  bool IsKeyword(const char* text) const;
  void Expect(const char* punct);
  void ConsumeSemicolon();
  [[noreturn]] void Fail(const std::string& message) const;
  [[noreturn]] void Unexpected() const;

  NodePtr MakeNode(NodeKind kind) const;
  NodePtr MakeNode(NodeKind kind, const Token& at) const;

  // Statements
  NodePtr ParseStatement();
  NodePtr ParseBlock();
  NodePtr ParseVariableDeclaration();
  NodePtr ParseFunction(NodeKind kind);
  NodePtr ParseIf();
  NodePtr ParseFor();
  NodePtr ParseWhile();
  NodePtr ParseDoWhile();
  NodePtr ParseJump(NodeKind kind);
  NodePtr ParseReturn();
  NodePtr ParseThrow();
  NodePtr ParseTry();
  NodePtr ParseSwitch();
  NodePtr ParseWith();
  NodePtr ParseImportDeclaration();
  NodePtr ParseExportDeclaration();
  void SkipModuleClause(Node* decl);

  // Functions and bindings
  NodePtr ParseParameters();
  NodePtr ParseFunctionBlock();
  NodePtr ParseBindingTarget();
  NodePtr ParseBindingElement();
  bool ArrowAhead();
  NodePtr ParseArrow();

  // Expressions
  NodePtr ParseExpression();
  NodePtr ParseAssignment();
  NodePtr ParseConditional();
  NodePtr ParseBinary(int min_precedence);
  NodePtr ParseUnary();
  NodePtr ParseLeftHandSide(bool allow_call);
  NodePtr ParseNew();
  NodePtr ParseImportExpression();
  void ParseArguments(Node* call);
  NodePtr ParsePrimary();
  NodePtr ParseArrayLiteral();
  NodePtr ParseObjectLiteral();
  NodePtr ParsePropertyKey(Node* property);
  NodePtr ParseMethod(const Token& at);
  NodePtr ParseTemplate();
  NodePtr ParseIdentifier();

  int BinaryPrecedence() const;

  // Bounds AST depth on hostile input. Left-nested chains (a.b.c, a+b+c)
  // Extend() once per link since they deepen the tree without recursing.
  class DepthGuard {
   public:
    explicit DepthGuard(Parser* parser) : parser_(parser) { Extend(); }
    ~DepthGuard() { parser_->depth_ -= count_; }

    void Extend();

   private:
    Parser* parser_;
    int count_ = 0;
  };

  // `in` is not a binary operator inside a for-statement head
  class NoInScope {
   public:
    NoInScope(Parser* parser, bool no_in) : parser_(parser), saved_(parser->no_in_) {
      parser_->no_in_ = no_in;
    }
    ~NoInScope() { parser_->no_in_ = saved_; }

   private:
    Parser* parser_;
    bool saved_;
  };

  Lexer lexer_;
  Token tok_;
  int depth_ = 0;
  bool no_in_ = false;

  // ArrowAhead results keyed by the source offset of the `(`
  std::map<size_t, bool> arrow_after_paren_;
};

}  // namespace slotbox

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <string>
#include <vector>

#include "validator/parser.h"

using namespace slotbox;
using Catch::Matchers::ContainsSubstring;

namespace {

NodePtr Parse(const std::string& source) {
  Parser parser(source);
  return parser.ParseFunctionBody();
}

void Collect(const Node& node, NodeKind kind, std::vector<const Node*>* out) {
  if (node.kind == kind) out->push_back(&node);
  for (const auto& child : node.children) {
    Collect(*child, kind, out);
  }
}

std::vector<const Node*> FindAll(const Node& root, NodeKind kind) {
  std::vector<const Node*> out;
  Collect(root, kind, &out);
  return out;
}

}  // namespace

TEST_CASE("Parser accepts top-level return", "[parser][statements]") {
  auto body = Parse("return 1;");
  REQUIRE(body->kind == NodeKind::kFunctionBody);
  REQUIRE(body->children.size() == 1);
  REQUIRE(body->children[0]->kind == NodeKind::kReturnStatement);
}

TEST_CASE("Parser operator precedence", "[parser][expressions]") {
  auto body = Parse("return a + b * c;");
  const Node& sum = *body->children[0]->children[0];
  REQUIRE(sum.kind == NodeKind::kBinaryExpression);
  REQUIRE(sum.text == "+");
  REQUIRE(sum.children[1]->kind == NodeKind::kBinaryExpression);
  REQUIRE(sum.children[1]->text == "*");

  SECTION("exponent is right-associative") {
    auto pow = Parse("return a ** b ** c;");
    const Node& outer = *pow->children[0]->children[0];
    REQUIRE(outer.text == "**");
    REQUIRE(outer.children[0]->kind == NodeKind::kIdentifier);
    REQUIRE(outer.children[1]->text == "**");
  }

  SECTION("logical operators") {
    auto logical = Parse("return a ?? b || c;");
    REQUIRE_FALSE(FindAll(*logical, NodeKind::kLogicalExpression).empty());
  }
}

TEST_CASE("Parser covers slot-style code", "[parser][statements]") {
  const char* source = R"(
    const values = input.rows.map((r) => r.value);
    let total = 0;
    for (const v of values) { total += v; }
    for (let i = 0; i < values.length; i++) { if (i % 2) continue; }
    for (const k in params) {}
    const grouped = utils.groupBy(input.rows, function (r) { return r.kind; });
    const { a, b: [c, ...rest] = [] } = params;
    const label = `total ${total} of ${values.length}`;
    try { JSON.parse('x'); } catch (e) { total = -1; } finally {}
    switch (total) { case 0: break; default: total++; }
    const re = /a+b/g.test('aab') ? 1 : 0;
    outer: while (true) { do { break outer; } while (false); }
    return { total, label, grouped, mean: utils.mean(values), re, ok: a?.b?.[0] ?? null };
  )";
  auto body = Parse(source);
  REQUIRE(FindAll(*body, NodeKind::kArrowFunction).size() == 1);
  REQUIRE(FindAll(*body, NodeKind::kForOfStatement).size() == 1);
  REQUIRE(FindAll(*body, NodeKind::kForInStatement).size() == 1);
  REQUIRE(FindAll(*body, NodeKind::kTemplateLiteral).size() == 1);
  REQUIRE(FindAll(*body, NodeKind::kRegExpLiteral).size() == 1);
  REQUIRE(FindAll(*body, NodeKind::kTryStatement).size() == 1);
  REQUIRE(FindAll(*body, NodeKind::kLabeledStatement).size() == 1);
  REQUIRE(FindAll(*body, NodeKind::kReturnStatement).size() == 2);
}

TEST_CASE("Parser distinguishes division from regex", "[parser][regex]") {
  auto body = Parse("const x = a / b / c; return x;");
  REQUIRE(FindAll(*body, NodeKind::kRegExpLiteral).empty());
  REQUIRE(FindAll(*body, NodeKind::kBinaryExpression).size() == 2);
}

TEST_CASE("Parser inserts semicolons", "[parser][asi]") {
  auto body = Parse("let a = 1\nlet b = 2\nreturn a + b");
  REQUIRE(body->children.size() == 3);

  SECTION("return followed by newline returns nothing") {
    auto bare = Parse("return\n42");
    REQUIRE(bare->children[0]->kind == NodeKind::kReturnStatement);
    REQUIRE(bare->children[0]->children.empty());
  }
}

TEST_CASE("Parser member expressions", "[parser][members]") {
  auto body = Parse("return a['b'].c`t`;");
  auto members = FindAll(*body, NodeKind::kMemberExpression);
  REQUIRE(members.size() == 2);
  bool saw_computed = false;
  for (const Node* m : members) {
    if (m->computed) {
      saw_computed = true;
      REQUIRE(m->children[1]->kind == NodeKind::kStringLiteral);
      REQUIRE(m->children[1]->text == "b");
    }
  }
  REQUIRE(saw_computed);
  REQUIRE(FindAll(*body, NodeKind::kTaggedTemplate).size() == 1);
}

TEST_CASE("Parser keeps module syntax as nodes", "[parser][modules]") {
  auto body = Parse("import x from 'y';\nexport const z = 1;\nreturn import('m');");
  REQUIRE(FindAll(*body, NodeKind::kImportDeclaration).size() == 1);
  REQUIRE(FindAll(*body, NodeKind::kExportDeclaration).size() == 1);
  REQUIRE(FindAll(*body, NodeKind::kImportCall).size() == 1);
  // exported declaration is still parsed
  REQUIRE(FindAll(*body, NodeKind::kVariableDeclaration).size() == 1);
}

TEST_CASE("Parser meta properties", "[parser][meta]") {
  auto body = Parse("function f() { return new.target; } return import.meta;");
  auto metas = FindAll(*body, NodeKind::kMetaProperty);
  REQUIRE(metas.size() == 2);
  REQUIRE(metas[0]->text == "new.target");
  REQUIRE(metas[1]->text == "import.meta");
}

TEST_CASE("Parser rejects unsupported constructs", "[parser][errors]") {
  REQUIRE_THROWS_WITH(Parse("class A {} return 1;"), ContainsSubstring("Classes"));
  REQUIRE_THROWS_WITH(Parse("function* g() {} return 1;"), ContainsSubstring("Generators"));
  REQUIRE_THROWS_WITH(Parse("async function f() {} return 1;"), ContainsSubstring("Async"));
  REQUIRE_THROWS_AS(Parse("return (1;"), ParseError);
  REQUIRE_THROWS_AS(Parse("return 1 +;"), ParseError);
  REQUIRE_THROWS_AS(Parse("1 = 2; return 1;"), ParseError);
}

TEST_CASE("Parser reports error positions", "[parser][errors]") {
  try {
    Parse("const a = 1;\nreturn a +;");
    FAIL("expected ParseError");
  } catch (const ParseError& e) {
    REQUIRE(e.Line() == 2);
    REQUIRE(e.Column() > 1);
  }
}

TEST_CASE("Parser bounds nesting depth", "[parser][limits]") {
  SECTION("deep parentheses") {
    std::string source = "return " + std::string(5000, '(') + "1" + std::string(5000, ')') + ";";
    REQUIRE_THROWS_WITH(Parse(source), ContainsSubstring("Nesting too deep"));
  }

  SECTION("long left-nested chains") {
    std::string source = "return a";
    for (int i = 0; i < 5000; ++i) source += ".b";
    source += ";";
    REQUIRE_THROWS_WITH(Parse(source), ContainsSubstring("Nesting too deep"));
  }

  SECTION("repeated new keywords") {
    std::string source = "return ";
    for (int i = 0; i < 100000; ++i) source += "new ";
    source += "a;";
    REQUIRE_THROWS_WITH(Parse(source), ContainsSubstring("Nesting too deep"));
  }

  SECTION("reasonable nesting is fine") {
    std::string source = "return " + std::string(50, '[') + std::string(50, ']') + ";";
    REQUIRE_NOTHROW(Parse(source));
    REQUIRE_NOTHROW(Parse("return new new a()();"));
  }
}

TEST_CASE("Parser arrow lookahead stays linear", "[parser][limits]") {
  SECTION("deep parentheses fail fast") {
    std::string source =
        "return " + std::string(100000, '(') + "a" + std::string(100000, ')') + ";";
    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_WITH(Parse(source), ContainsSubstring("Nesting too deep"));
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed < std::chrono::seconds(2));
  }

  SECTION("unclosed parentheses fail fast") {
    std::string source = "return " + std::string(100000, '(') + "a;";
    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS(Parse(source));
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed < std::chrono::seconds(2));
  }

  SECTION("arrows nested in parentheses are still recognized") {
    auto body = Parse("return ((x) => (y) => x + y)(1)(2);");
    REQUIRE(FindAll(*body, NodeKind::kArrowFunction).size() == 2);
  }

  SECTION("parenthesized groups after an arrow") {
    auto body = Parse("const f = (a, b) => (a * b); return f((1), (2));");
    REQUIRE(FindAll(*body, NodeKind::kArrowFunction).size() == 1);
    REQUIRE(FindAll(*body, NodeKind::kCallExpression).size() == 1);
  }
}

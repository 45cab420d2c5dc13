#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <string>
#include <vector>

#include "validator/code_validator.h"
#include "validator/confusables.h"
#include "validator/pattern_prefilter.h"
#include "validator/rules.h"

using namespace slotbox;
using Catch::Matchers::ContainsSubstring;

namespace {

bool HasRule(const ValidationReport& report, const std::string& rule_id) {
  for (const auto& v : report.violations) {
    if (v.rule_id == rule_id) return true;
  }
  return false;
}

}  // namespace

TEST_CASE("CodeValidator accepts ordinary slots", "[code_validator][accept]") {
  SECTION("aggregate") {
    auto report = CodeValidator::Validate("return utils.mean(input.values);");
    REQUIRE(report.ok);
    REQUIRE(report.violations.empty());
  }

  SECTION("forbidden words inside strings and comments") {
    auto report = CodeValidator::Validate(
        "// eval(window)\nconst s = 'window.fetch';\n/* process */\nreturn s;");
    REQUIRE(report.ok);
  }

  SECTION("names that merely contain a forbidden word") {
    auto report = CodeValidator::Validate("const evaluation = 1, myWindow = 2;\nreturn evaluation;");
    REQUIRE(report.ok);
  }

  SECTION("single constructor access") {
    auto report = CodeValidator::Validate("return input.constructor === Object;");
    REQUIRE(report.ok);
  }
}

TEST_CASE("CodeValidator blacklisted identifiers", "[code_validator][blacklist]") {
  SECTION("plain use") {
    auto report = CodeValidator::Validate("return eval('1+1');");
    REQUIRE_FALSE(report.ok);
    REQUIRE(report.violations.size() == 1);
    REQUIRE(report.violations[0].rule_id == rules::kBlacklistedIdentifier);
    REQUIRE(report.violations[0].message == "Use of blacklisted identifier 'eval'");
    REQUIRE(report.violations[0].line == 1);
    REQUIRE(report.violations[0].column == 8);
  }

  SECTION("every name is caught") {
    for (const auto& name : rules::BlacklistedIdentifiers()) {
      auto report = CodeValidator::Validate("return " + name + ";");
      INFO(name);
      REQUIRE(HasRule(report, rules::kBlacklistedIdentifier));
    }
  }

  SECTION("unicode escapes") {
    auto report = CodeValidator::Validate("return \\u0065val('1');");
    REQUIRE_FALSE(report.ok);
    REQUIRE_THAT(report.violations[0].message, ContainsSubstring("written with escapes"));
  }

  SECTION("look-alike characters") {
    // U+0435 CYRILLIC SMALL LETTER IE
    auto report = CodeValidator::Validate("return \xD0\xB5val('1');");
    REQUIRE_FALSE(report.ok);
    REQUIRE(report.violations[0].rule_id == rules::kBlacklistedIdentifier);
    REQUIRE_THAT(report.violations[0].message, ContainsSubstring("'eval'"));
    REQUIRE_THAT(report.violations[0].message, ContainsSubstring("look-alike"));
  }

  SECTION("computed member with a string key") {
    auto report = CodeValidator::Validate("return input['process'];");
    REQUIRE(HasRule(report, rules::kBlacklistedIdentifier));
  }
}

TEST_CASE("CodeValidator prototype escapes", "[code_validator][prototype]") {
  SECTION("constructor.constructor") {
    auto report = CodeValidator::Validate("return (() => 0).constructor.constructor('return 1')();");
    REQUIRE(HasRule(report, rules::kPrototypeEscape));
  }

  SECTION("bracketed constructor chain") {
    auto report = CodeValidator::Validate("return input['constructor'][`constructor`];");
    REQUIRE(HasRule(report, rules::kPrototypeEscape));
  }

  SECTION("__proto__ through brackets") {
    auto report = CodeValidator::Validate("return input['__proto__'];");
    REQUIRE(HasRule(report, rules::kPrototypeEscape));
  }
}

TEST_CASE("CodeValidator module and dynamic code", "[code_validator][modules]") {
  SECTION("dynamic import") {
    auto report = CodeValidator::Validate("return import('fs');");
    REQUIRE(HasRule(report, rules::kDynamicImport));
  }

  SECTION("import declaration") {
    auto report = CodeValidator::Validate("import fs from 'fs';\nreturn 1;");
    REQUIRE(HasRule(report, rules::kModuleDeclaration));
    REQUIRE(report.violations[0].message == "import declarations are not allowed");
  }

  SECTION("export declaration") {
    auto report = CodeValidator::Validate("export const x = 1;\nreturn x;");
    REQUIRE(HasRule(report, rules::kModuleDeclaration));
  }

  SECTION("import.meta") {
    auto report = CodeValidator::Validate("return import.meta;");
    REQUIRE(HasRule(report, rules::kModuleDeclaration));
  }

  SECTION("new Function") {
    auto report = CodeValidator::Validate("return new Function('return 1')();");
    REQUIRE(HasRule(report, rules::kNewFunction));
    REQUIRE(HasRule(report, rules::kBlacklistedIdentifier));
  }
}

TEST_CASE("CodeValidator forbidden syntax", "[code_validator][syntax]") {
  SECTION("with statement") {
    auto report = CodeValidator::Validate("with (input) { return a; }");
    REQUIRE(HasRule(report, rules::kForbiddenSyntax));
  }

  SECTION("HTML-like comments") {
    auto report = CodeValidator::Validate("<!-- hidden\nreturn 1;");
    REQUIRE_FALSE(report.ok);
    REQUIRE(report.violations[0].rule_id == rules::kForbiddenSyntax);
    REQUIRE_THAT(report.violations[0].message, ContainsSubstring("<!--"));
  }
}

TEST_CASE("CodeValidator return requirement", "[code_validator][return]") {
  SECTION("no return") {
    auto report = CodeValidator::Validate("const x = 1;");
    REQUIRE_FALSE(report.ok);
    REQUIRE(report.violations.size() == 1);
    REQUIRE(report.violations[0].rule_id == rules::kMissingReturn);
    REQUIRE(report.violations[0].line == 0);
  }

  SECTION("return only inside a nested function") {
    auto report = CodeValidator::Validate("function f() { return 1; }\nf();");
    REQUIRE(HasRule(report, rules::kMissingReturn));
  }

  SECTION("return inside a block counts") {
    auto report = CodeValidator::Validate("if (input) { return 1; } else { return 2; }");
    REQUIRE(report.ok);
  }
}

TEST_CASE("CodeValidator syntax errors", "[code_validator][parse]") {
  auto report = CodeValidator::Validate("const x = ;\nreturn eval(x);");
  REQUIRE_FALSE(report.ok);
  REQUIRE(report.violations[0].rule_id == rules::kParseError);
  REQUIRE_THAT(report.violations[0].message, ContainsSubstring("Syntax error"));
  // Pattern hits still surface when the source does not parse
  REQUIRE(HasRule(report, rules::kBlacklistedIdentifier));
}

TEST_CASE("CodeValidator rejects oversized and hostile sources", "[code_validator][limits]") {
  SECTION("code above the size limit is not parsed") {
    std::string code = "return 1;" + std::string(rules::kMaxCodeBytes, ' ');
    auto report = CodeValidator::Validate(code);
    REQUIRE_FALSE(report.ok);
    REQUIRE(report.violations.size() == 1);
    REQUIRE(report.violations[0].rule_id == rules::kCodeTooLarge);
  }

  SECTION("code at the size limit is parsed") {
    std::string code = "return 1;";
    code += std::string(rules::kMaxCodeBytes - code.size(), ' ');
    REQUIRE(CodeValidator::Validate(code).ok);
  }

  SECTION("deep new chains fail closed") {
    std::string code = "return ";
    for (int i = 0; i < 15000; ++i) code += "new ";
    code += "a;";
    auto report = CodeValidator::Validate(code);
    REQUIRE_FALSE(report.ok);
    REQUIRE(HasRule(report, rules::kParseError));
  }

  SECTION("deep parentheses fail closed quickly") {
    std::string code = "return " + std::string(30000, '(') + "a" + std::string(30000, ')') + ";";
    auto start = std::chrono::steady_clock::now();
    auto report = CodeValidator::Validate(code);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE_FALSE(report.ok);
    REQUIRE(HasRule(report, rules::kParseError));
    REQUIRE(elapsed < std::chrono::seconds(2));
  }
}

TEST_CASE("CodeValidator lists every violation in source order", "[code_validator][report]") {
  auto report = CodeValidator::Validate("const a = window;\nconst b = process;\na + b;");
  REQUIRE(report.violations.size() == 3);
  REQUIRE(report.violations[0].line == 1);
  REQUIRE(report.violations[1].line == 2);
  REQUIRE(report.violations[2].rule_id == rules::kMissingReturn);
  REQUIRE(report.Summary() ==
          "Use of blacklisted identifier 'window'; Use of blacklisted identifier 'process'; "
          "Slot code must contain a return statement");
}

TEST_CASE("Confusable folding", "[code_validator][confusables]") {
  REQUIRE(FoldConfusables("eval") == "eval");
  REQUIRE(FoldConfusables("\xD0\xB5val") == "eval");
  // FULLWIDTH LATIN SMALL LETTER E, then ZERO WIDTH SPACE
  REQUIRE(FoldConfusables("\xEF\xBD\x85v\xE2\x80\x8B" "al") == "eval");
}

TEST_CASE("Pattern prefilter", "[code_validator][prefilter]") {
  auto hits = ScanForbiddenPatterns("x = window.location;");
  REQUIRE(hits.size() == 2);  // blacklist + missing return
  REQUIRE(hits[0].rule_id == rules::kBlacklistedIdentifier);
  REQUIRE(hits[0].column == 5);
  REQUIRE(ScanForbiddenPatterns("return 1;").empty());

  SECTION("long whitespace runs") {
    std::string code = "constructor" + std::string(60000, ' ') + ".constructor; with" +
                       std::string(60000, '\n') + "(x) {}";
    std::vector<Violation> scanned;
    REQUIRE_NOTHROW(scanned = ScanForbiddenPatterns(code));
    REQUIRE(scanned.size() == 1);
    REQUIRE(scanned[0].rule_id == rules::kMissingReturn);
  }
}

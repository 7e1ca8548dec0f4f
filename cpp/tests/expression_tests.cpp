#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "libdsge/errors.hpp"
#include "libdsge/expression.hpp"
#include "libdsge/lexer.hpp"

namespace {

std::string canonical(const std::string& text) {
    return libdsge::to_string(*libdsge::parse_expression(text));
}

}  // namespace

TEST_CASE("tokenize splits identifiers, numbers and operators", "[lexer]") {
    const auto tokens = libdsge::tokenize("x{+1} >= 2.5e-3*beta_1;");
    REQUIRE(tokens.size() == 10);
    REQUIRE(tokens[4].is(libdsge::TokenKind::Punctuation, "}"));
    REQUIRE(tokens[0].is(libdsge::TokenKind::Identifier, "x"));
    REQUIRE(tokens[1].is(libdsge::TokenKind::Punctuation, "{"));
    REQUIRE(tokens[2].is(libdsge::TokenKind::Operator, "+"));
    REQUIRE(tokens[3].is(libdsge::TokenKind::Number, "1"));
    REQUIRE(tokens[5].is(libdsge::TokenKind::Operator, ">="));
    REQUIRE(tokens[6].is(libdsge::TokenKind::Number, "2.5e-3"));
    REQUIRE(tokens[8].is(libdsge::TokenKind::Identifier, "beta_1"));
}

TEST_CASE("tokenize reports the offending line", "[lexer]") {
    try {
        (void)libdsge::tokenize(libdsge::SourceLine{"y = a $ b;", "m.rs", 9});
        FAIL("expected a parse error");
    } catch (const libdsge::ParseError& error) {
        REQUIRE(error.file() == "m.rs");
        REQUIRE(error.line() == 9);
    }
    REQUIRE(libdsge::tokenize("a ~= b")[1].text == "!=");
}

TEST_CASE("expressions print with minimal parentheses", "[expression]") {
    REQUIRE(canonical("a*(b+c)-d/e^2") == "a*(b+c)-d/e^2");
    REQUIRE(canonical("(a-b)-c") == "a-b-c");
    REQUIRE(canonical("a-(b-c)") == "a-(b-c)");
    REQUIRE(canonical("a/(b*c)") == "a/(b*c)");
    REQUIRE(canonical("-(a+b)") == "-(a+b)");
    REQUIRE(canonical("(a^b)^c") == "(a^b)^c");
    REQUIRE(canonical("exp( x ) * max(a, b)") == "exp(x)*max(a,b)");
    REQUIRE(canonical("x(-1) + y{+2} + steady_state(z)") == "x{-1}+y{+2}+steady_state(z)");
}

TEST_CASE("references carry shifts and qualifiers", "[expression]") {
    const auto expr = libdsge::parse_expression("rho(a,2)*k(-1) + c{+1}");
    std::vector<libdsge::Reference> seen;
    libdsge::for_each_reference(*expr, [&](const libdsge::Reference& reference, const libdsge::Expr&, bool) {
        seen.push_back(reference);
    });
    REQUIRE(seen.size() == 3);
    REQUIRE(seen[0].name == "rho");
    REQUIRE(seen[0].qualifiers == std::vector<std::string>{"a", "2"});
    REQUIRE(seen[1].name == "k");
    REQUIRE(seen[1].shift == -1);
    REQUIRE(seen[2].shift == 1);
}

TEST_CASE("steady_state references are visited as such", "[expression]") {
    const auto expr = libdsge::parse_expression("steady_state(k)*alpha");
    std::vector<bool> flags;
    libdsge::for_each_reference(*expr, [&](const libdsge::Reference&, const libdsge::Expr&, bool in_steady_state) {
        flags.push_back(in_steady_state);
    });
    REQUIRE(flags == std::vector<bool>{true, false});
}

TEST_CASE("rewrite_references replaces selected names", "[expression]") {
    const auto expr = libdsge::parse_expression("a*b + a");
    const auto rewritten = libdsge::rewrite_references(expr, [](const libdsge::Reference& reference, const libdsge::Expr&, bool) {
        return reference.name == "a" ? libdsge::parse_expression("(c+1)") : nullptr;
    });
    REQUIRE(libdsge::to_string(*rewritten) == "(c+1)*b+c+1");
    REQUIRE(libdsge::to_string(*expr) == "a*b+a");
}

TEST_CASE("malformed expressions raise located parse errors", "[expression]") {
    const auto tokens = libdsge::tokenize(libdsge::SourceLine{"a + * b", "m.rs", 7});
    try {
        (void)libdsge::parse_expression(tokens, 0, tokens.size());
        FAIL("expected a parse error");
    } catch (const libdsge::ParseError& error) {
        REQUIRE(error.line() == 7);
        REQUIRE(error.file() == "m.rs");
    }
    REQUIRE_THROWS_AS(libdsge::parse_expression("exp(1,2)"), libdsge::ParseError);
    REQUIRE_THROWS_AS(libdsge::parse_expression("(a+b"), libdsge::ParseError);
    REQUIRE_THROWS_AS(libdsge::parse_expression("x{1.5}"), libdsge::ParseError);
}

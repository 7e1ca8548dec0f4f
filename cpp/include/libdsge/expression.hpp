#pragma once

#include "libdsge/function_registry.hpp"
#include "libdsge/lexer.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace libdsge {

enum class BinaryOp {
    Add,
    Subtract,
    Multiply,
    Divide,
    Power,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Equal,
    NotEqual
};

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

struct NumberLiteral {
    double value{0.0};
    std::string text;
};

// A name with an optional time shift (x{+1}, x(-1)) or qualifier list (p(a,2)).
struct Reference {
    std::string name;
    int shift{0};
    std::vector<std::string> qualifiers;
};

struct FunctionCall {
    MathFunction function;
    std::vector<ExprPtr> arguments;
};

// steady_state(x)
struct SteadyStateCall {
    Reference variable;
};

struct Negation {
    ExprPtr operand;
};

struct BinaryExpr {
    BinaryOp op;
    ExprPtr lhs;
    ExprPtr rhs;
};

struct Expr {
    std::variant<NumberLiteral, Reference, FunctionCall, SteadyStateCall, Negation, BinaryExpr> node;
    std::string file;
    std::size_t line{0};
};

[[nodiscard]] ExprPtr make_number(double value);

[[nodiscard]] ExprPtr make_reference(Reference reference, std::string file = {}, std::size_t line = 0);

[[nodiscard]] ExprPtr make_binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs);

[[nodiscard]] ExprPtr make_negation(ExprPtr operand);

[[nodiscard]] ExprPtr make_call(MathFunction function, std::vector<ExprPtr> arguments);

[[nodiscard]] ExprPtr make_steady_state(Reference variable);

[[nodiscard]] bool is_comparison(BinaryOp op) noexcept;

[[nodiscard]] std::string binary_op_symbol(BinaryOp op);

// Recursive-descent parser over a token range. Precedence, lowest first:
// comparison, additive, multiplicative, unary minus, power (right associative).
class ExpressionParser {
public:
    ExpressionParser(const std::vector<Token>& tokens, std::size_t begin, std::size_t end);

    explicit ExpressionParser(const std::vector<Token>& tokens);

    [[nodiscard]] ExprPtr parse_expression();

    // Parses without the comparison level so that "lhs = rhs" and
    // "lhs >= rhs" statements can be split by the caller.
    [[nodiscard]] ExprPtr parse_arithmetic();

    [[nodiscard]] bool at_end() const noexcept;

    [[nodiscard]] const Token& peek() const;

    const Token& advance();

    [[nodiscard]] bool accept(TokenKind kind, const char* text);

    void expect(TokenKind kind, const char* text);

    [[noreturn]] void fail(const std::string& message) const;

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

private:
    ExprPtr parse_comparison();
    ExprPtr parse_additive();
    ExprPtr parse_multiplicative();
    ExprPtr parse_unary();
    ExprPtr parse_power();
    ExprPtr parse_primary();
    Reference parse_reference_suffix(const Token& name);

    const std::vector<Token>& tokens_;
    std::size_t pos_;
    std::size_t end_;
};

// Parses a complete expression; trailing tokens are a ParseError.
[[nodiscard]] ExprPtr parse_expression(const std::string& text);

[[nodiscard]] ExprPtr parse_expression(const std::vector<Token>& tokens, std::size_t begin, std::size_t end);

using ReferenceRenderer = std::function<std::string(const Reference&, const Expr&)>;
using SteadyStateRenderer = std::function<std::string(const Reference&, const Expr&)>;

// Prints an expression with minimal parentheses; references and steady-state
// calls are printed through the callbacks (original text when empty).
[[nodiscard]] std::string render(const Expr& expr,
                                 const ReferenceRenderer& reference = {},
                                 const SteadyStateRenderer& steady_state = {});

[[nodiscard]] std::string to_string(const Expr& expr);

[[nodiscard]] std::string to_string(const Reference& reference);

// Calls visitor on every reference, including the ones inside steady_state().
void for_each_reference(const Expr& expr, const std::function<void(const Reference&, const Expr&, bool in_steady_state)>& visitor);

using ReferenceRewriter = std::function<ExprPtr(const Reference&, const Expr&, bool in_steady_state)>;

// Rebuilds the tree, replacing each reference by the rewriter's result
// (nullptr keeps it). For a reference inside steady_state() the result
// replaces the whole call.
[[nodiscard]] ExprPtr rewrite_references(const ExprPtr& expr, const ReferenceRewriter& rewriter);

// Shortest text that reads back to the same double.
[[nodiscard]] std::string format_number(double value);

}  // namespace libdsge

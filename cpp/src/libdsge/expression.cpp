#include "libdsge/expression.hpp"

#include "libdsge/errors.hpp"

#include <array>
#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace libdsge {

namespace {

constexpr int kComparisonPrecedence = 1;
constexpr int kAdditivePrecedence = 2;
constexpr int kMultiplicativePrecedence = 3;
constexpr int kUnaryPrecedence = 4;
constexpr int kPowerPrecedence = 5;
constexpr int kAtomPrecedence = 6;

int precedence(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:
        case BinaryOp::Subtract:
            return kAdditivePrecedence;
        case BinaryOp::Multiply:
        case BinaryOp::Divide:
            return kMultiplicativePrecedence;
        case BinaryOp::Power:
            return kPowerPrecedence;
        default:
            return kComparisonPrecedence;
    }
}

int precedence(const Expr& expr) {
    if (const auto* binary = std::get_if<BinaryExpr>(&expr.node)) {
        return precedence(binary->op);
    }
    if (std::holds_alternative<Negation>(expr.node)) {
        return kUnaryPrecedence;
    }
    return kAtomPrecedence;
}

ExprPtr make_expr(decltype(Expr::node) node, std::string file = {}, std::size_t line = 0) {
    auto expr = std::make_shared<Expr>();
    expr->node = std::move(node);
    expr->file = std::move(file);
    expr->line = line;
    return expr;
}

std::string render_shift(int shift) {
    if (shift == 0) {
        return {};
    }
    return shift > 0 ? "{+" + std::to_string(shift) + "}" : "{" + std::to_string(shift) + "}";
}

}  // namespace

ExprPtr make_number(double value) {
    return make_expr(NumberLiteral{value, format_number(value)});
}

ExprPtr make_reference(Reference reference, std::string file, std::size_t line) {
    return make_expr(std::move(reference), std::move(file), line);
}

ExprPtr make_binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs) {
    std::string file = lhs->file;
    const std::size_t line = lhs->line;
    return make_expr(BinaryExpr{op, std::move(lhs), std::move(rhs)}, std::move(file), line);
}

ExprPtr make_negation(ExprPtr operand) {
    std::string file = operand->file;
    const std::size_t line = operand->line;
    return make_expr(Negation{std::move(operand)}, std::move(file), line);
}

ExprPtr make_call(MathFunction function, std::vector<ExprPtr> arguments) {
    return make_expr(FunctionCall{function, std::move(arguments)});
}

ExprPtr make_steady_state(Reference variable) {
    return make_expr(SteadyStateCall{std::move(variable)});
}

bool is_comparison(BinaryOp op) noexcept {
    switch (op) {
        case BinaryOp::Less:
        case BinaryOp::LessEqual:
        case BinaryOp::Greater:
        case BinaryOp::GreaterEqual:
        case BinaryOp::Equal:
        case BinaryOp::NotEqual:
            return true;
        default:
            return false;
    }
}

std::string binary_op_symbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Subtract:
            return "-";
        case BinaryOp::Multiply:
            return "*";
        case BinaryOp::Divide:
            return "/";
        case BinaryOp::Power:
            return "^";
        case BinaryOp::Less:
            return "<";
        case BinaryOp::LessEqual:
            return "<=";
        case BinaryOp::Greater:
            return ">";
        case BinaryOp::GreaterEqual:
            return ">=";
        case BinaryOp::Equal:
            return "==";
        case BinaryOp::NotEqual:
            return "!=";
    }
    throw std::invalid_argument("unknown binary operator");
}

std::string format_number(double value) {
    std::array<char, 64> buffer{};
    const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (result.ec != std::errc()) {
        throw std::runtime_error("failed to format numeric constant");
    }
    return std::string(buffer.data(), result.ptr);
}

ExpressionParser::ExpressionParser(const std::vector<Token>& tokens, std::size_t begin, std::size_t end)
    : tokens_(tokens), pos_(begin), end_(end < tokens.size() ? end : tokens.size()) {}

ExpressionParser::ExpressionParser(const std::vector<Token>& tokens)
    : ExpressionParser(tokens, 0, tokens.size()) {}

bool ExpressionParser::at_end() const noexcept {
    return pos_ >= end_;
}

const Token& ExpressionParser::peek() const {
    if (at_end()) {
        fail("unexpected end of expression");
    }
    return tokens_[pos_];
}

const Token& ExpressionParser::advance() {
    const Token& token = peek();
    ++pos_;
    return token;
}

bool ExpressionParser::accept(TokenKind kind, const char* text) {
    if (!at_end() && tokens_[pos_].is(kind, text)) {
        ++pos_;
        return true;
    }
    return false;
}

void ExpressionParser::expect(TokenKind kind, const char* text) {
    if (!accept(kind, text)) {
        if (at_end()) {
            fail(std::string("expected '") + text + "' at end of expression");
        }
        fail(std::string("expected '") + text + "' but found '" + tokens_[pos_].text + "'");
    }
}

void ExpressionParser::fail(const std::string& message) const {
    const Token* anchor = nullptr;
    if (pos_ < end_) {
        anchor = &tokens_[pos_];
    } else if (end_ > 0 && end_ <= tokens_.size()) {
        anchor = &tokens_[end_ - 1];
    }
    if (anchor == nullptr) {
        throw ParseError(message, {}, 0);
    }
    throw ParseError(message, anchor->file, anchor->line);
}

ExprPtr ExpressionParser::parse_expression() {
    return parse_comparison();
}

ExprPtr ExpressionParser::parse_arithmetic() {
    return parse_additive();
}

ExprPtr ExpressionParser::parse_comparison() {
    auto lhs = parse_additive();
    while (!at_end() && tokens_[pos_].kind == TokenKind::Operator) {
        const std::string& op = tokens_[pos_].text;
        BinaryOp kind;
        if (op == "<") {
            kind = BinaryOp::Less;
        } else if (op == "<=") {
            kind = BinaryOp::LessEqual;
        } else if (op == ">") {
            kind = BinaryOp::Greater;
        } else if (op == ">=") {
            kind = BinaryOp::GreaterEqual;
        } else if (op == "==") {
            kind = BinaryOp::Equal;
        } else if (op == "!=") {
            kind = BinaryOp::NotEqual;
        } else {
            break;
        }
        ++pos_;
        lhs = make_binary(kind, std::move(lhs), parse_additive());
    }
    return lhs;
}

ExprPtr ExpressionParser::parse_additive() {
    auto lhs = parse_multiplicative();
    while (true) {
        if (accept(TokenKind::Operator, "+")) {
            lhs = make_binary(BinaryOp::Add, std::move(lhs), parse_multiplicative());
        } else if (accept(TokenKind::Operator, "-")) {
            lhs = make_binary(BinaryOp::Subtract, std::move(lhs), parse_multiplicative());
        } else {
            return lhs;
        }
    }
}

ExprPtr ExpressionParser::parse_multiplicative() {
    auto lhs = parse_unary();
    while (true) {
        if (accept(TokenKind::Operator, "*")) {
            lhs = make_binary(BinaryOp::Multiply, std::move(lhs), parse_unary());
        } else if (accept(TokenKind::Operator, "/")) {
            lhs = make_binary(BinaryOp::Divide, std::move(lhs), parse_unary());
        } else {
            return lhs;
        }
    }
}

ExprPtr ExpressionParser::parse_unary() {
    if (accept(TokenKind::Operator, "-")) {
        return make_negation(parse_unary());
    }
    if (accept(TokenKind::Operator, "+")) {
        return parse_unary();
    }
    return parse_power();
}

ExprPtr ExpressionParser::parse_power() {
    auto base = parse_primary();
    if (accept(TokenKind::Operator, "^")) {
        return make_binary(BinaryOp::Power, std::move(base), parse_unary());
    }
    return base;
}

ExprPtr ExpressionParser::parse_primary() {
    const Token& token = advance();
    if (token.kind == TokenKind::Number) {
        return make_expr(NumberLiteral{std::strtod(token.text.c_str(), nullptr), token.text}, token.file, token.line);
    }
    if (token.is(TokenKind::Punctuation, "(")) {
        auto inner = parse_expression();
        expect(TokenKind::Punctuation, ")");
        return inner;
    }
    if (token.kind != TokenKind::Identifier) {
        --pos_;
        fail("unexpected token '" + token.text + "'");
    }

    const bool has_parenthesis = !at_end() && tokens_[pos_].is(TokenKind::Punctuation, "(");
    if (token.text == "steady_state" && has_parenthesis) {
        ++pos_;
        const Token& name = advance();
        if (name.kind != TokenKind::Identifier) {
            --pos_;
            fail("steady_state expects a variable name");
        }
        Reference variable = parse_reference_suffix(name);
        expect(TokenKind::Punctuation, ")");
        return make_expr(SteadyStateCall{std::move(variable)}, token.file, token.line);
    }
    if (has_parenthesis) {
        if (auto function = FunctionRegistry::find(token.text)) {
            ++pos_;
            std::vector<ExprPtr> arguments;
            if (!accept(TokenKind::Punctuation, ")")) {
                do {
                    arguments.push_back(parse_expression());
                } while (accept(TokenKind::Punctuation, ","));
                expect(TokenKind::Punctuation, ")");
            }
            if (arguments.size() != FunctionRegistry::arity(*function)) {
                throw ParseError("wrong number of arguments to " + token.text, token.file, token.line);
            }
            return make_expr(FunctionCall{*function, std::move(arguments)}, token.file, token.line);
        }
    }
    return make_expr(parse_reference_suffix(token), token.file, token.line);
}

Reference ExpressionParser::parse_reference_suffix(const Token& name) {
    Reference reference{name.text, 0, {}};
    auto read_signed_integer = [this]() {
        std::string text;
        if (accept(TokenKind::Operator, "+")) {
            text = "+";
        } else if (accept(TokenKind::Operator, "-")) {
            text = "-";
        }
        const Token& number = advance();
        if (number.kind != TokenKind::Number || number.text.find_first_not_of("0123456789") != std::string::npos) {
            --pos_;
            fail("time shift must be an integer");
        }
        return text + number.text;
    };

    if (accept(TokenKind::Punctuation, "{")) {
        reference.shift = std::stoi(read_signed_integer());
        expect(TokenKind::Punctuation, "}");
        return reference;
    }
    if (accept(TokenKind::Punctuation, "(")) {
        std::vector<std::string> items;
        bool single_number = false;
        do {
            const Token& next = peek();
            if (next.kind == TokenKind::Identifier) {
                items.push_back(advance().text);
            } else {
                items.push_back(read_signed_integer());
                single_number = true;
            }
        } while (accept(TokenKind::Punctuation, ","));
        expect(TokenKind::Punctuation, ")");
        if (items.size() == 1 && single_number) {
            reference.shift = std::stoi(items.front());
        } else {
            reference.qualifiers = std::move(items);
        }
    }
    return reference;
}

ExprPtr parse_expression(const std::vector<Token>& tokens, std::size_t begin, std::size_t end) {
    ExpressionParser parser(tokens, begin, end);
    if (parser.at_end()) {
        parser.fail("empty expression");
    }
    auto expr = parser.parse_expression();
    if (!parser.at_end()) {
        parser.fail("unexpected token '" + parser.peek().text + "'");
    }
    return expr;
}

ExprPtr parse_expression(const std::string& text) {
    const auto tokens = tokenize(text);
    return parse_expression(tokens, 0, tokens.size());
}

std::string to_string(const Reference& reference) {
    std::string text = reference.name + render_shift(reference.shift);
    if (!reference.qualifiers.empty()) {
        text += "(";
        for (std::size_t i = 0; i < reference.qualifiers.size(); ++i) {
            if (i > 0) {
                text += ",";
            }
            text += reference.qualifiers[i];
        }
        text += ")";
    }
    return text;
}

std::string render(const Expr& expr, const ReferenceRenderer& reference, const SteadyStateRenderer& steady_state) {
    auto child = [&](const Expr& sub, bool parenthesize) {
        std::string text = render(sub, reference, steady_state);
        return parenthesize ? "(" + text + ")" : text;
    };

    return std::visit(
        [&](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, NumberLiteral>) {
                return format_number(node.value);
            } else if constexpr (std::is_same_v<T, Reference>) {
                return reference ? reference(node, expr) : to_string(node);
            } else if constexpr (std::is_same_v<T, SteadyStateCall>) {
                return steady_state ? steady_state(node.variable, expr) : "steady_state(" + to_string(node.variable) + ")";
            } else if constexpr (std::is_same_v<T, FunctionCall>) {
                std::string text = FunctionRegistry::name(node.function) + "(";
                for (std::size_t i = 0; i < node.arguments.size(); ++i) {
                    if (i > 0) {
                        text += ",";
                    }
                    text += render(*node.arguments[i], reference, steady_state);
                }
                return text + ")";
            } else if constexpr (std::is_same_v<T, Negation>) {
                return "-" + child(*node.operand, precedence(*node.operand) <= kUnaryPrecedence);
            } else {
                const int own = precedence(node.op);
                const int left = precedence(*node.lhs);
                const int right = precedence(*node.rhs);
                bool left_paren = left < own;
                bool right_paren = right < own || right == kUnaryPrecedence;
                if (node.op == BinaryOp::Power) {
                    left_paren = left < kAtomPrecedence;
                    right_paren = right < kAtomPrecedence;
                } else if (right == own && (node.op == BinaryOp::Subtract || node.op == BinaryOp::Divide || is_comparison(node.op))) {
                    right_paren = true;
                }
                return child(*node.lhs, left_paren) + binary_op_symbol(node.op) + child(*node.rhs, right_paren);
            }
        },
        expr.node);
}

std::string to_string(const Expr& expr) {
    return render(expr);
}

void for_each_reference(const Expr& expr, const std::function<void(const Reference&, const Expr&, bool)>& visitor) {
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Reference>) {
                visitor(node, expr, false);
            } else if constexpr (std::is_same_v<T, SteadyStateCall>) {
                visitor(node.variable, expr, true);
            } else if constexpr (std::is_same_v<T, FunctionCall>) {
                for (const auto& argument : node.arguments) {
                    for_each_reference(*argument, visitor);
                }
            } else if constexpr (std::is_same_v<T, Negation>) {
                for_each_reference(*node.operand, visitor);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                for_each_reference(*node.lhs, visitor);
                for_each_reference(*node.rhs, visitor);
            }
        },
        expr.node);
}

ExprPtr rewrite_references(const ExprPtr& expr, const ReferenceRewriter& rewriter) {
    return std::visit(
        [&](const auto& node) -> ExprPtr {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, NumberLiteral>) {
                return expr;
            } else if constexpr (std::is_same_v<T, Reference>) {
                auto replaced = rewriter(node, *expr, false);
                return replaced ? replaced : expr;
            } else if constexpr (std::is_same_v<T, SteadyStateCall>) {
                auto replaced = rewriter(node.variable, *expr, true);
                return replaced ? replaced : expr;
            } else if constexpr (std::is_same_v<T, FunctionCall>) {
                std::vector<ExprPtr> arguments;
                arguments.reserve(node.arguments.size());
                for (const auto& argument : node.arguments) {
                    arguments.push_back(rewrite_references(argument, rewriter));
                }
                return make_expr(FunctionCall{node.function, std::move(arguments)}, expr->file, expr->line);
            } else if constexpr (std::is_same_v<T, Negation>) {
                return make_expr(Negation{rewrite_references(node.operand, rewriter)}, expr->file, expr->line);
            } else {
                return make_expr(BinaryExpr{node.op, rewrite_references(node.lhs, rewriter), rewrite_references(node.rhs, rewriter)},
                                 expr->file,
                                 expr->line);
            }
        },
        expr->node);
}

}  // namespace libdsge

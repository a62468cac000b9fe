#include "cpact/expression.hpp"

#include <cctype>
#include <memory>
#include <optional>

#include "cpact/errors.hpp"
#include "cpact/logging.hpp"
#include "cpact/text.hpp"

namespace {

using cpact::ExpressionError;
using cpact::Value;

enum class TokenKind {
    number,
    string,
    ident,
    comparison,
    kw_and,
    kw_or,
    kw_not,
    kw_true,
    kw_false,
    lparen,
    rparen,
    end,
};

struct Token {
    TokenKind kind;
    std::string text;
    std::size_t pos;
};

bool is_ident_start(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_';
}

bool is_ident_char(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '.';
}

std::vector<Token> tokenize(const std::string& expr) {
    std::vector<Token> tokens;
    std::size_t i = 0;
    const auto n = expr.size();

    while (i < n) {
        const char ch = expr[i];
        if (std::isspace(static_cast<unsigned char>(ch))) {
            ++i;
            continue;
        }
        const std::size_t start = i;

        if (ch == '(' || ch == ')') {
            tokens.push_back({ch == '(' ? TokenKind::lparen : TokenKind::rparen, std::string(1, ch), start});
            ++i;
        } else if (ch == '=' || ch == '!' || ch == '<' || ch == '>') {
            const bool has_eq = i + 1 < n && expr[i + 1] == '=';
            if (ch == '=' && !has_eq) {
                throw ExpressionError(expr, start, "single '=' is not an operator, use '=='");
            }
            if (ch == '!' && !has_eq) {
                tokens.push_back({TokenKind::kw_not, "!", start});
                ++i;
                continue;
            }
            tokens.push_back({TokenKind::comparison, expr.substr(i, has_eq ? 2 : 1), start});
            i += has_eq ? 2 : 1;
        } else if (ch == '&' || ch == '|') {
            if (i + 1 >= n || expr[i + 1] != ch) {
                throw ExpressionError(expr, start, std::string{"unexpected '"} + ch + "'");
            }
            tokens.push_back({ch == '&' ? TokenKind::kw_and : TokenKind::kw_or, expr.substr(i, 2), start});
            i += 2;
        } else if (ch == '"' || ch == '\'') {
            std::string literal;
            ++i;
            bool closed = false;
            while (i < n) {
                if (expr[i] == '\\' && i + 1 < n) {
                    literal.push_back(expr[i + 1]);
                    i += 2;
                    continue;
                }
                if (expr[i] == ch) {
                    closed = true;
                    ++i;
                    break;
                }
                literal.push_back(expr[i++]);
            }
            if (!closed) {
                throw ExpressionError(expr, start, "unterminated string literal");
            }
            tokens.push_back({TokenKind::string, literal, start});
        } else if (std::isdigit(static_cast<unsigned char>(ch)) ||
                   ((ch == '-' || ch == '.') && i + 1 < n && std::isdigit(static_cast<unsigned char>(expr[i + 1])))) {
            ++i;
            while (i < n && (std::isdigit(static_cast<unsigned char>(expr[i])) || expr[i] == '.' ||
                             expr[i] == 'e' || expr[i] == 'E')) {
                ++i;
            }
            auto literal = expr.substr(start, i - start);
            if (!cpact::text::parse_number(literal)) {
                throw ExpressionError(expr, start, "invalid number '" + literal + "'");
            }
            if (i < n && is_ident_start(expr[i])) {
                throw ExpressionError(expr, i, "unexpected character after number");
            }
            tokens.push_back({TokenKind::number, literal, start});
        } else if (is_ident_start(ch)) {
            while (i < n && is_ident_char(expr[i])) {
                ++i;
            }
            auto word = expr.substr(start, i - start);
            const auto lowered = cpact::text::to_lower_copy(word);
            TokenKind kind = TokenKind::ident;
            if (lowered == "and") {
                kind = TokenKind::kw_and;
            } else if (lowered == "or") {
                kind = TokenKind::kw_or;
            } else if (lowered == "not") {
                kind = TokenKind::kw_not;
            } else if (lowered == "true") {
                kind = TokenKind::kw_true;
            } else if (lowered == "false") {
                kind = TokenKind::kw_false;
            }
            tokens.push_back({kind, std::move(word), start});
        } else {
            throw ExpressionError(expr, start, std::string{"unexpected character '"} + ch + "'");
        }
    }
    tokens.push_back({TokenKind::end, {}, n});
    return tokens;
}

struct Node {
    enum class Kind { literal, reference, negate, conjunction, disjunction, comparison };

    Kind kind{Kind::literal};
    Value literal;
    std::string text;  ///< identifier name or comparison operator
    std::unique_ptr<Node> lhs;
    std::unique_ptr<Node> rhs;
};

using NodePtr = std::unique_ptr<Node>;

NodePtr make_node(Node::Kind kind) {
    auto node = std::make_unique<Node>();
    node->kind = kind;
    return node;
}

class Parser {
public:
    Parser(const std::string& expr, std::vector<Token> tokens) : expr_(expr), tokens_(std::move(tokens)) {}

    NodePtr parse() {
        if (peek().kind == TokenKind::end) {
            throw ExpressionError(expr_, 0, "empty expression");
        }
        auto node = parse_or();
        if (peek().kind != TokenKind::end) {
            throw ExpressionError(expr_, peek().pos, "unexpected '" + peek().text + "'");
        }
        return node;
    }

private:
    const Token& peek() const { return tokens_[pos_]; }
    const Token& next() { return tokens_[pos_++]; }

    NodePtr parse_or() {
        auto lhs = parse_and();
        while (peek().kind == TokenKind::kw_or) {
            next();
            auto node = make_node(Node::Kind::disjunction);
            node->lhs = std::move(lhs);
            node->rhs = parse_and();
            lhs = std::move(node);
        }
        return lhs;
    }

    NodePtr parse_and() {
        auto lhs = parse_not();
        while (peek().kind == TokenKind::kw_and) {
            next();
            auto node = make_node(Node::Kind::conjunction);
            node->lhs = std::move(lhs);
            node->rhs = parse_not();
            lhs = std::move(node);
        }
        return lhs;
    }

    NodePtr parse_not() {
        if (peek().kind == TokenKind::kw_not) {
            next();
            auto node = make_node(Node::Kind::negate);
            node->lhs = parse_not();
            return node;
        }
        return parse_comparison();
    }

    NodePtr parse_comparison() {
        auto lhs = parse_primary();
        if (peek().kind == TokenKind::comparison) {
            auto node = make_node(Node::Kind::comparison);
            node->text = next().text;
            node->lhs = std::move(lhs);
            node->rhs = parse_primary();
            if (peek().kind == TokenKind::comparison) {
                throw ExpressionError(expr_, peek().pos, "chained comparisons need parentheses");
            }
            return node;
        }
        return lhs;
    }

    NodePtr parse_primary() {
        const auto& tok = next();
        switch (tok.kind) {
        case TokenKind::number: {
            auto node = make_node(Node::Kind::literal);
            node->literal = Value{*cpact::text::parse_number(tok.text)};
            return node;
        }
        case TokenKind::string: {
            auto node = make_node(Node::Kind::literal);
            node->literal = Value{tok.text};
            return node;
        }
        case TokenKind::kw_true:
        case TokenKind::kw_false: {
            auto node = make_node(Node::Kind::literal);
            node->literal = Value{tok.kind == TokenKind::kw_true};
            return node;
        }
        case TokenKind::ident: {
            auto node = make_node(Node::Kind::reference);
            node->text = tok.text;
            return node;
        }
        case TokenKind::lparen: {
            auto node = parse_or();
            if (peek().kind != TokenKind::rparen) {
                throw ExpressionError(expr_, peek().pos, "missing ')'");
            }
            next();
            return node;
        }
        case TokenKind::end:
            throw ExpressionError(expr_, tok.pos, "unexpected end of expression");
        default:
            throw ExpressionError(expr_, tok.pos, "unexpected '" + tok.text + "'");
        }
    }

    const std::string& expr_;
    std::vector<Token> tokens_;
    std::size_t pos_{0};
};

bool eval_bool(const Node& node, const cpact::ExecutionContext& context);

Value eval_value(const Node& node, const cpact::ExecutionContext& context) {
    switch (node.kind) {
    case Node::Kind::literal:
        return node.literal;
    case Node::Kind::reference:
        return context.get(node.text);
    default:
        return Value{eval_bool(node, context)};
    }
}

bool eval_bool(const Node& node, const cpact::ExecutionContext& context) {
    switch (node.kind) {
    case Node::Kind::literal:
        return node.literal.truthy();
    case Node::Kind::reference:
        return context.get(node.text).truthy();
    case Node::Kind::negate:
        return !eval_bool(*node.lhs, context);
    case Node::Kind::conjunction:
        return eval_bool(*node.lhs, context) && eval_bool(*node.rhs, context);
    case Node::Kind::disjunction:
        return eval_bool(*node.lhs, context) || eval_bool(*node.rhs, context);
    case Node::Kind::comparison:
        return cpact::compare_values(eval_value(*node.lhs, context), node.text, eval_value(*node.rhs, context));
    }
    return false;
}

std::optional<double> numeric_view(const Value& value) {
    if (value.is_number()) {
        return value.as_number();
    }
    if (value.is_bool()) {
        return value.as_bool() ? 1.0 : 0.0;
    }
    if (value.is_string()) {
        return cpact::text::parse_number(value.as_string());
    }
    return std::nullopt;
}

template <class T>
bool apply(const T& lhs, const std::string& op, const T& rhs) {
    if (op == "==") {
        return lhs == rhs;
    }
    if (op == "!=") {
        return lhs != rhs;
    }
    if (op == "<") {
        return lhs < rhs;
    }
    if (op == "<=") {
        return lhs <= rhs;
    }
    if (op == ">") {
        return lhs > rhs;
    }
    if (op == ">=") {
        return lhs >= rhs;
    }
    throw ExpressionError(op, 0, "unknown comparison operator");
}

}  // namespace

namespace cpact {

bool compare_values(const Value& lhs, const std::string& op, const Value& rhs) {
    if (lhs.is_undefined() || rhs.is_undefined()) {
        const bool both = lhs.is_undefined() && rhs.is_undefined();
        if (op == "==") {
            return both;
        }
        if (op == "!=") {
            return !both;
        }
        return false;
    }

    // bool against text: only the spellings of a boolean can be equal to it
    if (lhs.is_bool() != rhs.is_bool() && (lhs.is_string() || rhs.is_string())) {
        const auto& flag = lhs.is_bool() ? lhs : rhs;
        const auto& other = lhs.is_bool() ? rhs : lhs;
        const auto parsed = text::parse_boolean(other.as_string());
        if (!parsed) {
            return op == "!=";
        }
        return lhs.is_bool() ? apply<int>(flag.as_bool(), op, *parsed) : apply<int>(*parsed, op, flag.as_bool());
    }

    const auto left = numeric_view(lhs);
    const auto right = numeric_view(rhs);
    if (left && right) {
        return apply(*left, op, *right);
    }
    return apply(lhs.to_string(), op, rhs.to_string());
}

bool evaluate_expression(const std::string& expression, const ExecutionContext& context) {
    Parser parser(expression, tokenize(expression));
    const auto root = parser.parse();
    return eval_bool(*root, context);
}

GateResult evaluate_entry_criteria(const std::vector<std::string>& criteria, const ExecutionContext& context) {
    GateResult gate;
    for (const auto& expression : criteria) {
        try {
            if (!evaluate_expression(expression, context)) {
                gate.pass = false;
                gate.expression = expression;
                gate.detail = "entry criteria '" + expression + "' evaluated to false";
                CPACT_LOG_INFO("[gate] '{}' => false", expression);
                return gate;
            }
            CPACT_LOG_DEBUG("[gate] '{}' => true", expression);
        } catch (const ExpressionError& e) {
            gate.pass = false;
            gate.errored = true;
            gate.expression = expression;
            gate.detail = e.what();
            CPACT_LOG_ERROR("[gate] {}", e.what());
            return gate;
        }
    }
    return gate;
}

}  // namespace cpact

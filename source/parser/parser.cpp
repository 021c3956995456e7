#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parser.hpp"

#include <ast/call_expression.hpp>
#include <ast/concurrency.hpp>
#include <ast/expression.hpp>
#include <ast/function_declaration.hpp>
#include <ast/if_expression.hpp>
#include <ast/operator_expressions.hpp>
#include <ast/operators.hpp>
#include <ast/primary.hpp>
#include <ast/statements.hpp>
#include <ast/type_annotation.hpp>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

namespace
{
enum precedence : std::uint8_t
{
    lowest,
    assign,
    logical_or,
    logical_and,
    equals,
    lessgreater,
    sum,
    product,
    prefix,
    idx,
};

auto precedence_of_token(token_type type) -> std::uint8_t
{
    switch (type) {
        case token_type::assign:
        case token_type::plus_assign:
        case token_type::minus_assign:
        case token_type::plus_plus:
        case token_type::minus_minus:
            return assign;
        case token_type::logical_or:
            return logical_or;
        case token_type::logical_and:
            return logical_and;
        case token_type::equals:
        case token_type::not_equals:
            return equals;
        case token_type::less_than:
        case token_type::greater_than:
        case token_type::less_equal:
        case token_type::greater_equal:
            return lessgreater;
        case token_type::plus:
        case token_type::minus:
            return sum;
        case token_type::slash:
        case token_type::asterisk:
        case token_type::percent:
            return product;
        case token_type::lbracket:
            return idx;
        default:
            return lowest;
    }
}

auto binary_operator_of_token(token_type type) -> binary_operator
{
    using enum binary_operator;
    switch (type) {
        case token_type::assign:
            return assign;
        case token_type::plus_assign:
            return self_add;
        case token_type::minus_assign:
            return self_sub;
        case token_type::plus_plus:
            return inc;
        case token_type::minus_minus:
            return dec;
        case token_type::plus:
            return add;
        case token_type::minus:
            return sub;
        case token_type::asterisk:
            return mul;
        case token_type::slash:
            return div;
        case token_type::percent:
            return mod;
        case token_type::equals:
            return equals;
        case token_type::not_equals:
            return not_equals;
        case token_type::less_than:
            return less_than;
        case token_type::greater_than:
            return greater_than;
        case token_type::less_equal:
            return less_equal;
        case token_type::greater_equal:
            return greater_equal;
        case token_type::logical_and:
            return logical_and;
        case token_type::logical_or:
            return logical_or;
        default:
            throw std::invalid_argument("token is not a binary operator");
    }
}

auto unary_operator_of_token(token_type type) -> unary_operator
{
    using enum unary_operator;
    switch (type) {
        case token_type::minus:
            return negate;
        case token_type::exclamation:
            return bang;
        case token_type::plus_plus:
            return inc;
        case token_type::minus_minus:
            return dec;
        default:
            throw std::invalid_argument("token is not a unary operator");
    }
}

auto primitive_type_of_token(token_type type) -> std::optional<type_annotation::type_kind>
{
    using enum type_annotation::type_kind;
    switch (type) {
        case token_type::type_i8:
            return i8;
        case token_type::type_i16:
            return i16;
        case token_type::type_i32:
            return i32;
        case token_type::type_i64:
            return i64;
        case token_type::type_u8:
            return u8;
        case token_type::type_u16:
            return u16;
        case token_type::type_u32:
            return u32;
        case token_type::type_u64:
            return u64;
        case token_type::type_f32:
            return f32;
        case token_type::type_f64:
            return f64;
        case token_type::type_bool:
            return boolean;
        case token_type::type_string:
            return string;
        case token_type::type_dyn:
            return dynamic;
        default:
            return std::nullopt;
    }
}

auto function_attribute_of_token(token_type type) -> std::optional<function_attribute>
{
    using enum function_attribute;
    switch (type) {
        case token_type::weak_attr:
            return weak;
        case token_type::sync_attr:
            return sync;
        case token_type::own_attr:
            return own;
        case token_type::actor_attr:
            return actor;
        default:
            return std::nullopt;
    }
}

auto is_reserved_keyword(token_type type) -> bool
{
    using enum token_type;
    switch (type) {
        case ret:
        case four:
        case in:
        case mod:
        case pub:
        case use:
        case strukt:
        case impl:
            return true;
        default:
            return false;
    }
}

auto unescape(std::string_view literal) -> std::string
{
    std::string result;
    result.reserve(literal.size());
    for (auto itr = literal.cbegin(); itr != literal.cend(); ++itr) {
        if (*itr != '\\' || itr + 1 == literal.cend()) {
            result.push_back(*itr);
            continue;
        }
        ++itr;
        switch (*itr) {
            case 'n':
                result.push_back('\n');
                break;
            case 't':
                result.push_back('\t');
                break;
            case 'r':
                result.push_back('\r');
                break;
            default:
                result.push_back(*itr);
                break;
        }
    }
    return result;
}

auto drain(lexer lxr) -> std::vector<token>
{
    std::vector<token> tokens;
    for (auto tok = lxr.next_token(); tok.type != token_type::eof; tok = lxr.next_token()) {
        tokens.push_back(tok);
    }
    tokens.push_back(lxr.next_token());
    return tokens;
}
}  // namespace

parser::parser(lexer lxr)
    : parser(drain(lxr))
{
}

parser::parser(std::vector<token> tokens)
    : m_tokens {std::move(tokens)}
{
    next_token();
    next_token();
    register_parsers();
}

auto parser::register_parsers() -> void
{
    using enum token_type;
    register_unary(ident, [this] { return parse_identifier_or_call(); });
    register_unary(integer, [this] { return parse_integer_literal(); });
    register_unary(decimal, [this] { return parse_decimal_literal(); });
    register_unary(string, [this] { return parse_string_literal(); });
    register_unary(tru, [this] { return parse_boolean(); });
    register_unary(fals, [this] { return parse_boolean(); });
    register_unary(exclamation, [this] { return parse_unary_expression(); });
    register_unary(minus, [this] { return parse_unary_expression(); });
    register_unary(plus_plus, [this] { return parse_unary_expression(); });
    register_unary(minus_minus, [this] { return parse_unary_expression(); });
    register_unary(lparen, [this] { return parse_grouped_expression(); });
    register_unary(lsquirly, [this] { return parse_block_expression(); });
    register_unary(lbracket, [this] { return parse_array_literal(); });
    register_unary(eef, [this] { return parse_if_expression(); });
    register_unary(channel, [this] { return parse_channel_expression(); });
    register_unary(send, [this] { return parse_send_expression(); });
    register_unary(recv, [this] { return parse_receive_expression(); });
    register_unary(await, [this] { return parse_await_expression(); });
    for (const auto type : {plus,
                            minus,
                            asterisk,
                            slash,
                            percent,
                            equals,
                            not_equals,
                            less_than,
                            greater_than,
                            less_equal,
                            greater_equal,
                            logical_and,
                            logical_or})
    {
        register_binary(type, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    }
    for (const auto type : {assign, plus_assign, minus_assign}) {
        register_binary(type, [this](expression_ptr left) { return parse_assign_expression(std::move(left)); });
    }
    for (const auto type : {plus_plus, minus_minus}) {
        register_binary(type, [this](expression_ptr left) { return parse_postfix_expression(std::move(left)); });
    }
    register_binary(lbracket, [this](expression_ptr left) { return parse_index_expression(std::move(left)); });
}

auto parser::parse_program() -> program_ptr
{
    auto prog = std::make_unique<program>(m_current_token.loc);
    while (!current_token_is(token_type::eof)) {
        auto stmt = parse_statement();
        if (!m_errors.empty()) {
            return prog;
        }
        prog->statements.push_back(std::move(stmt));
        next_token();
    }
    return prog;
}

auto parser::errors() const -> const std::vector<std::string>&
{
    return m_errors;
}

auto parser::next_token() -> void
{
    m_current_token = m_peek_token;
    if (m_next_token < m_tokens.size()) {
        m_peek_token = m_tokens[m_next_token++];
    } else {
        m_peek_token = token {.type = token_type::eof, .literal = "", .loc = m_current_token.loc};
    }
}

auto parser::parse_statement() -> expression_ptr
{
    using enum token_type;
    switch (m_current_token.type) {
        case let:
            return parse_let_statement();
        case function:
            return parse_function_declaration();
        case hwile:
            return parse_while_statement();
        default:
            return parse_expression_statement();
    }
}

auto parser::parse_let_statement() -> expression_ptr
{
    using enum token_type;
    auto stmt = std::make_unique<let_statement>(m_current_token.loc);
    if (!get(ident)) {
        return {};
    }
    stmt->name = std::string {m_current_token.literal};

    if (peek_token_is(colon)) {
        next_token();
        next_token();
        stmt->type = parse_type();
        if (!stmt->type.has_value()) {
            return {};
        }
    }

    if (peek_token_is(assign)) {
        next_token();
        if (peek_token_is(semicolon) || peek_token_is(eof)) {
            new_error(m_peek_token.loc, "expected expression after = in declaration of {}", stmt->name);
            return {};
        }
        next_token();
        stmt->value = parse_expression(lowest);
        if (!stmt->value) {
            return {};
        }
    }

    if (!get(semicolon)) {
        return {};
    }
    return stmt;
}

auto parser::parse_function_declaration() -> expression_ptr
{
    using enum token_type;
    auto decl = std::make_unique<function_declaration>(m_current_token.loc);
    while (true) {
        if (const auto attr = function_attribute_of_token(m_peek_token.type); attr.has_value()) {
            decl->attributes.push_back(attr.value());
        } else if (peek_token_is(async)) {
            decl->is_async = true;
        } else {
            break;
        }
        next_token();
    }
    if (!get(ident)) {
        return {};
    }
    decl->name = std::string {m_current_token.literal};
    if (!get(lparen)) {
        return {};
    }
    auto params = parse_function_parameters();
    if (!params.has_value()) {
        return {};
    }
    decl->params = std::move(params.value());

    if (peek_token_is(arrow)) {
        next_token();
        next_token();
        decl->return_type = parse_type();
        if (!decl->return_type.has_value()) {
            return {};
        }
    }
    if (!get(lsquirly)) {
        return {};
    }
    auto body = parse_block_statement();
    if (!body) {
        return {};
    }
    decl->body = std::move(body);
    return decl;
}

auto parser::parse_function_parameters() -> std::optional<parameters>
{
    using enum token_type;
    parameters params;
    if (peek_token_is(rparen)) {
        next_token();
        return params;
    }
    do {
        if (!params.empty()) {
            next_token();
        }
        if (!get(ident)) {
            return std::nullopt;
        }
        auto name = std::string {m_current_token.literal};
        if (!get(colon)) {
            return std::nullopt;
        }
        next_token();
        auto type = parse_type();
        if (!type.has_value()) {
            return std::nullopt;
        }
        params.push_back(parameter {.name = std::move(name), .type = std::move(type.value())});
    } while (peek_token_is(comma));

    if (!get(rparen)) {
        return std::nullopt;
    }
    return params;
}

auto parser::parse_type() -> std::optional<type_annotation>
{
    using enum token_type;
    using kind = type_annotation::type_kind;
    if (const auto primitive = primitive_type_of_token(m_current_token.type); primitive.has_value()) {
        return type_annotation {.kind = primitive.value(), .arguments = {}};
    }
    auto wrapped = [this](kind wrapper, std::size_t arity) -> std::optional<type_annotation>
    {
        auto result = type_annotation {.kind = wrapper, .arguments = {}};
        for (std::size_t i = 0; i < arity; ++i) {
            next_token();
            auto argument = parse_type();
            if (!argument.has_value()) {
                return std::nullopt;
            }
            result.arguments.push_back(std::move(argument.value()));
            if (i + 1 < arity && !get(comma)) {
                return std::nullopt;
            }
        }
        return result;
    };
    switch (m_current_token.type) {
        case tilde:
            return wrapped(kind::unique, 1);
        case at:
            return wrapped(kind::shared, 1);
        case type_vec: {
            if (!get(less_than)) {
                return std::nullopt;
            }
            auto result = wrapped(kind::vec, 1);
            if (!result.has_value() || !get(greater_than)) {
                return std::nullopt;
            }
            return result;
        }
        case type_hash_map: {
            if (!get(less_than)) {
                return std::nullopt;
            }
            auto result = wrapped(kind::hash_map, 2);
            if (!result.has_value() || !get(greater_than)) {
                return std::nullopt;
            }
            return result;
        }
        default:
            new_error(m_current_token.loc, "expected a type, got {} instead", m_current_token.type);
            return std::nullopt;
    }
}

auto parser::parse_while_statement() -> expression_ptr
{
    auto stmt = std::make_unique<while_statement>(m_current_token.loc);
    next_token();
    stmt->condition = parse_expression(lowest);
    if (!stmt->condition || !get(token_type::lsquirly)) {
        return {};
    }
    stmt->body = parse_block_statement();
    if (!stmt->body) {
        return {};
    }
    if (peek_token_is(token_type::semicolon)) {
        next_token();
    }
    return stmt;
}

auto parser::parse_expression_statement() -> expression_ptr
{
    auto expr = parse_expression(lowest);
    if (!expr) {
        return {};
    }
    if (peek_token_is(token_type::semicolon)) {
        next_token();
    }
    return expr;
}

auto parser::parse_expression(int precedence) -> expression_ptr
{
    auto unary = m_unary_parsers.find(m_current_token.type);
    if (unary == m_unary_parsers.end()) {
        no_unary_expression_error(m_current_token);
        return {};
    }
    auto left_expr = unary->second();
    if (!left_expr) {
        return {};
    }
    while (!peek_token_is(token_type::semicolon) && precedence < peek_precedence()) {
        auto binary = m_binary_parsers.find(m_peek_token.type);
        if (binary == m_binary_parsers.end()) {
            return left_expr;
        }
        next_token();

        left_expr = binary->second(std::move(left_expr));
        if (!left_expr) {
            return {};
        }
    }
    return left_expr;
}

auto parser::parse_identifier_or_call() -> expression_ptr
{
    const auto loc = m_current_token.loc;
    auto name = std::string {m_current_token.literal};
    if (!peek_token_is(token_type::lparen)) {
        return std::make_unique<identifier>(std::move(name), loc);
    }
    next_token();
    auto call = std::make_unique<call_expression>(loc);
    call->callee = std::move(name);
    auto arguments = parse_expression_list(token_type::rparen);
    if (!arguments.has_value()) {
        return {};
    }
    call->arguments = std::move(arguments.value());
    return call;
}

auto parser::parse_integer_literal() -> expression_ptr
{
    auto lit = std::make_unique<integer_literal>(m_current_token.loc);
    try {
        lit->value = std::stoll(std::string {m_current_token.literal});
    } catch (const std::out_of_range&) {
        new_error(m_current_token.loc, "could not parse {} as integer", m_current_token.literal);
        return {};
    }
    return lit;
}

auto parser::parse_decimal_literal() -> expression_ptr
{
    auto lit = std::make_unique<decimal_literal>(m_current_token.loc);
    try {
        lit->value = std::stod(std::string {m_current_token.literal});
    } catch (const std::out_of_range&) {
        new_error(m_current_token.loc, "could not parse {} as float", m_current_token.literal);
        return {};
    }
    return lit;
}

auto parser::parse_string_literal() -> expression_ptr
{
    return std::make_unique<string_literal>(unescape(m_current_token.literal), m_current_token.loc);
}

auto parser::parse_boolean() -> expression_ptr
{
    return std::make_unique<boolean_literal>(current_token_is(token_type::tru), m_current_token.loc);
}

auto parser::parse_unary_expression() -> expression_ptr
{
    auto unary = std::make_unique<unary_expression>(m_current_token.loc);
    unary->op = unary_operator_of_token(m_current_token.type);

    next_token();
    unary->right = parse_expression(prefix);
    if (!unary->right) {
        return {};
    }
    return unary;
}

auto parser::parse_binary_expression(expression_ptr left) -> expression_ptr
{
    auto bin_expr = std::make_unique<binary_expression>(m_current_token.loc);
    bin_expr->op = binary_operator_of_token(m_current_token.type);
    bin_expr->left = std::move(left);

    auto precedence = current_precedence();
    next_token();
    bin_expr->right = parse_expression(precedence);
    if (!bin_expr->right) {
        return {};
    }
    return bin_expr;
}

auto parser::parse_assign_expression(expression_ptr left) -> expression_ptr
{
    auto assign_expr = std::make_unique<assign_expression>(m_current_token.loc);
    assign_expr->op = binary_operator_of_token(m_current_token.type);
    assign_expr->target = std::move(left);

    next_token();
    // one below our own precedence, so `a = b = c` groups to the right
    assign_expr->value = parse_expression(assign - 1);
    if (!assign_expr->value) {
        return {};
    }
    return assign_expr;
}

auto parser::parse_postfix_expression(expression_ptr left) -> expression_ptr
{
    auto assign_expr = std::make_unique<assign_expression>(m_current_token.loc);
    assign_expr->op = binary_operator_of_token(m_current_token.type);
    assign_expr->target = std::move(left);
    return assign_expr;
}

auto parser::parse_grouped_expression() -> expression_ptr
{
    next_token();
    auto exp = parse_expression(lowest);
    if (!exp || !get(token_type::rparen)) {
        return {};
    }
    return exp;
}

auto parser::parse_block_expression() -> expression_ptr
{
    return parse_block_statement();
}

auto parser::parse_if_expression() -> std::unique_ptr<if_expression>
{
    using enum token_type;
    auto expr = std::make_unique<if_expression>(m_current_token.loc);
    next_token();
    expr->condition = parse_expression(lowest);
    if (!expr->condition || !get(lsquirly)) {
        return {};
    }
    expr->consequence = parse_block_statement();
    if (!expr->consequence) {
        return {};
    }

    if (peek_token_is(elze)) {
        next_token();
        if (peek_token_is(eef)) {
            next_token();
            expr->alternative = parse_if_expression();
        } else {
            if (!get(lsquirly)) {
                return {};
            }
            expr->alternative = parse_block_statement();
        }
        if (!expr->alternative) {
            return {};
        }
    }
    return expr;
}

auto parser::parse_block_statement() -> std::unique_ptr<block_statement>
{
    using enum token_type;
    auto block = std::make_unique<block_statement>(m_current_token.loc);
    next_token();
    while (!current_token_is(rsquirly)) {
        if (current_token_is(eof)) {
            new_error(m_current_token.loc, "expected }}, got eof instead");
            return {};
        }
        auto stmt = parse_statement();
        if (!stmt) {
            return {};
        }
        block->statements.push_back(std::move(stmt));
        next_token();
    }
    return block;
}

auto parser::parse_array_literal() -> expression_ptr
{
    auto array = std::make_unique<array_literal>(m_current_token.loc);
    auto elements = parse_expression_list(token_type::rbracket);
    if (!elements.has_value()) {
        return {};
    }
    array->elements = std::move(elements.value());
    return array;
}

auto parser::parse_index_expression(expression_ptr left) -> expression_ptr
{
    auto index_expr = std::make_unique<index_expression>(m_current_token.loc);
    index_expr->left = std::move(left);
    next_token();
    index_expr->index = parse_expression(lowest);
    if (!index_expr->index || !get(token_type::rbracket)) {
        return {};
    }
    return index_expr;
}

auto parser::parse_channel_expression() -> expression_ptr
{
    auto chan = std::make_unique<channel_expression>(m_current_token.loc);
    if (peek_token_is(token_type::lparen)) {
        next_token();
        if (!get(token_type::rparen)) {
            return {};
        }
    }
    return chan;
}

auto parser::parse_send_expression() -> expression_ptr
{
    using enum token_type;
    auto expr = std::make_unique<send_expression>(m_current_token.loc);
    if (!get(lparen)) {
        return {};
    }
    next_token();
    expr->channel = parse_expression(lowest);
    if (!expr->channel || !get(comma)) {
        return {};
    }
    next_token();
    expr->value = parse_expression(lowest);
    if (!expr->value || !get(rparen)) {
        return {};
    }
    return expr;
}

auto parser::parse_receive_expression() -> expression_ptr
{
    using enum token_type;
    auto expr = std::make_unique<receive_expression>(m_current_token.loc);
    if (!get(lparen)) {
        return {};
    }
    next_token();
    expr->channel = parse_expression(lowest);
    if (!expr->channel || !get(rparen)) {
        return {};
    }
    return expr;
}

auto parser::parse_await_expression() -> expression_ptr
{
    auto expr = std::make_unique<await_expression>(m_current_token.loc);
    next_token();
    expr->awaited = parse_expression(prefix);
    if (!expr->awaited) {
        return {};
    }
    return expr;
}

auto parser::parse_expression_list(token_type end) -> std::optional<expressions>
{
    using enum token_type;
    auto list = expressions();
    if (peek_token_is(end)) {
        next_token();
        return list;
    }
    next_token();
    auto first = parse_expression(lowest);
    if (!first) {
        return std::nullopt;
    }
    list.push_back(std::move(first));

    while (peek_token_is(comma)) {
        next_token();
        next_token();
        auto next = parse_expression(lowest);
        if (!next) {
            return std::nullopt;
        }
        list.push_back(std::move(next));
    }

    if (!get(end)) {
        return std::nullopt;
    }
    return list;
}

auto parser::get(token_type type) -> bool
{
    if (m_peek_token.type == type) {
        next_token();
        return true;
    }
    peek_error(type);
    return false;
}

auto parser::peek_error(token_type type) -> void
{
    if (m_peek_token.type == token_type::illegal) {
        new_error(m_peek_token.loc, "illegal token `{}`", m_peek_token.literal);
        return;
    }
    new_error(m_peek_token.loc, "expected next token to be {}, got {} instead", type, m_peek_token.type);
}

auto parser::register_binary(token_type type, binary_parser binary) -> void
{
    m_binary_parsers[type] = std::move(binary);
}

auto parser::register_unary(token_type type, unary_parser unary) -> void
{
    m_unary_parsers[type] = std::move(unary);
}

auto parser::current_token_is(token_type type) const -> bool
{
    return m_current_token.type == type;
}

auto parser::peek_token_is(token_type type) const -> bool
{
    return m_peek_token.type == type;
}

auto parser::no_unary_expression_error(const token& tok) -> void
{
    if (tok.type == token_type::illegal) {
        new_error(tok.loc, "illegal token `{}`", tok.literal);
        return;
    }
    if (is_reserved_keyword(tok.type)) {
        new_error(tok.loc, "reserved keyword {} is not supported", tok.type);
        return;
    }
    new_error(tok.loc, "unexpected {} at start of expression", tok.type);
}

auto parser::peek_precedence() const -> int
{
    return precedence_of_token(m_peek_token.type);
}

auto parser::current_precedence() const -> int
{
    return precedence_of_token(m_current_token.type);
}

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <ast/expression.hpp>
#include <ast/function_declaration.hpp>
#include <ast/if_expression.hpp>
#include <ast/statements.hpp>
#include <ast/type_annotation.hpp>
#include <fmt/format.h>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>

class parser final
{
  public:
    explicit parser(lexer lxr);
    explicit parser(std::vector<token> tokens);

    [[nodiscard]] auto parse_program() -> program_ptr;
    [[nodiscard]] auto errors() const -> const std::vector<std::string>&;

  private:
    using binary_parser = std::function<expression_ptr(expression_ptr)>;
    using unary_parser = std::function<expression_ptr()>;

    auto register_parsers() -> void;
    auto next_token() -> void;
    auto parse_statement() -> expression_ptr;
    auto parse_let_statement() -> expression_ptr;
    auto parse_function_declaration() -> expression_ptr;
    auto parse_while_statement() -> expression_ptr;
    auto parse_expression_statement() -> expression_ptr;

    auto parse_expression(int precedence) -> expression_ptr;
    auto parse_identifier_or_call() -> expression_ptr;
    auto parse_integer_literal() -> expression_ptr;
    auto parse_decimal_literal() -> expression_ptr;
    auto parse_string_literal() -> expression_ptr;
    auto parse_boolean() -> expression_ptr;
    auto parse_unary_expression() -> expression_ptr;
    auto parse_binary_expression(expression_ptr left) -> expression_ptr;
    auto parse_assign_expression(expression_ptr left) -> expression_ptr;
    auto parse_postfix_expression(expression_ptr left) -> expression_ptr;
    auto parse_grouped_expression() -> expression_ptr;
    auto parse_block_expression() -> expression_ptr;
    auto parse_if_expression() -> std::unique_ptr<if_expression>;
    auto parse_array_literal() -> expression_ptr;
    auto parse_index_expression(expression_ptr left) -> expression_ptr;
    auto parse_channel_expression() -> expression_ptr;
    auto parse_send_expression() -> expression_ptr;
    auto parse_receive_expression() -> expression_ptr;
    auto parse_await_expression() -> expression_ptr;
    auto parse_block_statement() -> std::unique_ptr<block_statement>;
    auto parse_function_parameters() -> std::optional<parameters>;
    auto parse_type() -> std::optional<type_annotation>;

    auto parse_expression_list(token_type end) -> std::optional<expressions>;
    auto get(token_type type) -> bool;
    [[nodiscard]] auto current_token_is(token_type type) const -> bool;
    [[nodiscard]] auto peek_token_is(token_type type) const -> bool;
    auto peek_error(token_type type) -> void;
    auto register_binary(token_type type, binary_parser binary) -> void;
    auto register_unary(token_type type, unary_parser unary) -> void;
    auto no_unary_expression_error(const token& tok) -> void;
    [[nodiscard]] auto peek_precedence() const -> int;
    [[nodiscard]] auto current_precedence() const -> int;

    template<typename... T>
    auto new_error(location loc, fmt::format_string<T...> fmt, T&&... args)
    {
        m_errors.push_back(fmt::format("{}: {}", loc, fmt::format(fmt, std::forward<T>(args)...)));
    }

    std::vector<token> m_tokens;
    std::size_t m_next_token {0};
    token m_current_token {};
    token m_peek_token {};
    std::vector<std::string> m_errors {};

    std::unordered_map<token_type, unary_parser> m_unary_parsers;
    std::unordered_map<token_type, binary_parser> m_binary_parsers;
};

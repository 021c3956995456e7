#pragma once

#include <cstddef>
#include <ostream>
#include <string_view>

#include <fmt/ostream.h>

#include "token_type.hpp"

// 1-based position of a token, printed as `file:line:column`
struct location final
{
    std::string_view filename;
    std::size_t line {};
    std::size_t column {};
    auto operator==(const location& other) const -> bool = default;
};

auto operator<<(std::ostream& ostream, const location& loc) -> std::ostream&;

template<>
struct fmt::formatter<location> : ostream_formatter
{
};

// literal views into the lexer input, which must outlive the token
struct token final
{
    token_type type {token_type::eof};
    std::string_view literal;
    location loc {};
    auto operator==(const token& other) const -> bool = default;
};

auto operator<<(std::ostream& ostream, const token& tok) -> std::ostream&;

template<>
struct fmt::formatter<token> : ostream_formatter
{
};

#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class binary_operator : std::uint8_t
{
    assign,
    add,
    self_add,
    inc,
    sub,
    self_sub,
    dec,
    mul,
    div,
    mod,
    equals,
    not_equals,
    less_than,
    greater_than,
    less_equal,
    greater_equal,
    logical_and,
    logical_or,
};

enum class unary_operator : std::uint8_t
{
    negate,
    bang,
    inc,
    dec,
};

auto operator<<(std::ostream& ostream, binary_operator oper) -> std::ostream&;
auto operator<<(std::ostream& ostream, unary_operator oper) -> std::ostream&;

template<>
struct fmt::formatter<binary_operator> : ostream_formatter
{
};

template<>
struct fmt::formatter<unary_operator> : ostream_formatter
{
};

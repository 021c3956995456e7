#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include <lexer/token.hpp>

#include "expression.hpp"

// Leaf expressions and vector literals, the operands everything else is built from.

struct identifier final : expression
{
    identifier(std::string name, location loc)
        : expression {loc}
        , value {std::move(name)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string value;
};

struct integer_literal final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::int64_t value {};
};

struct decimal_literal final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    double value {};
};

// value holds the unescaped text
struct string_literal final : expression
{
    string_literal(std::string unescaped, location loc)
        : expression {loc}
        , value {std::move(unescaped)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string value;
};

struct boolean_literal final : expression
{
    boolean_literal(bool val, location loc)
        : expression {loc}
        , value {val}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    bool value {};
};

struct array_literal final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expressions elements;
};

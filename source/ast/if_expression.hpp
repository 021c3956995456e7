#pragma once

#include "expression.hpp"
#include "statements.hpp"

struct if_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr condition;
    std::unique_ptr<block_statement> consequence;
    // either a block_statement or a nested if_expression for `else if`
    expression_ptr alternative;
};

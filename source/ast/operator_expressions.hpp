#pragma once

#include "expression.hpp"
#include "operators.hpp"

struct unary_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    unary_operator op {};
    expression_ptr right;
};

struct binary_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr left;
    binary_operator op {};
    expression_ptr right;
};

// Covers `=`, `+=`, `-=` and the literal-one forms `inc` / `dec`, which carry no value.
// The target is any expression; only identifiers are assignable at evaluation time.
struct assign_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    binary_operator op {binary_operator::assign};
    expression_ptr target;
    expression_ptr value;
};

struct index_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr left;
    expression_ptr index;
};

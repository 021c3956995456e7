#pragma once

#include <string>

#include "expression.hpp"

struct call_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string callee;
    expressions arguments;
};

#include <string>

#include "operator_expressions.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto unary_expression::string() const -> std::string
{
    return fmt::format("({}{})", op, right->string());
}

void unary_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto binary_expression::string() const -> std::string
{
    return fmt::format("({} {} {})", left->string(), op, right->string());
}

void binary_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto assign_expression::string() const -> std::string
{
    if (value == nullptr) {
        return fmt::format("({}{})", target->string(), op);
    }
    return fmt::format("({} {} {})", target->string(), op, value->string());
}

void assign_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto index_expression::string() const -> std::string
{
    return fmt::format("({}[{}])", left->string(), index->string());
}

void index_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

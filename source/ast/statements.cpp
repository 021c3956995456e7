#include <string>

#include "statements.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto let_statement::string() const -> std::string
{
    return fmt::format("let {}{}{};",
                       name,
                       type.has_value() ? fmt::format(": {}", type->string()) : std::string(),
                       (value != nullptr) ? fmt::format(" = {}", value->string()) : std::string());
}

void let_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto block_statement::string() const -> std::string
{
    if (statements.empty()) {
        return "{ }";
    }
    return fmt::format("{{ {} }}", join(statements, "; "));
}

void block_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto while_statement::string() const -> std::string
{
    return fmt::format("while {} {}", condition->string(), body->string());
}

void while_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto program::string() const -> std::string
{
    return join(statements);
}

void program::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

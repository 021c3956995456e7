#pragma once

#include <memory>
#include <optional>
#include <string>

#include "expression.hpp"
#include "type_annotation.hpp"

using statement = expression;

struct let_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string name;
    std::optional<type_annotation> type;
    expression_ptr value;
};

struct block_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expressions statements;
};

struct while_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr condition;
    std::unique_ptr<block_statement> body;
};

// root of a parsed source; evaluates to the value of its last statement
struct program final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expressions statements;
};

using program_ptr = std::unique_ptr<program>;

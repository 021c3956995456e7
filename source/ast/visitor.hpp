#pragma once

#include <ast/call_expression.hpp>
#include <ast/concurrency.hpp>
#include <ast/expression.hpp>
#include <ast/function_declaration.hpp>
#include <ast/if_expression.hpp>
#include <ast/operator_expressions.hpp>
#include <ast/primary.hpp>
#include <ast/statements.hpp>

struct visitor
{
    visitor(const visitor&) = delete;
    visitor(visitor&&) = delete;
    auto operator=(const visitor&) -> visitor& = delete;
    auto operator=(visitor&&) -> visitor& = delete;
    visitor() = default;
    virtual ~visitor() = default;

    virtual void visit(const array_literal& expr) = 0;
    virtual void visit(const assign_expression& expr) = 0;
    virtual void visit(const await_expression& expr) = 0;
    virtual void visit(const binary_expression& expr) = 0;
    virtual void visit(const block_statement& expr) = 0;
    virtual void visit(const boolean_literal& expr) = 0;
    virtual void visit(const call_expression& expr) = 0;
    virtual void visit(const channel_expression& expr) = 0;
    virtual void visit(const decimal_literal& expr) = 0;
    virtual void visit(const function_declaration& expr) = 0;
    virtual void visit(const identifier& expr) = 0;
    virtual void visit(const if_expression& expr) = 0;
    virtual void visit(const index_expression& expr) = 0;
    virtual void visit(const integer_literal& expr) = 0;
    virtual void visit(const let_statement& expr) = 0;
    virtual void visit(const program& expr) = 0;
    virtual void visit(const receive_expression& expr) = 0;
    virtual void visit(const send_expression& expr) = 0;
    virtual void visit(const string_literal& expr) = 0;
    virtual void visit(const unary_expression& expr) = 0;
    virtual void visit(const while_statement& expr) = 0;
};

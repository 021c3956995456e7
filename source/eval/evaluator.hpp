#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <ast/expression.hpp>
#include <ast/operators.hpp>
#include <ast/statements.hpp>
#include <ast/visitor.hpp>

#include "environment.hpp"
#include "heap.hpp"
#include "object.hpp"

// Where `=`, `+=`, `-=`, `++` and `--` store their result.
enum class assignment_policy : std::uint8_t
{
    // (re)define the name in the innermost scope, shadowing outer bindings
    define_local,
    // update the nearest enclosing binding
    mutate_outer,
};

struct evaluator_options
{
    assignment_policy policy {assignment_policy::define_local};
    // call a global `main` without arguments after the program ran
    bool invoke_main {};
};

struct evaluator final : visitor
{
    explicit evaluator(environment_ptr existing_env = {}, evaluator_options options = {});
    // yields the value of the last statement, read through when it is a reference
    auto evaluate(const program& prgrm) -> object;

    [[nodiscard]] auto env() const -> const environment_ptr& { return m_env; }

    // reads through a reference to its heap cell, any other value is returned as is
    [[nodiscard]] auto deref(const object& obj) const -> object;

  protected:
    void visit(const array_literal& expr) final;
    void visit(const assign_expression& expr) final;
    void visit(const await_expression& expr) final;
    void visit(const binary_expression& expr) final;
    void visit(const block_statement& expr) final;
    void visit(const boolean_literal& expr) final;
    void visit(const call_expression& expr) final;
    void visit(const channel_expression& expr) final;
    void visit(const decimal_literal& expr) final;
    void visit(const function_declaration& expr) final;
    void visit(const identifier& expr) final;
    void visit(const if_expression& expr) final;
    void visit(const index_expression& expr) final;
    void visit(const integer_literal& expr) final;
    void visit(const let_statement& expr) final;
    void visit(const program& expr) final;
    void visit(const receive_expression& expr) final;
    void visit(const send_expression& expr) final;
    void visit(const string_literal& expr) final;
    void visit(const unary_expression& expr) final;
    void visit(const while_statement& expr) final;

  private:
    evaluator(environment_ptr env, evaluator_options options, std::shared_ptr<heap> hp);

    void apply_function(const function_value& func, std::vector<object>&& args);
    void update(const expression& target, binary_operator oper, const object& operand);
    auto load(const identifier& ident) -> std::optional<object>;
    void combine(const identifier& ident, binary_operator oper, const object& current, const object& operand);
    void release(const environment_ptr& locals);
    void store(const std::string& name, const object& val);
    void unimplemented(const char* kind);
    auto evaluate_expressions(const expressions& exprs) -> std::optional<std::vector<object>>;

    object m_result;
    environment_ptr m_env;
    evaluator_options m_options;
    std::shared_ptr<heap> m_heap;
};

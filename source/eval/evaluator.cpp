#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "evaluator.hpp"

#include <ast/call_expression.hpp>
#include <ast/concurrency.hpp>
#include <ast/expression.hpp>
#include <ast/function_declaration.hpp>
#include <ast/if_expression.hpp>
#include <ast/operator_expressions.hpp>
#include <ast/operators.hpp>
#include <ast/primary.hpp>
#include <ast/statements.hpp>
#include <builtin/builtin.hpp>

#include "environment.hpp"
#include "heap.hpp"
#include "object.hpp"
#include "operations.hpp"
#include "overloaded.hpp"

namespace
{
// function values reachable from val whose closure is env
auto count_closures_over(const object& val, const environment* env) -> long
{
    return std::visit(
        overloaded {[env](const function_value& func) -> long { return func.closure.get() == env ? 1 : 0; },
                    [env](const vector_value& vec) -> long
                    {
                        auto count = 0L;
                        for (const auto& element : vec) {
                            count += count_closures_over(element, env);
                        }
                        return count;
                    },
                    [env](const map_value& map) -> long
                    {
                        auto count = 0L;
                        for (const auto& [_, element] : map) {
                            count += count_closures_over(element, env);
                        }
                        return count;
                    },
                    [](const auto&) -> long { return 0; }},
        val.value);
}
}  // namespace

evaluator::evaluator(environment_ptr existing_env, evaluator_options options)
    : evaluator(existing_env ? std::move(existing_env) : std::make_shared<environment>(),
                options,
                std::make_shared<heap>())
{
}

evaluator::evaluator(environment_ptr env, evaluator_options options, std::shared_ptr<heap> hp)
    : m_result {unit()}
    , m_env {std::move(env)}
    , m_options {options}
    , m_heap {std::move(hp)}
{
}

auto evaluator::evaluate(const program& prgrm) -> object
{
    prgrm.accept(*this);
    if (m_result.is_error() || !m_options.invoke_main) {
        return deref(m_result);
    }
    if (const auto main = m_env->get("main"); main.has_value() && main->is<function_value>()) {
        apply_function(main->as<function_value>(), {});
    }
    return deref(m_result);
}

auto evaluator::deref(const object& obj) const -> object
{
    if (const auto* ref = std::get_if<reference_value>(&obj.value); ref != nullptr) {
        return m_heap->get(*ref);
    }
    return obj;
}

void evaluator::visit(const program& expr)
{
    m_result = unit();
    for (const auto& statement : expr.statements) {
        statement->accept(*this);
        if (m_result.is_error()) {
            return;
        }
    }
}

void evaluator::visit(const block_statement& expr)
{
    m_result = unit();
    for (const auto& stmt : expr.statements) {
        stmt->accept(*this);
        if (m_result.is_error()) {
            return;
        }
    }
}

void evaluator::visit(const integer_literal& expr)
{
    m_result = object {expr.value};
}

void evaluator::visit(const decimal_literal& expr)
{
    m_result = object {expr.value};
}

void evaluator::visit(const string_literal& expr)
{
    m_result = object {expr.value};
}

void evaluator::visit(const boolean_literal& expr)
{
    m_result = object {expr.value};
}

void evaluator::visit(const array_literal& expr)
{
    auto elements = evaluate_expressions(expr.elements);
    if (!elements.has_value()) {
        return;
    }
    m_result = object {std::move(elements.value())};
}

void evaluator::visit(const identifier& expr)
{
    auto val = m_env->get(expr.value);
    if (!val.has_value()) {
        m_result = make_error(error_kind::undefined_variable, "identifier not found: {}", expr.value);
        return;
    }
    m_result = std::move(val.value());
}

void evaluator::visit(const let_statement& expr)
{
    m_result = unit();
    if (expr.value != nullptr) {
        expr.value->accept(*this);
        if (m_result.is_error()) {
            return;
        }
    }
    if (expr.type.has_value() && expr.type->is_shared()) {
        auto val = deref(m_result);
        m_env->define(expr.name, object {m_heap->allocate(val)});
        m_result = std::move(val);
        return;
    }
    m_env->define(expr.name, m_result);
}

void evaluator::visit(const function_declaration& expr)
{
    auto func = function_value {.name = expr.name, .parameters = {}, .body = expr.body, .closure = m_env};
    for (const auto& param : expr.params) {
        func.parameters.push_back(param.name);
    }
    m_result = object {std::move(func)};
    m_env->define(expr.name, m_result);
}

void evaluator::visit(const binary_expression& expr)
{
    expr.left->accept(*this);
    if (m_result.is_error()) {
        return;
    }
    const auto evaluated_left = deref(m_result);
    expr.right->accept(*this);
    if (m_result.is_error()) {
        return;
    }
    const auto evaluated_right = deref(m_result);

    m_result = apply_binary_operator(expr.op, evaluated_left, evaluated_right);
}

void evaluator::visit(const unary_expression& expr)
{
    if (expr.op == unary_operator::inc || expr.op == unary_operator::dec) {
        update(*expr.right,
               expr.op == unary_operator::inc ? binary_operator::add : binary_operator::sub,
               object {integer_value {1}});
        return;
    }
    expr.right->accept(*this);
    if (m_result.is_error()) {
        return;
    }
    m_result = apply_unary_operator(expr.op, deref(m_result));
}

void evaluator::visit(const assign_expression& expr)
{
    using enum binary_operator;
    const auto* ident = dynamic_cast<const identifier*>(expr.target.get());
    if (ident == nullptr) {
        m_result = make_error(
            error_kind::invalid_assignment_target, "cannot assign to {}", expr.target->string());
        return;
    }
    switch (expr.op) {
        case inc:
            update(*ident, add, object {integer_value {1}});
            return;
        case dec:
            update(*ident, sub, object {integer_value {1}});
            return;
        case assign: {
            expr.value->accept(*this);
            if (m_result.is_error()) {
                return;
            }
            const auto val = m_result;
            store(ident->value, val);
            m_result = deref(val);
            return;
        }
        default:
            break;
    }
    // the left operand is read before the right one runs, as for binary expressions
    const auto current = load(*ident);
    if (!current.has_value()) {
        return;
    }
    expr.value->accept(*this);
    if (m_result.is_error()) {
        return;
    }
    combine(*ident, expr.op == self_add ? add : sub, current.value(), deref(m_result));
}

void evaluator::update(const expression& target, binary_operator oper, const object& operand)
{
    const auto* ident = dynamic_cast<const identifier*>(&target);
    if (ident == nullptr) {
        m_result = make_error(error_kind::invalid_assignment_target, "cannot assign to {}", target.string());
        return;
    }
    const auto current = load(*ident);
    if (!current.has_value()) {
        return;
    }
    combine(*ident, oper, current.value(), operand);
}

auto evaluator::load(const identifier& ident) -> std::optional<object>
{
    const auto current = m_env->get(ident.value);
    if (!current.has_value()) {
        m_result = make_error(error_kind::undefined_variable, "identifier not found: {}", ident.value);
        return std::nullopt;
    }
    return deref(current.value());
}

void evaluator::combine(const identifier& ident, binary_operator oper, const object& current, const object& operand)
{
    auto updated = apply_binary_operator(oper, current, operand);
    if (updated.is_error()) {
        m_result = std::move(updated);
        return;
    }
    store(ident.value, updated);
    m_result = std::move(updated);
}

void evaluator::store(const std::string& name, const object& val)
{
    if (const auto current = m_env->get(name); current.has_value() && current->is<reference_value>()) {
        m_heap->set(current->as<reference_value>(), deref(val));
        return;
    }
    switch (m_options.policy) {
        case assignment_policy::define_local:
            m_env->define(name, val);
            return;
        case assignment_policy::mutate_outer:
            m_env->reassign(name, val);
            return;
    }
}

void evaluator::visit(const if_expression& expr)
{
    expr.condition->accept(*this);
    if (m_result.is_error()) {
        return;
    }
    const auto evaluated_condition = deref(m_result);
    if (!evaluated_condition.is<bool>()) {
        m_result = make_error(
            error_kind::type_mismatch, "if condition must be Boolean, got {}", evaluated_condition.type_name());
        return;
    }
    if (evaluated_condition.as<bool>()) {
        expr.consequence->accept(*this);
        return;
    }
    if (expr.alternative != nullptr) {
        expr.alternative->accept(*this);
        return;
    }
    m_result = unit();
}

void evaluator::visit(const while_statement& expr)
{
    while (true) {
        expr.condition->accept(*this);
        if (m_result.is_error()) {
            return;
        }
        const auto evaluated_condition = deref(m_result);
        if (!evaluated_condition.is<bool>()) {
            m_result = make_error(
                error_kind::type_mismatch, "while condition must be Boolean, got {}", evaluated_condition.type_name());
            return;
        }
        if (!evaluated_condition.as<bool>()) {
            break;
        }
        expr.body->accept(*this);
        if (m_result.is_error()) {
            return;
        }
    }
    m_result = unit();
}

void evaluator::visit(const index_expression& expr)
{
    expr.left->accept(*this);
    if (m_result.is_error()) {
        return;
    }
    const auto evaluated_left = deref(m_result);
    expr.index->accept(*this);
    if (m_result.is_error()) {
        return;
    }
    const auto evaluated_index = deref(m_result);

    if (evaluated_left.is<vector_value>() || evaluated_left.is<string_value>()) {
        if (!evaluated_index.is<integer_value>()) {
            m_result = make_error(error_kind::type_mismatch,
                                  "{} index must be Integer, got {}",
                                  evaluated_left.type_name(),
                                  evaluated_index.type_name());
            return;
        }
        const auto index = evaluated_index.as<integer_value>();
        const auto size = evaluated_left.is<vector_value>() ? evaluated_left.as<vector_value>().size()
                                                            : evaluated_left.as<string_value>().size();
        if (index < 0 || static_cast<std::size_t>(index) >= size) {
            m_result = make_error(error_kind::index_out_of_bounds, "index {} out of bounds for length {}", index, size);
            return;
        }
        const auto pos = static_cast<std::size_t>(index);
        if (evaluated_left.is<vector_value>()) {
            m_result = evaluated_left.as<vector_value>()[pos];
        } else {
            m_result = object {evaluated_left.as<string_value>().substr(pos, 1)};
        }
        return;
    }

    if (evaluated_left.is<map_value>()) {
        if (!evaluated_index.is<string_value>()) {
            m_result =
                make_error(error_kind::type_mismatch, "Map key must be String, got {}", evaluated_index.type_name());
            return;
        }
        const auto& map = evaluated_left.as<map_value>();
        const auto& key = evaluated_index.as<string_value>();
        if (const auto itr = map.find(key); itr != map.end()) {
            m_result = itr->second;
            return;
        }
        m_result = make_error(error_kind::key_not_found, "key not found: \"{}\"", key);
        return;
    }
    m_result = make_error(error_kind::type_mismatch, "index operator not supported: {}", evaluated_left.type_name());
}

void evaluator::visit(const call_expression& expr)
{
    auto args = evaluate_expressions(expr.arguments);
    if (!args.has_value()) {
        return;
    }
    const auto bound = m_env->get(expr.callee);
    if (bound.has_value()) {
        const auto callee = deref(bound.value());
        if (callee.is<function_value>()) {
            apply_function(callee.as<function_value>(), std::move(args.value()));
            return;
        }
    }
    if (const auto* bltn = builtin::find(expr.callee); bltn != nullptr) {
        m_result = bltn->body(std::move(args.value()));
        return;
    }
    if (bound.has_value()) {
        m_result = make_error(
            error_kind::type_mismatch, "{} is not a function: {}", expr.callee, deref(bound.value()).type_name());
        return;
    }
    m_result = make_error(error_kind::unknown_function, "unknown function: {}", expr.callee);
}

void evaluator::apply_function(const function_value& func, std::vector<object>&& args)
{
    if (args.size() != func.parameters.size()) {
        m_result = make_error(error_kind::arity_mismatch,
                              "wrong number of arguments to {}(): expected={}, got={}",
                              func.name,
                              func.parameters.size(),
                              args.size());
        return;
    }
    auto locals = std::make_shared<environment>(func.closure);
    for (auto arg_itr = args.begin(); const auto& parameter : func.parameters) {
        locals->define(parameter, std::move(*(arg_itr++)));
    }
    {
        evaluator local(locals, m_options, m_heap);
        func.body->accept(local);
        m_result = std::move(local.m_result);
    }
    release(locals);
}

void evaluator::release(const environment_ptr& locals)
{
    // functions declared in the call keep its scope alive through their closure
    auto self_references = 0L;
    for (const auto& [_, val] : locals->store) {
        self_references += count_closures_over(val, locals.get());
    }
    // anything beyond our own handle and those bindings means a closure escaped the call
    if (locals.use_count() == 1 + self_references) {
        locals->break_cycle();
    }
}

auto evaluator::evaluate_expressions(const expressions& exprs) -> std::optional<std::vector<object>>
{
    std::vector<object> result;
    for (const auto& expr : exprs) {
        expr->accept(*this);
        if (m_result.is_error()) {
            return std::nullopt;
        }
        result.push_back(deref(m_result));
    }
    return result;
}

void evaluator::unimplemented(const char* kind)
{
    m_result = make_error(error_kind::unimplemented_node_kind, "{} is not supported by this interpreter", kind);
}

void evaluator::visit(const channel_expression& /*expr*/)
{
    unimplemented("channel");
}

void evaluator::visit(const send_expression& /*expr*/)
{
    unimplemented("send");
}

void evaluator::visit(const receive_expression& /*expr*/)
{
    unimplemented("recv");
}

void evaluator::visit(const await_expression& /*expr*/)
{
    unimplemented("await");
}

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "operations.hpp"

#include <ast/operators.hpp>

#include "object.hpp"
#include "overloaded.hpp"

namespace
{
using result_type = std::optional<object>;

template<typename T>
auto compare(binary_operator oper, const T& lhs, const T& rhs) -> result_type
{
    using enum binary_operator;
    switch (oper) {
        case equals:
            return object {lhs == rhs};
        case not_equals:
            return object {lhs != rhs};
        case less_than:
            return object {lhs < rhs};
        case greater_than:
            return object {lhs > rhs};
        case less_equal:
            return object {lhs <= rhs};
        case greater_equal:
            return object {lhs >= rhs};
        default:
            return std::nullopt;
    }
}

// two's complement wrap around, as the underlying unsigned arithmetic does
auto wrap(std::uint64_t val) -> integer_value
{
    return static_cast<integer_value>(val);
}

auto integer_arithmetic(binary_operator oper, integer_value lhs, integer_value rhs) -> result_type
{
    using enum binary_operator;
    const auto ulhs = static_cast<std::uint64_t>(lhs);
    const auto urhs = static_cast<std::uint64_t>(rhs);
    switch (oper) {
        case add:
            return object {wrap(ulhs + urhs)};
        case sub:
            return object {wrap(ulhs - urhs)};
        case mul:
            return object {wrap(ulhs * urhs)};
        case div:
            if (rhs == 0) {
                return make_error(error_kind::division_by_zero, "division by zero: {} / 0", lhs);
            }
            if (rhs == -1) {
                return object {wrap(0ULL - ulhs)};
            }
            return object {lhs / rhs};
        case mod:
            if (rhs == 0) {
                return make_error(error_kind::modulus_by_zero, "modulus by zero: {} % 0", lhs);
            }
            if (rhs == -1) {
                return object {integer_value {0}};
            }
            return object {lhs % rhs};
        default:
            return compare(oper, lhs, rhs);
    }
}

auto decimal_arithmetic(binary_operator oper, decimal_value lhs, decimal_value rhs) -> result_type
{
    using enum binary_operator;
    switch (oper) {
        case add:
            return object {lhs + rhs};
        case sub:
            return object {lhs - rhs};
        case mul:
            return object {lhs * rhs};
        case div:
            return object {lhs / rhs};
        case mod:
            return object {std::fmod(lhs, rhs)};
        default:
            return compare(oper, lhs, rhs);
    }
}

auto string_operation(binary_operator oper, const string_value& lhs, const string_value& rhs) -> result_type
{
    if (oper == binary_operator::add) {
        return object {lhs + rhs};
    }
    return compare(oper, lhs, rhs);
}

auto boolean_operation(binary_operator oper, bool lhs, bool rhs) -> result_type
{
    using enum binary_operator;
    switch (oper) {
        case logical_and:
            return object {lhs && rhs};
        case logical_or:
            return object {lhs || rhs};
        case equals:
            return object {lhs == rhs};
        case not_equals:
            return object {lhs != rhs};
        default:
            return std::nullopt;
    }
}

auto unit_operation(binary_operator oper) -> result_type
{
    using enum binary_operator;
    switch (oper) {
        case equals:
            return object {true};
        case not_equals:
            return object {false};
        default:
            return std::nullopt;
    }
}
}  // namespace

auto apply_binary_operator(binary_operator oper, const object& left, const object& right) -> object
{
    auto result = std::visit(
        overloaded {
            [oper](const integer_value lhs, const integer_value rhs) -> result_type
            { return integer_arithmetic(oper, lhs, rhs); },
            [oper](const decimal_value lhs, const decimal_value rhs) -> result_type
            { return decimal_arithmetic(oper, lhs, rhs); },
            [oper](const integer_value lhs, const decimal_value rhs) -> result_type
            { return decimal_arithmetic(oper, static_cast<decimal_value>(lhs), rhs); },
            [oper](const decimal_value lhs, const integer_value rhs) -> result_type
            { return decimal_arithmetic(oper, lhs, static_cast<decimal_value>(rhs)); },
            [oper](const string_value& lhs, const string_value& rhs) -> result_type
            { return string_operation(oper, lhs, rhs); },
            [oper](const bool lhs, const bool rhs) -> result_type { return boolean_operation(oper, lhs, rhs); },
            [oper](const unit_type&, const unit_type&) -> result_type { return unit_operation(oper); },
            [](const auto&, const auto&) -> result_type { return std::nullopt; },
        },
        left.value,
        right.value);
    if (result.has_value()) {
        return result.value();
    }
    return make_error(error_kind::type_mismatch,
                      "unsupported operand types for {}: {} and {}",
                      oper,
                      left.type_name(),
                      right.type_name());
}

auto apply_unary_operator(unary_operator oper, const object& operand) -> object
{
    using enum unary_operator;
    switch (oper) {
        case negate:
            if (operand.is<integer_value>()) {
                return object {wrap(0ULL - static_cast<std::uint64_t>(operand.as<integer_value>()))};
            }
            if (operand.is<decimal_value>()) {
                return object {-operand.as<decimal_value>()};
            }
            break;
        case bang:
            if (operand.is<bool>()) {
                return object {!operand.as<bool>()};
            }
            break;
        case inc:
        case dec:
            // rewritten into assignments by the evaluator
            break;
    }
    return make_error(error_kind::type_mismatch, "unsupported operand type for {}: {}", oper, operand.type_name());
}

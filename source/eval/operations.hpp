#pragma once

#include <ast/operators.hpp>

#include "object.hpp"

// Applies a non-assigning binary operator to two dereferenced operands.
// Unsupported operator / operand type combinations yield a type_mismatch error.
[[nodiscard]] auto apply_binary_operator(binary_operator oper, const object& left, const object& right) -> object;

[[nodiscard]] auto apply_unary_operator(unary_operator oper, const object& operand) -> object;

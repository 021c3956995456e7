#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <ast/statements.hpp>
#include <fmt/core.h>
#include <fmt/ostream.h>

#include "environment_fwd.hpp"

enum class error_kind : std::uint8_t
{
    undefined_variable,
    type_mismatch,
    division_by_zero,
    modulus_by_zero,
    index_out_of_bounds,
    key_not_found,
    arity_mismatch,
    invalid_assignment_target,
    unknown_function,
    unimplemented_node_kind,
    invalid_argument,
};

auto operator<<(std::ostream& ostrm, error_kind kind) -> std::ostream&;

template<>
struct fmt::formatter<error_kind> : ostream_formatter
{
};

struct error
{
    error_kind kind {};
    std::string message;
    auto operator==(const error& other) const -> bool = default;
};

using unit_type = std::monostate;

struct object;

using integer_value = std::int64_t;
using decimal_value = double;
using string_value = std::string;
using vector_value = std::vector<object>;
using map_value = std::map<std::string, object>;

struct function_value
{
    std::string name;
    std::vector<std::string> parameters;
    std::shared_ptr<const block_statement> body;
    environment_ptr closure;
};

// index of a cell on the evaluator heap
struct reference_value
{
    std::size_t cell {};
    auto operator==(const reference_value& other) const -> bool = default;
};

using value_type = std::variant<unit_type,
                                integer_value,
                                decimal_value,
                                string_value,
                                bool,
                                vector_value,
                                map_value,
                                function_value,
                                reference_value,
                                error>;

struct object
{
    template<typename T>
    [[nodiscard]] auto is() const -> bool
    {
        return std::holds_alternative<T>(value);
    }

    [[nodiscard]] auto is_unit() const -> bool { return is<unit_type>(); }

    [[nodiscard]] auto is_error() const -> bool { return is<error>(); }

    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        if (!is<T>()) {
            throw std::runtime_error(fmt::format("{} is not a {}", inspect(), object {T {}}.type_name()));
        }
        return std::get<T>(value);
    }

    // type name as used in diagnostics, e.g. `Integer`
    [[nodiscard]] auto type_name() const -> std::string;
    // representation for the REPL: strings are quoted
    [[nodiscard]] auto inspect() const -> std::string;
    // representation for print / println: strings are written as is
    [[nodiscard]] auto display() const -> std::string;

    value_type value {};
};

auto operator==(const object& lhs, const object& rhs) -> bool;
auto operator<<(std::ostream& ostrm, const object& obj) -> std::ostream&;

template<>
struct fmt::formatter<object> : ostream_formatter
{
};

inline auto unit() -> object
{
    return object {unit_type {}};
}

template<typename... T>
auto make_error(error_kind kind, fmt::format_string<T...> fmt, T&&... args) -> object
{
    return object {error {.kind = kind, .message = fmt::format(fmt, std::forward<T>(args)...)}};
}

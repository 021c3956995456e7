#include <algorithm>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "object.hpp"

#include <ast/util.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "overloaded.hpp"

auto operator<<(std::ostream& ostrm, error_kind kind) -> std::ostream&
{
    using enum error_kind;
    switch (kind) {
        case undefined_variable:
            return ostrm << "UndefinedVariable";
        case type_mismatch:
            return ostrm << "TypeMismatch";
        case division_by_zero:
            return ostrm << "DivisionByZero";
        case modulus_by_zero:
            return ostrm << "ModulusByZero";
        case index_out_of_bounds:
            return ostrm << "IndexOutOfBounds";
        case key_not_found:
            return ostrm << "KeyNotFound";
        case arity_mismatch:
            return ostrm << "ArityMismatch";
        case invalid_assignment_target:
            return ostrm << "InvalidAssignmentTarget";
        case unknown_function:
            return ostrm << "UnknownFunction";
        case unimplemented_node_kind:
            return ostrm << "UnimplementedNodeKind";
        case invalid_argument:
            return ostrm << "InvalidArgument";
    }
    throw std::invalid_argument("invalid error_kind");
}

auto object::type_name() const -> std::string
{
    return std::visit(overloaded {[](const unit_type&) { return "Unit"; },
                                  [](const integer_value) { return "Integer"; },
                                  [](const decimal_value) { return "Float"; },
                                  [](const string_value&) { return "String"; },
                                  [](const bool) { return "Boolean"; },
                                  [](const vector_value&) { return "Vector"; },
                                  [](const map_value&) { return "Map"; },
                                  [](const function_value&) { return "Function"; },
                                  [](const reference_value&) { return "Reference"; },
                                  [](const error&) { return "Error"; }},
                      value);
}

namespace
{
auto inspect_all(const vector_value& values) -> std::vector<std::string>
{
    std::vector<std::string> strs;
    std::transform(values.cbegin(),
                   values.cend(),
                   std::back_inserter(strs),
                   [](const object& element) { return element.inspect(); });
    return strs;
}
}  // namespace

auto object::inspect() const -> std::string
{
    return std::visit(
        overloaded {[](const unit_type&) -> std::string { return "()"; },
                    [](const integer_value val) -> std::string { return std::to_string(val); },
                    [](const decimal_value val) -> std::string { return decimal_to_string(val); },
                    [](const string_value& val) -> std::string { return fmt::format(R"("{}")", val); },
                    [](const bool val) -> std::string { return val ? "true" : "false"; },
                    [](const vector_value& val) -> std::string
                    { return fmt::format("[{}]", fmt::join(inspect_all(val), ", ")); },
                    [](const map_value& val) -> std::string
                    {
                        std::vector<std::string> pairs;
                        for (const auto& [key, element] : val) {
                            pairs.push_back(fmt::format(R"("{}": {})", key, element.inspect()));
                        }
                        return fmt::format("{{{}}}", fmt::join(pairs, ", "));
                    },
                    [](const function_value& val) -> std::string
                    { return fmt::format("func {}({})", val.name, fmt::join(val.parameters, ", ")); },
                    [](const reference_value& val) -> std::string { return fmt::format("@{}", val.cell); },
                    [](const error& val) -> std::string { return fmt::format("{}: {}", val.kind, val.message); }},
        value);
}

auto object::display() const -> std::string
{
    if (const auto* str = std::get_if<string_value>(&value); str != nullptr) {
        return *str;
    }
    return inspect();
}

auto operator==(const object& lhs, const object& rhs) -> bool
{
    return std::visit(overloaded {[](const unit_type&, const unit_type&) { return true; },
                                  [](const integer_value val1, const integer_value val2) { return val1 == val2; },
                                  [](const decimal_value val1, const decimal_value val2) { return val1 == val2; },
                                  [](const string_value& val1, const string_value& val2) { return val1 == val2; },
                                  [](const bool val1, const bool val2) { return val1 == val2; },
                                  [](const vector_value& val1, const vector_value& val2) { return val1 == val2; },
                                  [](const map_value& val1, const map_value& val2) { return val1 == val2; },
                                  [](const reference_value& val1, const reference_value& val2) { return val1 == val2; },
                                  [](const error& val1, const error& val2) { return val1 == val2; },
                                  [](const auto&, const auto&) { return false; }},
                      lhs.value,
                      rhs.value);
}

auto operator<<(std::ostream& ostrm, const object& obj) -> std::ostream&
{
    return ostrm << obj.inspect();
}

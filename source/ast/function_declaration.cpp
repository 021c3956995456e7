#include <algorithm>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "function_declaration.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "visitor.hpp"

auto operator<<(std::ostream& ostream, function_attribute attr) -> std::ostream&
{
    using enum function_attribute;
    switch (attr) {
        case weak:
            return ostream << "#weak";
        case sync:
            return ostream << "#sync";
        case own:
            return ostream << "#own";
        case actor:
            return ostream << "#actor";
    }
    throw std::invalid_argument("invalid function_attribute");
}

auto function_declaration::string() const -> std::string
{
    std::vector<std::string> modifiers;
    std::transform(attributes.cbegin(),
                   attributes.cend(),
                   std::back_inserter(modifiers),
                   [](function_attribute attr) { return fmt::format("{}", attr); });
    if (is_async) {
        modifiers.emplace_back("async");
    }
    std::vector<std::string> params_strs;
    std::transform(params.cbegin(),
                   params.cend(),
                   std::back_inserter(params_strs),
                   [](const parameter& param) { return fmt::format("{}: {}", param.name, param.type.string()); });
    return fmt::format("func {}{}({}){} {}",
                       modifiers.empty() ? std::string() : fmt::format("{} ", fmt::join(modifiers, " ")),
                       name,
                       fmt::join(params_strs, ", "),
                       return_type.has_value() ? fmt::format(" -> {}", return_type->string()) : std::string(),
                       body->string());
}

void function_declaration::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <fmt/ostream.h>

#include "expression.hpp"
#include "statements.hpp"
#include "type_annotation.hpp"

enum class function_attribute : std::uint8_t
{
    weak,
    sync,
    own,
    actor,
};

auto operator<<(std::ostream& ostream, function_attribute attr) -> std::ostream&;

template<>
struct fmt::formatter<function_attribute> : ostream_formatter
{
};

struct parameter final
{
    std::string name;
    type_annotation type;
};

using parameters = std::vector<parameter>;

struct function_declaration final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string name;
    std::vector<function_attribute> attributes;
    bool is_async {};
    ::parameters params;
    std::optional<type_annotation> return_type;
    // shared with every function value created from this declaration
    std::shared_ptr<const block_statement> body;
};

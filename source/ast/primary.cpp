#include <string>

#include "primary.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

namespace
{
auto escape(const std::string& unescaped) -> std::string
{
    std::string escaped;
    escaped.reserve(unescaped.size());
    for (const auto chr : unescaped) {
        switch (chr) {
            case '\n':
                escaped += "\\n";
                break;
            case '\t':
                escaped += "\\t";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            default:
                escaped += chr;
        }
    }
    return escaped;
}
}  // namespace

auto identifier::string() const -> std::string
{
    return value;
}

void identifier::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto integer_literal::string() const -> std::string
{
    return fmt::format("{}", value);
}

void integer_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto decimal_literal::string() const -> std::string
{
    return decimal_to_string(value);
}

void decimal_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto string_literal::string() const -> std::string
{
    return fmt::format("\"{}\"", escape(value));
}

void string_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto boolean_literal::string() const -> std::string
{
    return value ? "true" : "false";
}

void boolean_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto array_literal::string() const -> std::string
{
    return fmt::format("[{}]", join(elements, ", "));
}

void array_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

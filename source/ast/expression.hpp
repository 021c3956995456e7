#pragma once

#include <memory>
#include <string>
#include <vector>

#include <lexer/token.hpp>

struct expression
{
    explicit expression(location loc)
        : l {loc}
    {
    }

    virtual ~expression() = default;
    expression(const expression&) = delete;
    expression(expression&&) = delete;
    auto operator=(const expression&) -> expression& = delete;
    auto operator=(expression&&) -> expression& = delete;

    [[nodiscard]] virtual auto string() const -> std::string = 0;
    virtual void accept(struct visitor& visitor) const = 0;

    [[nodiscard]] auto loc() const { return l; }

    location l;
};

using expression_ptr = std::unique_ptr<expression>;
using expressions = std::vector<expression_ptr>;

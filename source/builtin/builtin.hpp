#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <eval/object.hpp>

struct builtin final
{
    builtin(std::string name,
            std::vector<std::string> params,
            std::function<object(std::vector<object>&& arguments)> bod);

    static auto builtins() -> const std::vector<const builtin*>&;
    [[nodiscard]] static auto find(std::string_view name) -> const builtin*;
    [[nodiscard]] static auto is_builtin(std::string_view name) -> bool;

    std::string name;
    std::vector<std::string> parameters;
    std::function<object(std::vector<object>&& arguments)> body;
};

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "environment_fwd.hpp"
#include "object.hpp"

struct environment final
{
    explicit environment(environment_ptr parent_env = {});
    environment(const environment&) = delete;
    environment(environment&&) = delete;
    auto operator=(const environment&) -> environment& = delete;
    auto operator=(environment&&) -> environment& = delete;
    ~environment() = default;

    // binds in this scope only, shadowing any outer binding
    auto define(const std::string& name, const object& val) -> void;
    [[nodiscard]] auto get(const std::string& name) const -> std::optional<object>;
    // updates the nearest scope binding name, or defines it here when none does
    auto reassign(const std::string& name, const object& val) -> void;

    auto debug() const -> void;
    auto break_cycle() -> void;

    std::unordered_map<std::string, object> store;
    environment_ptr parent;
};

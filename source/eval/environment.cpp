#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "environment.hpp"

#include <fmt/core.h>

#include "object.hpp"

environment::environment(environment_ptr parent_env)
    : parent(std::move(parent_env))
{
}

auto environment::define(const std::string& name, const object& val) -> void
{
    store[name] = val;
}

auto environment::get(const std::string& name) const -> std::optional<object>
{
    for (const auto* ptr = this; ptr != nullptr; ptr = ptr->parent.get()) {
        if (const auto itr = ptr->store.find(name); itr != ptr->store.end()) {
            return itr->second;
        }
    }
    return std::nullopt;
}

auto environment::reassign(const std::string& name, const object& val) -> void
{
    for (auto* ptr = this; ptr != nullptr; ptr = ptr->parent.get()) {
        if (const auto itr = ptr->store.find(name); itr != ptr->store.end()) {
            itr->second = val;
            return;
        }
    }
    define(name, val);
}

auto environment::debug() const -> void
{
    std::vector<std::string> names;
    names.reserve(store.size());
    for (const auto& [name, _] : store) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    for (const auto& name : names) {
        fmt::print("[{}] = {}\n", name, store.at(name).inspect());
    }
}

auto environment::break_cycle() -> void
{
    store.clear();
}

#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Declared type of a binding or parameter. Parsed and printed, never enforced.
struct type_annotation final
{
    enum class type_kind : std::uint8_t
    {
        i8,
        i16,
        i32,
        i64,
        u8,
        u16,
        u32,
        u64,
        f32,
        f64,
        boolean,
        string,
        dynamic,
        unique,
        shared,
        vec,
        hash_map,
    };

    [[nodiscard]] auto string() const -> std::string;
    [[nodiscard]] auto is_shared() const -> bool { return kind == type_kind::shared; }
    auto operator==(const type_annotation& other) const -> bool;

    type_kind kind {type_kind::dynamic};
    std::vector<type_annotation> arguments;
};

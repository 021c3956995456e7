#include <string>

#include "type_annotation.hpp"

#include <fmt/format.h>

auto type_annotation::string() const -> std::string
{
    using enum type_kind;
    switch (kind) {
        case i8:
            return "i8";
        case i16:
            return "i16";
        case i32:
            return "i32";
        case i64:
            return "i64";
        case u8:
            return "u8";
        case u16:
            return "u16";
        case u32:
            return "u32";
        case u64:
            return "u64";
        case f32:
            return "f32";
        case f64:
            return "f64";
        case boolean:
            return "bool";
        case string:
            return "string";
        case dynamic:
            return "dyn";
        case unique:
            return fmt::format("~{}", arguments.at(0).string());
        case shared:
            return fmt::format("@{}", arguments.at(0).string());
        case vec:
            return fmt::format("Vec<{}>", arguments.at(0).string());
        case hash_map:
            return fmt::format("HashMap<{}, {}>", arguments.at(0).string(), arguments.at(1).string());
    }
    return "unknown";
}

auto type_annotation::operator==(const type_annotation& other) const -> bool
{
    return kind == other.kind && arguments == other.arguments;
}

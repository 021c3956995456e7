#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "builtin.hpp"

#include <ast/util.hpp>
#include <eval/object.hpp>
#include <fmt/core.h>
#include <fmt/format.h>

builtin::builtin(std::string name,
                 std::vector<std::string> params,
                 std::function<object(std::vector<object>&& arguments)> bod)
    : name {std::move(name)}
    , parameters {std::move(params)}
    , body {std::move(bod)}
{
}

namespace
{
auto wrong_number_of_arguments(std::string_view name, std::size_t expected, std::size_t got) -> object
{
    return make_error(
        error_kind::arity_mismatch, "wrong number of arguments to {}(): expected={}, got={}", name, expected, got);
}

// whole string must be consumed, so "12abc" is rejected
template<typename T>
auto parse_number(const std::string& str) -> std::optional<T>
{
    T parsed {};
    const auto* last = str.data() + str.size();
    const auto [ptr, ec] = std::from_chars(str.data(), last, parsed);
    if (ec != std::errc {} || ptr != last) {
        return std::nullopt;
    }
    return parsed;
}

auto unsupported_argument(std::string_view name, const object& arg) -> object
{
    return make_error(error_kind::type_mismatch, "argument of type {} to {}() is not supported", arg.type_name(), name);
}

const builtin println {"println",
                       {"val"},
                       [](std::vector<object>&& arguments) -> object
                       {
                           if (arguments.size() != 1) {
                               return wrong_number_of_arguments("println", 1, arguments.size());
                           }
                           fmt::print("{}\n", arguments[0].display());
                           return unit();
                       }};

const builtin print {"print",
                     {"val"},
                     [](std::vector<object>&& arguments) -> object
                     {
                         if (arguments.size() != 1) {
                             return wrong_number_of_arguments("print", 1, arguments.size());
                         }
                         fmt::print("{}", arguments[0].display());
                         std::fflush(stdout);
                         return unit();
                     }};

const builtin to_string {"to_string",
                         {"val"},
                         [](std::vector<object>&& arguments) -> object
                         {
                             if (arguments.size() != 1) {
                                 return wrong_number_of_arguments("to_string", 1, arguments.size());
                             }
                             const auto& val = arguments[0];
                             if (val.is<integer_value>() || val.is<decimal_value>() || val.is<bool>()
                                 || val.is<string_value>())
                             {
                                 return object {val.display()};
                             }
                             return unsupported_argument("to_string", val);
                         }};

const builtin to_int {
    "to_int",
    {"val"},
    [](std::vector<object>&& arguments) -> object
    {
        if (arguments.size() != 1) {
            return wrong_number_of_arguments("to_int", 1, arguments.size());
        }
        const auto& val = arguments[0];
        if (val.is<integer_value>()) {
            return val;
        }
        if (val.is<decimal_value>()) {
            const auto dec = val.as<decimal_value>();
            constexpr auto bound = 9223372036854775808.0;
            if (!(dec >= -bound && dec < bound)) {
                return make_error(error_kind::invalid_argument, "{} is out of integer range", decimal_to_string(dec));
            }
            return object {static_cast<integer_value>(dec)};
        }
        if (val.is<string_value>()) {
            const auto& str = val.as<string_value>();
            if (const auto parsed = parse_number<integer_value>(str); parsed.has_value()) {
                return object {parsed.value()};
            }
            return make_error(error_kind::invalid_argument, "could not parse \"{}\" as integer", str);
        }
        return unsupported_argument("to_int", val);
    }};

const builtin to_float {"to_float",
                        {"val"},
                        [](std::vector<object>&& arguments) -> object
                        {
                            if (arguments.size() != 1) {
                                return wrong_number_of_arguments("to_float", 1, arguments.size());
                            }
                            const auto& val = arguments[0];
                            if (val.is<decimal_value>()) {
                                return val;
                            }
                            if (val.is<integer_value>()) {
                                return object {static_cast<decimal_value>(val.as<integer_value>())};
                            }
                            if (val.is<string_value>()) {
                                const auto& str = val.as<string_value>();
                                if (const auto parsed = parse_number<decimal_value>(str); parsed.has_value()) {
                                    return object {parsed.value()};
                                }
                                return make_error(error_kind::invalid_argument, "could not parse \"{}\" as float", str);
                            }
                            return unsupported_argument("to_float", val);
                        }};

const builtin to_bool {"to_bool",
                       {"val"},
                       [](std::vector<object>&& arguments) -> object
                       {
                           if (arguments.size() != 1) {
                               return wrong_number_of_arguments("to_bool", 1, arguments.size());
                           }
                           const auto& val = arguments[0];
                           if (val.is<bool>()) {
                               return val;
                           }
                           if (val.is<integer_value>()) {
                               return object {val.as<integer_value>() != 0};
                           }
                           if (val.is<string_value>()) {
                               const auto& str = val.as<string_value>();
                               if (str == "true" || str == "false") {
                                   return object {str == "true"};
                               }
                               return make_error(
                                   error_kind::invalid_argument, "could not parse \"{}\" as boolean", str);
                           }
                           return unsupported_argument("to_bool", val);
                       }};

const builtin len {"len",
                   {"val"},
                   [](std::vector<object>&& arguments) -> object
                   {
                       if (arguments.size() != 1) {
                           return wrong_number_of_arguments("len", 1, arguments.size());
                       }
                       const auto& maybe_string_or_vector_or_map = arguments[0];
                       if (maybe_string_or_vector_or_map.is<string_value>()) {
                           const auto& str = maybe_string_or_vector_or_map.as<string_value>();
                           return object {static_cast<integer_value>(str.size())};
                       }
                       if (maybe_string_or_vector_or_map.is<vector_value>()) {
                           const auto& vec = maybe_string_or_vector_or_map.as<vector_value>();
                           return object {static_cast<integer_value>(vec.size())};
                       }
                       if (maybe_string_or_vector_or_map.is<map_value>()) {
                           const auto& map = maybe_string_or_vector_or_map.as<map_value>();
                           return object {static_cast<integer_value>(map.size())};
                       }
                       return unsupported_argument("len", maybe_string_or_vector_or_map);
                   }};

const builtin first {"first",
                     {"vec"},
                     [](std::vector<object>&& arguments) -> object
                     {
                         if (arguments.size() != 1) {
                             return wrong_number_of_arguments("first", 1, arguments.size());
                         }
                         const auto& maybe_vector = arguments[0];
                         if (!maybe_vector.is<vector_value>()) {
                             return unsupported_argument("first", maybe_vector);
                         }
                         const auto& vec = maybe_vector.as<vector_value>();
                         if (vec.empty()) {
                             return make_error(error_kind::index_out_of_bounds, "first() of an empty vector");
                         }
                         return vec.front();
                     }};

const builtin last {"last",
                    {"vec"},
                    [](std::vector<object>&& arguments) -> object
                    {
                        if (arguments.size() != 1) {
                            return wrong_number_of_arguments("last", 1, arguments.size());
                        }
                        const auto& maybe_vector = arguments[0];
                        if (!maybe_vector.is<vector_value>()) {
                            return unsupported_argument("last", maybe_vector);
                        }
                        const auto& vec = maybe_vector.as<vector_value>();
                        if (vec.empty()) {
                            return make_error(error_kind::index_out_of_bounds, "last() of an empty vector");
                        }
                        return vec.back();
                    }};

const builtin push {"push",
                    {"vec", "val"},
                    [](std::vector<object>&& arguments) -> object
                    {
                        if (arguments.size() != 2) {
                            return wrong_number_of_arguments("push", 2, arguments.size());
                        }
                        if (!arguments[0].is<vector_value>()) {
                            return unsupported_argument("push", arguments[0]);
                        }
                        auto copy = arguments[0].as<vector_value>();
                        copy.push_back(std::move(arguments[1]));
                        return object {std::move(copy)};
                    }};

const builtin map {"map",
                   {"key", "val", "..."},
                   [](std::vector<object>&& arguments) -> object
                   {
                       if (arguments.size() % 2 != 0) {
                           return make_error(error_kind::arity_mismatch,
                                             "map() expects key value pairs, got {} arguments",
                                             arguments.size());
                       }
                       map_value result;
                       for (std::size_t i = 0; i < arguments.size(); i += 2) {
                           if (!arguments[i].is<string_value>()) {
                               return make_error(error_kind::type_mismatch,
                                                 "map() keys must be String, got {}",
                                                 arguments[i].type_name());
                           }
                           result.insert_or_assign(arguments[i].as<string_value>(), std::move(arguments[i + 1]));
                       }
                       return object {std::move(result)};
                   }};

const builtin insert {"insert",
                      {"map", "key", "val"},
                      [](std::vector<object>&& arguments) -> object
                      {
                          if (arguments.size() != 3) {
                              return wrong_number_of_arguments("insert", 3, arguments.size());
                          }
                          if (!arguments[0].is<map_value>()) {
                              return unsupported_argument("insert", arguments[0]);
                          }
                          if (!arguments[1].is<string_value>()) {
                              return make_error(error_kind::type_mismatch,
                                                "insert() keys must be String, got {}",
                                                arguments[1].type_name());
                          }
                          auto copy = arguments[0].as<map_value>();
                          copy.insert_or_assign(arguments[1].as<string_value>(), std::move(arguments[2]));
                          return object {std::move(copy)};
                      }};

const builtin keys {"keys",
                    {"map"},
                    [](std::vector<object>&& arguments) -> object
                    {
                        if (arguments.size() != 1) {
                            return wrong_number_of_arguments("keys", 1, arguments.size());
                        }
                        if (!arguments[0].is<map_value>()) {
                            return unsupported_argument("keys", arguments[0]);
                        }
                        vector_value result;
                        for (const auto& [key, _] : arguments[0].as<map_value>()) {
                            result.push_back(object {key});
                        }
                        return object {std::move(result)};
                    }};
}  // namespace

auto builtin::builtins() -> const std::vector<const builtin*>&
{
    static const std::vector<const builtin*> bltns {
        &println, &print, &to_string, &to_int, &to_float, &to_bool, &len, &first, &last, &push, &map, &insert, &keys};
    return bltns;
}

auto builtin::find(std::string_view name) -> const builtin*
{
    const auto& bltns = builtins();
    const auto itr =
        std::find_if(bltns.cbegin(), bltns.cend(), [name](const builtin* bltn) { return bltn->name == name; });
    return itr != bltns.cend() ? *itr : nullptr;
}

auto builtin::is_builtin(std::string_view name) -> bool
{
    return find(name) != nullptr;
}

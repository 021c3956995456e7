#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    // special tokens
    illegal,
    eof,

    // single character tokens
    asterisk,
    at,
    assign,
    colon,
    comma,
    dot,
    exclamation,
    greater_than,
    lbracket,
    less_than,
    lparen,
    lsquirly,
    minus,
    percent,
    plus,
    rbracket,
    rparen,
    rsquirly,
    semicolon,
    slash,
    tilde,

    // two character tokens
    arrow,
    double_colon,
    equals,
    greater_equal,
    less_equal,
    logical_and,
    logical_or,
    minus_assign,
    minus_minus,
    not_equals,
    plus_assign,
    plus_plus,

    // multi character tokens
    ident,
    integer,
    decimal,
    string,

    // attributes
    weak_attr,
    sync_attr,
    own_attr,
    actor_attr,

    // keywords
    let,
    function,
    tru,
    fals,
    eef,
    elze,
    hwile,
    ret,
    four,
    in,
    mod,
    pub,
    use,
    strukt,
    impl,
    async,
    await,
    channel,
    send,
    recv,

    // type keywords
    type_i8,
    type_i16,
    type_i32,
    type_i64,
    type_u8,
    type_u16,
    type_u32,
    type_u64,
    type_f32,
    type_f64,
    type_bool,
    type_string,
    type_dyn,
    type_vec,
    type_hash_map,
};

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <string_view>
#include <utility>

#include "lexer.hpp"

#include "token.hpp"
#include "token_type.hpp"

using char_literal_lookup_table = std::array<token_type, std::numeric_limits<unsigned char>::max() + 1>;

namespace
{
constexpr auto build_char_to_token_type_map() -> char_literal_lookup_table
{
    auto arr = char_literal_lookup_table {};
    using enum token_type;
    arr.fill(illegal);
    arr['*'] = asterisk;
    arr['@'] = at;
    arr['='] = assign;
    arr[':'] = colon;
    arr[','] = comma;
    arr['.'] = dot;
    arr['!'] = exclamation;
    arr['>'] = greater_than;
    arr['['] = lbracket;
    arr['<'] = less_than;
    arr['('] = lparen;
    arr['{'] = lsquirly;
    arr['-'] = minus;
    arr['%'] = percent;
    arr['+'] = plus;
    arr[']'] = rbracket;
    arr[')'] = rparen;
    arr['}'] = rsquirly;
    arr[';'] = semicolon;
    arr['/'] = slash;
    arr['~'] = tilde;
    return arr;
}

constexpr auto char_literal_tokens = build_char_to_token_type_map();

using token_pair = std::pair<std::string_view, token_type>;

constexpr std::array two_char_tokens {
    token_pair {"->", token_type::arrow},
    token_pair {"::", token_type::double_colon},
    token_pair {"==", token_type::equals},
    token_pair {">=", token_type::greater_equal},
    token_pair {"<=", token_type::less_equal},
    token_pair {"&&", token_type::logical_and},
    token_pair {"||", token_type::logical_or},
    token_pair {"-=", token_type::minus_assign},
    token_pair {"--", token_type::minus_minus},
    token_pair {"!=", token_type::not_equals},
    token_pair {"+=", token_type::plus_assign},
    token_pair {"++", token_type::plus_plus},
};

constexpr std::array keyword_tokens {
    token_pair {"let", token_type::let},
    token_pair {"func", token_type::function},
    token_pair {"true", token_type::tru},
    token_pair {"false", token_type::fals},
    token_pair {"if", token_type::eef},
    token_pair {"else", token_type::elze},
    token_pair {"while", token_type::hwile},
    token_pair {"return", token_type::ret},
    token_pair {"for", token_type::four},
    token_pair {"in", token_type::in},
    token_pair {"mod", token_type::mod},
    token_pair {"pub", token_type::pub},
    token_pair {"use", token_type::use},
    token_pair {"struct", token_type::strukt},
    token_pair {"impl", token_type::impl},
    token_pair {"async", token_type::async},
    token_pair {"await", token_type::await},
    token_pair {"channel", token_type::channel},
    token_pair {"send", token_type::send},
    token_pair {"recv", token_type::recv},
    token_pair {"i8", token_type::type_i8},
    token_pair {"i16", token_type::type_i16},
    token_pair {"i32", token_type::type_i32},
    token_pair {"i64", token_type::type_i64},
    token_pair {"u8", token_type::type_u8},
    token_pair {"u16", token_type::type_u16},
    token_pair {"u32", token_type::type_u32},
    token_pair {"u64", token_type::type_u64},
    token_pair {"f32", token_type::type_f32},
    token_pair {"f64", token_type::type_f64},
    token_pair {"bool", token_type::type_bool},
    token_pair {"string", token_type::type_string},
    token_pair {"dyn", token_type::type_dyn},
    token_pair {"Vec", token_type::type_vec},
    token_pair {"HashMap", token_type::type_hash_map},
};

constexpr std::array attribute_tokens {
    token_pair {"#weak", token_type::weak_attr},
    token_pair {"#sync", token_type::sync_attr},
    token_pair {"#own", token_type::own_attr},
    token_pair {"#actor", token_type::actor_attr},
};

template<typename Table>
auto lookup(const Table& table, std::string_view text) -> token_type
{
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr =
        std::find_if(table.cbegin(), table.cend(), [&text](const auto& pair) -> bool { return pair.first == text; });
    // NOLINTEND(*-qualified-auto)
    return itr != table.cend() ? itr->second : token_type::illegal;
}

inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0 || chr == '_';
}

inline auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

inline auto is_whitespace(char chr) -> bool
{
    return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\r';
}

}  // namespace

lexer::lexer(std::string_view input, std::string_view filename)
    : m_input {input}
    , m_filename {filename}
{
    read_char();
}

auto lexer::next_token() -> token
{
    using enum token_type;
    skip_whitespace_and_comments();
    const auto loc = current_loc();
    if (m_byte == '\0') {
        return token {.type = eof, .literal = "", .loc = loc};
    }
    if (m_read_position < m_input.size()) {
        const auto two_chars = m_input.substr(m_position, 2);
        if (const auto type = lookup(two_char_tokens, two_chars); type != illegal) {
            return read_char(), read_char(), token {.type = type, .literal = two_chars, .loc = loc};
        }
    }
    if (const auto char_token_type = char_literal_tokens[static_cast<unsigned char>(m_byte)];
        char_token_type != illegal)
    {
        const auto literal = m_input.substr(m_position, 1);
        return read_char(), token {.type = char_token_type, .literal = literal, .loc = loc};
    }
    if (m_byte == '"') {
        return read_string();
    }
    if (m_byte == '#') {
        return read_attribute();
    }
    if (is_letter(m_byte)) {
        return read_identifier_or_keyword();
    }
    if (is_digit(m_byte)) {
        return read_number();
    }
    const auto literal = m_input.substr(m_position, 1);
    return read_char(), token {.type = illegal, .literal = literal, .loc = loc};
}

auto lexer::read_char() -> void
{
    if (m_byte == '\n') {
        m_line++;
        m_column = 0;
    }
    if (m_read_position >= m_input.size()) {
        m_byte = '\0';
    } else {
        m_byte = m_input[m_read_position];
    }
    m_position = m_read_position;
    m_read_position++;
    m_column++;
}

auto lexer::skip_whitespace_and_comments() -> void
{
    while (true) {
        while (is_whitespace(m_byte)) {
            read_char();
        }
        if (m_byte != '/' || peek_char() != '/') {
            return;
        }
        while (m_byte != '\n' && m_byte != '\0') {
            read_char();
        }
    }
}

auto lexer::peek_char() const -> std::string_view::value_type
{
    if (m_read_position >= m_input.size()) {
        return '\0';
    }
    return m_input[m_read_position];
}

auto lexer::read_identifier_or_keyword() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    while (is_letter(m_byte) || is_digit(m_byte)) {
        read_char();
    }
    const auto identifier_or_keyword = m_input.substr(position, m_position - position);
    if (const auto type = lookup(keyword_tokens, identifier_or_keyword); type != token_type::illegal) {
        return token {.type = type, .literal = identifier_or_keyword, .loc = loc};
    }
    return token {.type = token_type::ident, .literal = identifier_or_keyword, .loc = loc};
}

auto lexer::read_number() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    auto type = token_type::integer;
    while (is_digit(m_byte)) {
        read_char();
    }
    if (m_byte == '.' && is_digit(peek_char())) {
        type = token_type::decimal;
        read_char();
        while (is_digit(m_byte)) {
            read_char();
        }
    }
    return token {.type = type, .literal = m_input.substr(position, m_position - position), .loc = loc};
}

auto lexer::read_string() -> token
{
    const auto loc = current_loc();
    const auto position = m_position + 1;
    while (true) {
        read_char();
        if (m_byte == '\\' && peek_char() != '\0') {
            read_char();
            continue;
        }
        if (m_byte == '"' || m_byte == '\0') {
            break;
        }
    }
    if (m_byte == '\0') {
        return token {.type = token_type::illegal, .literal = m_input.substr(position - 1), .loc = loc};
    }
    const auto literal = m_input.substr(position, m_position - position);
    return read_char(), token {.type = token_type::string, .literal = literal, .loc = loc};
}

auto lexer::read_attribute() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    read_char();
    while (std::isalpha(static_cast<unsigned char>(m_byte)) != 0) {
        read_char();
    }
    const auto attribute = m_input.substr(position, m_position - position);
    return token {.type = lookup(attribute_tokens, attribute), .literal = attribute, .loc = loc};
}

auto lexer::current_loc() const -> location
{
    return location {.filename = m_filename, .line = m_line, .column = m_column};
}

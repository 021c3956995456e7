#include <ostream>
#include <stdexcept>

#include "token_type.hpp"

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    using enum token_type;
    switch (type) {
        case illegal:
            return ostream << "illegal";
        case eof:
            return ostream << "eof";
        case asterisk:
            return ostream << "*";
        case at:
            return ostream << "@";
        case assign:
            return ostream << "=";
        case colon:
            return ostream << ":";
        case comma:
            return ostream << ",";
        case dot:
            return ostream << ".";
        case exclamation:
            return ostream << "!";
        case greater_than:
            return ostream << ">";
        case lbracket:
            return ostream << "[";
        case less_than:
            return ostream << "<";
        case lparen:
            return ostream << "(";
        case lsquirly:
            return ostream << "{";
        case minus:
            return ostream << "-";
        case percent:
            return ostream << "%";
        case plus:
            return ostream << "+";
        case rbracket:
            return ostream << "]";
        case rparen:
            return ostream << ")";
        case rsquirly:
            return ostream << "}";
        case semicolon:
            return ostream << ";";
        case slash:
            return ostream << "/";
        case tilde:
            return ostream << "~";
        case arrow:
            return ostream << "->";
        case double_colon:
            return ostream << "::";
        case equals:
            return ostream << "==";
        case greater_equal:
            return ostream << ">=";
        case less_equal:
            return ostream << "<=";
        case logical_and:
            return ostream << "&&";
        case logical_or:
            return ostream << "||";
        case minus_assign:
            return ostream << "-=";
        case minus_minus:
            return ostream << "--";
        case not_equals:
            return ostream << "!=";
        case plus_assign:
            return ostream << "+=";
        case plus_plus:
            return ostream << "++";
        case ident:
            return ostream << "identifier";
        case integer:
            return ostream << "integer";
        case decimal:
            return ostream << "float";
        case string:
            return ostream << "string";
        case weak_attr:
            return ostream << "#weak";
        case sync_attr:
            return ostream << "#sync";
        case own_attr:
            return ostream << "#own";
        case actor_attr:
            return ostream << "#actor";
        case let:
            return ostream << "let";
        case function:
            return ostream << "func";
        case tru:
            return ostream << "true";
        case fals:
            return ostream << "false";
        case eef:
            return ostream << "if";
        case elze:
            return ostream << "else";
        case hwile:
            return ostream << "while";
        case ret:
            return ostream << "return";
        case four:
            return ostream << "for";
        case in:
            return ostream << "in";
        case mod:
            return ostream << "mod";
        case pub:
            return ostream << "pub";
        case use:
            return ostream << "use";
        case strukt:
            return ostream << "struct";
        case impl:
            return ostream << "impl";
        case async:
            return ostream << "async";
        case await:
            return ostream << "await";
        case channel:
            return ostream << "channel";
        case send:
            return ostream << "send";
        case recv:
            return ostream << "recv";
        case type_i8:
            return ostream << "i8";
        case type_i16:
            return ostream << "i16";
        case type_i32:
            return ostream << "i32";
        case type_i64:
            return ostream << "i64";
        case type_u8:
            return ostream << "u8";
        case type_u16:
            return ostream << "u16";
        case type_u32:
            return ostream << "u32";
        case type_u64:
            return ostream << "u64";
        case type_f32:
            return ostream << "f32";
        case type_f64:
            return ostream << "f64";
        case type_bool:
            return ostream << "bool";
        case type_string:
            return ostream << "string";
        case type_dyn:
            return ostream << "dyn";
        case type_vec:
            return ostream << "Vec";
        case type_hash_map:
            return ostream << "HashMap";
    }
    throw std::invalid_argument("invalid token_type");
}

#include <ostream>
#include <stdexcept>

#include "operators.hpp"

auto operator<<(std::ostream& ostream, binary_operator oper) -> std::ostream&
{
    using enum binary_operator;
    switch (oper) {
        case assign:
            return ostream << "=";
        case add:
            return ostream << "+";
        case self_add:
            return ostream << "+=";
        case inc:
            return ostream << "++";
        case sub:
            return ostream << "-";
        case self_sub:
            return ostream << "-=";
        case dec:
            return ostream << "--";
        case mul:
            return ostream << "*";
        case div:
            return ostream << "/";
        case mod:
            return ostream << "%";
        case equals:
            return ostream << "==";
        case not_equals:
            return ostream << "!=";
        case less_than:
            return ostream << "<";
        case greater_than:
            return ostream << ">";
        case less_equal:
            return ostream << "<=";
        case greater_equal:
            return ostream << ">=";
        case logical_and:
            return ostream << "&&";
        case logical_or:
            return ostream << "||";
    }
    throw std::invalid_argument("invalid binary_operator");
}

auto operator<<(std::ostream& ostream, unary_operator oper) -> std::ostream&
{
    using enum unary_operator;
    switch (oper) {
        case negate:
            return ostream << "-";
        case bang:
            return ostream << "!";
        case inc:
            return ostream << "++";
        case dec:
            return ostream << "--";
    }
    throw std::invalid_argument("invalid unary_operator");
}

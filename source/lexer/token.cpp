#include <ostream>

#include "token.hpp"

auto operator<<(std::ostream& ostream, const location& loc) -> std::ostream&
{
    return ostream << loc.filename << ':' << loc.line << ':' << loc.column;
}

auto operator<<(std::ostream& ostream, const token& tok) -> std::ostream&
{
    return ostream << "token{" << tok.type << ", `" << tok.literal << "` " << tok.loc << "}";
}

#include <string>

#include "concurrency.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto channel_expression::string() const -> std::string
{
    return "channel()";
}

void channel_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto send_expression::string() const -> std::string
{
    return fmt::format("send({}, {})", channel->string(), value->string());
}

void send_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto receive_expression::string() const -> std::string
{
    return fmt::format("recv({})", channel->string());
}

void receive_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto await_expression::string() const -> std::string
{
    return fmt::format("(await {})", awaited->string());
}

void await_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

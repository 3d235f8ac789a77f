// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <ostream>
#include <utility>
#include <variant>

#include <boost/asio/post.hpp>
#include <monitor/TunnelCommand.hpp>
#include <overloaded/Overloaded.hpp>

namespace linkwatch::monitor
{

auto operator<<(std::ostream& o, const TunnelCommand& c) -> std::ostream&
{
    return std::visit(Overloaded {
                          [&o](const IsOffline& cmd) -> std::ostream& {
                              return o << "IsOffline(" << std::boolalpha << cmd.offline << ")";
                          },
                      },
                      c);
}

PostingCommandSender::PostingCommandSender(boost::asio::any_io_executor executor, Handler handler)
    : m_executor {std::move(executor)}
    , m_handler {std::move(handler)}
{
}

void PostingCommandSender::send(const TunnelCommand& command)
{
    boost::asio::post(m_executor, [handler = m_handler, command] { handler(command); });
}

}  // namespace linkwatch::monitor

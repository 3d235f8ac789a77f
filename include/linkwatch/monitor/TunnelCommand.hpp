// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <functional>
#include <iosfwd>
#include <variant>

#include <boost/asio/any_io_executor.hpp>
#include <fmt/ostream.h>

namespace linkwatch::monitor
{

/** Tells the tunnel whether the host currently lacks a route to the internet. */
struct IsOffline
{
    bool offline {false};

    [[nodiscard]] auto operator==(const IsOffline& other) const -> bool = default;
};

using TunnelCommand = std::variant<IsOffline>;
auto operator<<(std::ostream& o, const TunnelCommand& c) -> std::ostream&;

class TunnelCommandSender
{
  public:
    TunnelCommandSender() = default;
    virtual ~TunnelCommandSender() = default;
    TunnelCommandSender(const TunnelCommandSender&) = delete;
    TunnelCommandSender(TunnelCommandSender&&) = delete;
    auto operator=(const TunnelCommandSender&) -> TunnelCommandSender& = delete;
    auto operator=(TunnelCommandSender&&) -> TunnelCommandSender& = delete;

    virtual void send(const TunnelCommand& command) = 0;
};

/** Hands every command to @p handler on @p executor, never blocking the sending side. */
class PostingCommandSender final : public TunnelCommandSender
{
  public:
    using Handler = std::function<void(const TunnelCommand&)>;

    PostingCommandSender(boost::asio::any_io_executor executor, Handler handler);

    void send(const TunnelCommand& command) override;

  private:
    boost::asio::any_io_executor m_executor;
    Handler m_handler;
};

}  // namespace linkwatch::monitor

template<>
struct fmt::formatter<linkwatch::monitor::TunnelCommand> : ostream_formatter
{
};

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstdint>
#include <optional>

#include <boost/asio/any_io_executor.hpp>
#include <monitor/RouteManager.hpp>

namespace linkwatch::monitor
{

/** RouteManager asking the kernel's routing tables over rtnetlink. */
class NetlinkRouteManager final : public RouteManager
{
  public:
    /** @param fwmark firewall mark carried by traffic that bypasses the tunnel, if any */
    NetlinkRouteManager(boost::asio::any_io_executor executor, std::optional<uint32_t> fwmark);

    auto getDestinationRoute(const ip::Address& destination, bool bypassTunnel)
        -> boost::asio::awaitable<std::optional<Route>> override;
    auto changeListener() -> boost::asio::awaitable<std::unique_ptr<RouteChangeListener>> override;

  private:
    boost::asio::any_io_executor m_executor;
    std::optional<uint32_t> m_fwmark;
};

}  // namespace linkwatch::monitor

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <atomic>
#include <memory>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <ip/Address.hpp>
#include <monitor/RouteManager.hpp>
#include <monitor/TunnelCommand.hpp>

namespace linkwatch::monitor
{

/** Destination whose reachability stands in for "the internet". */
[[nodiscard]] auto publicInternetAddress() -> const ip::Address&;

/**
 * @return true if no route outside of the tunnel leads to publicInternetAddress()
 * @throws RouteManagerError
 */
auto publicIpUnreachable(RouteManager& routeManager) -> boost::asio::awaitable<bool>;

/**
 * @brief Tracks whether the host is offline and tells the tunnel about every transition.
 *
 * A background coroutine re-evaluates connectivity on each route change and sends IsOffline only when the state
 * differs from the last one sent. It ends once the command sender has no owner left or the route changes stop. A
 * failed check counts as online, so a broken routing query never holds the tunnel back.
 */
class ConnectivityMonitor
{
  public:
    /**
     * Evaluates the initial state, subscribes to route changes and starts the background coroutine on the caller's
     * executor. No command is sent for the initial state.
     *
     * @throws RouteManagerError if the initial check or the subscription fails
     */
    static auto spawn(std::weak_ptr<TunnelCommandSender> sender, std::shared_ptr<RouteManager> routeManager)
        -> boost::asio::awaitable<std::unique_ptr<ConnectivityMonitor>>;

    /** Checks connectivity now, without touching the tracked state. Never throws a routing error. */
    auto isOffline() -> boost::asio::awaitable<bool>;

    /** the state as last computed by the background coroutine */
    [[nodiscard]] auto lastKnownOffline() const -> bool;

  private:
    struct State
    {
        std::atomic<bool> offline {false};
    };

    ConnectivityMonitor(std::shared_ptr<RouteManager> routeManager, std::shared_ptr<State> state);

    static auto run(std::weak_ptr<TunnelCommandSender> sender,
                    std::shared_ptr<RouteManager> routeManager,
                    std::unique_ptr<RouteChangeListener> listener,
                    std::shared_ptr<State> state) -> boost::asio::awaitable<void>;

    std::shared_ptr<RouteManager> m_routeManager;
    std::shared_ptr<State> m_state;
};

}  // namespace linkwatch::monitor

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <exception>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <monitor/ConnectivityMonitor.hpp>
#include <spdlog/spdlog.h>

namespace linkwatch::monitor
{
namespace
{

// routing failures are reported as online
auto unreachableOrOnline(RouteManager& routeManager) -> boost::asio::awaitable<bool>
{
    try {
        co_return co_await publicIpUnreachable(routeManager);
    } catch (const RouteManagerError& e) {
        spdlog::error("failed to check connectivity, assuming online: {}", e.what());
    }
    co_return false;
}

}  // namespace

auto publicInternetAddress() -> const ip::Address&
{
    static const auto address = ip::Address::fromString("193.138.218.78");
    return address;
}

auto publicIpUnreachable(RouteManager& routeManager) -> boost::asio::awaitable<bool>
{
    const auto route = co_await routeManager.getDestinationRoute(publicInternetAddress(), true);
    if (route) {
        spdlog::trace("route to {}: {}", publicInternetAddress(), *route);
    }
    co_return !route.has_value();
}

auto ConnectivityMonitor::spawn(std::weak_ptr<TunnelCommandSender> sender, std::shared_ptr<RouteManager> routeManager)
    -> boost::asio::awaitable<std::unique_ptr<ConnectivityMonitor>>
{
    auto state = std::make_shared<State>();
    state->offline = co_await publicIpUnreachable(*routeManager);
    spdlog::info("initially {}", state->offline ? "offline" : "online");

    auto listener = co_await routeManager->changeListener();
    boost::asio::co_spawn(co_await boost::asio::this_coro::executor,
                          run(std::move(sender), routeManager, std::move(listener), state),
                          [](const std::exception_ptr& error) {
                              if (!error) {
                                  return;
                              }
                              try {
                                  std::rethrow_exception(error);
                              } catch (const std::exception& e) {
                                  spdlog::error("connectivity monitor stopped: {}", e.what());
                              }
                          });
    co_return std::unique_ptr<ConnectivityMonitor> {new ConnectivityMonitor {std::move(routeManager), std::move(state)}};
}

ConnectivityMonitor::ConnectivityMonitor(std::shared_ptr<RouteManager> routeManager, std::shared_ptr<State> state)
    : m_routeManager {std::move(routeManager)}
    , m_state {std::move(state)}
{
}

auto ConnectivityMonitor::isOffline() -> boost::asio::awaitable<bool>
{
    co_return co_await unreachableOrOnline(*m_routeManager);
}

auto ConnectivityMonitor::lastKnownOffline() const -> bool
{
    return m_state->offline;
}

auto ConnectivityMonitor::run(std::weak_ptr<TunnelCommandSender> sender,
                              std::shared_ptr<RouteManager> routeManager,
                              std::unique_ptr<RouteChangeListener> listener,
                              std::shared_ptr<State> state) -> boost::asio::awaitable<void>
{
    while (const auto change = co_await listener->next()) {
        if (sender.expired()) {
            spdlog::debug("tunnel command receiver is gone, stopping connectivity monitor");
            co_return;
        }
        spdlog::trace("route change: {}", *change);
        const bool offline = co_await unreachableOrOnline(*routeManager);
        if (offline == state->offline) {
            continue;
        }
        state->offline = offline;
        spdlog::info("connectivity changed, now {}", offline ? "offline" : "online");
        const auto target = sender.lock();
        if (!target) {
            spdlog::debug("tunnel command receiver is gone, stopping connectivity monitor");
            co_return;
        }
        target->send(IsOffline {.offline = offline});
    }
    spdlog::warn("route changes ended, connectivity is no longer tracked");
}

}  // namespace linkwatch::monitor

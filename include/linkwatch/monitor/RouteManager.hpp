// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <fmt/ostream.h>
#include <ip/Address.hpp>

namespace linkwatch::monitor
{

class RouteManagerError : public std::runtime_error
{
  public:
    explicit RouteManagerError(const std::string& what);
    RouteManagerError(const std::string& what, std::error_code osError);

    [[nodiscard]] auto osError() const -> std::optional<std::error_code> { return m_osError; }

  private:
    std::optional<std::error_code> m_osError;
};

/** The route the kernel would pick for a destination. */
struct Route
{
    std::optional<ip::Address> gateway;
    uint32_t interfaceIndex {};

    [[nodiscard]] auto operator==(const Route& other) const -> bool = default;
};
auto operator<<(std::ostream& o, const Route& r) -> std::ostream&;

enum class RouteChangeKind : uint8_t
{
    Added,
    Removed,
};
auto operator<<(std::ostream& o, RouteChangeKind k) -> std::ostream&;

struct RouteChange
{
    RouteChangeKind kind {RouteChangeKind::Added};
    ip::Family family {ip::Family::IPv4};
    /** unset for default routes */
    std::optional<ip::Address> destination;
    uint8_t prefixLength {};

    [[nodiscard]] auto operator==(const RouteChange& other) const -> bool = default;
};
auto operator<<(std::ostream& o, const RouteChange& c) -> std::ostream&;

class RouteChangeListener
{
  public:
    RouteChangeListener() = default;
    virtual ~RouteChangeListener() = default;
    RouteChangeListener(const RouteChangeListener&) = delete;
    RouteChangeListener(RouteChangeListener&&) = delete;
    auto operator=(const RouteChangeListener&) -> RouteChangeListener& = delete;
    auto operator=(RouteChangeListener&&) -> RouteChangeListener& = delete;

    /**
     * @return the next change, nullopt once no more changes will be reported
     * @throws RouteManagerError
     */
    virtual auto next() -> boost::asio::awaitable<std::optional<RouteChange>> = 0;
};

/** Routing table access as needed for connectivity checks. */
class RouteManager
{
  public:
    RouteManager() = default;
    virtual ~RouteManager() = default;
    RouteManager(const RouteManager&) = delete;
    RouteManager(RouteManager&&) = delete;
    auto operator=(const RouteManager&) -> RouteManager& = delete;
    auto operator=(RouteManager&&) -> RouteManager& = delete;

    /**
     * @param bypassTunnel look the route up as traffic exempt from the tunnel would
     * @return nullopt if there is no route
     * @throws RouteManagerError
     */
    virtual auto getDestinationRoute(const ip::Address& destination, bool bypassTunnel)
        -> boost::asio::awaitable<std::optional<Route>> = 0;

    /** @throws RouteManagerError */
    virtual auto changeListener() -> boost::asio::awaitable<std::unique_ptr<RouteChangeListener>> = 0;
};

}  // namespace linkwatch::monitor

template<>
struct fmt::formatter<linkwatch::monitor::Route> : ostream_formatter
{
};

template<>
struct fmt::formatter<linkwatch::monitor::RouteChangeKind> : ostream_formatter
{
};

template<>
struct fmt::formatter<linkwatch::monitor::RouteChange> : ostream_formatter
{
};

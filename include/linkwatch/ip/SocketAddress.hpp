// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <compare>
#include <cstdint>
#include <iosfwd>
#include <string>

#include <fmt/ostream.h>
#include <ip/Address.hpp>

namespace linkwatch::ip
{

/**
 * @brief An IP address plus transport port, independent of any OS structure.
 *
 * IPv6 socket addresses additionally carry a flow label and a scope id. Both are always zero for IPv4.
 */
class SocketAddress
{
  public:
    SocketAddress() = default;
    SocketAddress(const Address& address, uint16_t port);
    SocketAddress(const Address& address, uint16_t port, uint32_t flowInfo, uint32_t scopeId);

    [[nodiscard]] auto ip() const -> const Address& { return m_ip; }

    [[nodiscard]] auto port() const -> uint16_t { return m_port; }

    [[nodiscard]] auto flowInfo() const -> uint32_t { return m_flowInfo; }

    [[nodiscard]] auto scopeId() const -> uint32_t { return m_scopeId; }

    [[nodiscard]] auto family() const -> Family { return m_ip.family(); }

    [[nodiscard]] auto isV4() const -> bool { return m_ip.isV4(); }

    [[nodiscard]] auto isV6() const -> bool { return m_ip.isV6(); }

    [[nodiscard]] auto toString() const -> std::string;

    [[nodiscard]] auto operator<=>(const SocketAddress& other) const -> std::strong_ordering = default;
    [[nodiscard]] auto operator==(const SocketAddress& other) const -> bool = default;

  private:
    Address m_ip;
    uint16_t m_port {};
    uint32_t m_flowInfo {};
    uint32_t m_scopeId {};
};

auto operator<<(std::ostream& o, const SocketAddress& a) -> std::ostream&;

}  // namespace linkwatch::ip

template<>
struct fmt::formatter<linkwatch::ip::SocketAddress> : fmt::ostream_formatter
{
};

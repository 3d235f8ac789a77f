// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <ostream>

#include <ip/SocketAddress.hpp>

namespace linkwatch::ip
{

SocketAddress::SocketAddress(const Address& address, const uint16_t port)
    : m_ip {address}
    , m_port {port}
{
}

SocketAddress::SocketAddress(const Address& address,
                             const uint16_t port,
                             const uint32_t flowInfo,
                             const uint32_t scopeId)
    : m_ip {address}
    , m_port {port}
    , m_flowInfo {address.isV6() ? flowInfo : 0U}
    , m_scopeId {address.isV6() ? scopeId : 0U}
{
}

auto SocketAddress::toString() const -> std::string
{
    if (isV4()) {
        return m_ip.toString() + ":" + std::to_string(m_port);
    }
    auto result = "[" + m_ip.toString();
    if (m_scopeId != 0) {
        result += "%" + std::to_string(m_scopeId);
    }
    return result + "]:" + std::to_string(m_port);
}

auto operator<<(std::ostream& o, const SocketAddress& a) -> std::ostream&
{
    return o << a.toString();
}

}  // namespace linkwatch::ip

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <array>
#include <ostream>
#include <stdexcept>
#include <variant>

#include <arpa/inet.h>
#include <ip/Address.hpp>
#include <overloaded/Overloaded.hpp>

namespace linkwatch::ip
{
auto asLinuxAf(const Family f) -> int
{
    using enum Family;
    switch (f) {
        case IPv4:
            return AF_INET;
        case IPv6:
            return AF_INET6;
        default:
            return AF_UNSPEC;
    }
}

auto fromLinuxAf(const int af) -> std::optional<Family>
{
    switch (af) {
        case AF_INET:
            return Family::IPv4;
        case AF_INET6:
            return Family::IPv6;
        default:
            return std::nullopt;
    }
}

auto operator<<(std::ostream& o, const Family f) -> std::ostream&
{
    using enum Family;
    switch (f) {
        case IPv4:
            o << "inet";
            break;
        case IPv6:
            o << "inet6";
            break;
        default:
            o << "unspec";
            break;
    }
    return o;
}

Address::Address() = default;

Address::Address(const V4Bytes& bytes)
    : m_bytes(bytes)
{
}

Address::Address(const V6Bytes& bytes)
    : m_bytes(bytes)
{
}

auto Address::isV4() const -> bool
{
    return std::holds_alternative<V4Bytes>(m_bytes);
}

auto Address::isV6() const -> bool
{
    return std::holds_alternative<V6Bytes>(m_bytes);
}

auto Address::family() const -> Family
{
    return std::visit(
        Overloaded {[](const V4Bytes&) { return Family::IPv4; }, [](const V6Bytes&) { return Family::IPv6; }}, m_bytes);
}

auto Address::bytes() const -> const Bytes&
{
    return m_bytes;
}

auto Address::toString() const -> std::string
{
    return std::visit(Overloaded {[](const V4Bytes& addr) -> std::string
                                  {
                                      std::array<char, INET_ADDRSTRLEN> buffer {};
                                      inet_ntop(AF_INET, addr.data(), buffer.data(), buffer.size());
                                      return std::string(buffer.data());
                                  },
                                  [](const V6Bytes& addr) -> std::string
                                  {
                                      std::array<char, INET6_ADDRSTRLEN> buffer {};
                                      inet_ntop(AF_INET6, addr.data(), buffer.data(), buffer.size());
                                      return std::string(buffer.data());
                                  }},
                      m_bytes);
}

auto Address::fromString(const std::string& address) noexcept(false) -> Address
{
    {
        V4Bytes addr {};
        if (inet_pton(AF_INET, address.data(), addr.data()) == 1) {
            return Address(addr);
        }
    }
    {
        V6Bytes addr {};
        if (inet_pton(AF_INET6, address.data(), addr.data()) == 1) {
            return Address(addr);
        }
    }
    throw std::invalid_argument("Failed to parse address '" + address
                                + "': Invalid format or unsupported address family");
}

auto Address::operator<=>(const Address& rhs) const noexcept -> std::strong_ordering
{
    return m_bytes <=> rhs.m_bytes;
}

auto operator<<(std::ostream& o, const Address& a) -> std::ostream&
{
    return o << a.toString();
}

}  // namespace linkwatch::ip

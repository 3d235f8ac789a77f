// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstdint>
#include <iosfwd>

#include <fmt/ostream.h>
#include <ip/Address.hpp>

namespace linkwatch::network
{
using Family = ip::Family;

/** An address assigned to an interface, with the length of its on-link prefix. */
class Address
{
  public:
    Address() = default;
    Address(const ip::Address& address, uint8_t prefixLength);

    [[nodiscard]] auto ip() const -> const ip::Address& { return m_ip; }
    [[nodiscard]] auto family() const -> Family { return m_ip.family(); }
    [[nodiscard]] auto prefixLength() const -> uint8_t { return m_prefixLength; }

    [[nodiscard]] auto operator==(const Address& other) const -> bool = default;

  private:
    ip::Address m_ip;
    uint8_t m_prefixLength {};
};

auto operator<<(std::ostream& o, const Address& a) -> std::ostream&;

}  // namespace linkwatch::network

template<>
struct fmt::formatter<linkwatch::network::Address> : ostream_formatter
{
};

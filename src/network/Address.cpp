// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <ostream>
#include <stdexcept>

#include <network/Address.hpp>

namespace linkwatch::network
{

Address::Address(const ip::Address& address, const uint8_t prefixLength)
    : m_ip {address}
    , m_prefixLength {prefixLength}
{
    const auto maxLength = address.family() == Family::IPv4 ? 32U : 128U;
    if (prefixLength > maxLength) {
        throw std::invalid_argument {fmt::format("prefix length {} is too long for {}", prefixLength, address)};
    }
}

auto operator<<(std::ostream& o, const Address& a) -> std::ostream&
{
    return o << a.ip() << "/" << static_cast<int>(a.prefixLength());
}

}  // namespace linkwatch::network

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstdint>
#include <iosfwd>
#include <vector>

#include <fmt/ostream.h>
#include <network/Address.hpp>
#include <network/DadState.hpp>

namespace linkwatch::network
{

struct UnicastAddressEntry
{
    uint32_t interfaceIndex {};
    Address address;
    DadState dadState;

    [[nodiscard]] auto family() const -> Family { return address.family(); }

    /** same address on the same interface, regardless of its current state */
    [[nodiscard]] auto sameAddressAs(const UnicastAddressEntry& other) const -> bool
    {
        return interfaceIndex == other.interfaceIndex && address.ip() == other.address.ip();
    }

    [[nodiscard]] auto operator==(const UnicastAddressEntry& other) const -> bool = default;
};

using UnicastAddressTable = std::vector<UnicastAddressEntry>;

auto operator<<(std::ostream& o, const UnicastAddressEntry& e) -> std::ostream&;

}  // namespace linkwatch::network

template<>
struct fmt::formatter<linkwatch::network::UnicastAddressEntry> : ostream_formatter
{
};

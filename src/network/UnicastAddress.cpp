// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <ostream>

#include <network/UnicastAddress.hpp>

namespace linkwatch::network
{

auto operator<<(std::ostream& o, const UnicastAddressEntry& e) -> std::ostream&
{
    return o << e.interfaceIndex << ": " << e.address << " dad " << e.dadState;
}

}  // namespace linkwatch::network

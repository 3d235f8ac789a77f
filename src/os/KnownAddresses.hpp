// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <utility>
#include <vector>

#include <ip/Address.hpp>
#include <network/UnicastAddress.hpp>
#include <os/IpHelper.hpp>

namespace linkwatch::os
{

/**
 * @brief The addresses a change registration has seen, per interface.
 *
 * The first announcement of an address is Added, later ones ParameterChanged.
 */
class KnownAddresses
{
  public:
    void seed(const network::UnicastAddressTable& table);

    [[nodiscard]] auto announced(const network::UnicastAddressEntry& entry) -> ChangeKind;
    void withdrawn(const network::UnicastAddressEntry& entry);

    /**
     * @brief Replaces the known addresses with @p table after notifications were lost.
     *
     * @return an Added change per address that appeared and a Removed change per address that vanished meanwhile
     */
    [[nodiscard]] auto resync(const network::UnicastAddressTable& table) -> std::vector<InterfaceChange>;

    [[nodiscard]] auto size() const -> std::size_t { return m_known.size(); }

  private:
    using Key = std::pair<uint32_t, ip::Address>;

    static auto keyOf(const network::UnicastAddressEntry& entry) -> Key;

    std::set<Key> m_known;
};

}  // namespace linkwatch::os

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <algorithm>
#include <iterator>
#include <utility>

#include <os/KnownAddresses.hpp>

namespace linkwatch::os
{

auto KnownAddresses::keyOf(const network::UnicastAddressEntry& entry) -> Key
{
    return {entry.interfaceIndex, entry.address.ip()};
}

void KnownAddresses::seed(const network::UnicastAddressTable& table)
{
    m_known.clear();
    for (const auto& entry : table) {
        m_known.insert(keyOf(entry));
    }
}

auto KnownAddresses::announced(const network::UnicastAddressEntry& entry) -> ChangeKind
{
    return m_known.insert(keyOf(entry)).second ? ChangeKind::Added : ChangeKind::ParameterChanged;
}

void KnownAddresses::withdrawn(const network::UnicastAddressEntry& entry)
{
    m_known.erase(keyOf(entry));
}

auto KnownAddresses::resync(const network::UnicastAddressTable& table) -> std::vector<InterfaceChange>
{
    std::set<Key> current;
    for (const auto& entry : table) {
        current.insert(keyOf(entry));
    }

    std::vector<Key> appeared;
    std::ranges::set_difference(current, m_known, std::back_inserter(appeared));
    std::vector<Key> vanished;
    std::ranges::set_difference(m_known, current, std::back_inserter(vanished));

    std::vector<InterfaceChange> missed;
    for (const auto& [index, address] : appeared) {
        missed.push_back({.interfaceIndex = index, .family = address.family(), .kind = ChangeKind::Added});
    }
    for (const auto& [index, address] : vanished) {
        missed.push_back({.interfaceIndex = index, .family = address.family(), .kind = ChangeKind::Removed});
    }
    m_known = std::move(current);
    return missed;
}

}  // namespace linkwatch::os

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <os/IpHelper.hpp>

namespace linkwatch::os
{

/**
 * @brief IpHelper backed by rtnetlink and the per interface sysctl tree.
 *
 * DAD states are derived from the kernel's address flags. Change notifications are delivered from a thread owned by
 * each registration.
 */
class NetlinkIpHelper final : public IpHelper
{
  public:
    NetlinkIpHelper() = default;

    [[nodiscard]] auto unicastTable(std::optional<ip::Family> family) -> network::UnicastAddressTable override;
    [[nodiscard]] auto unicastEntry(const network::UnicastAddressEntry& entry)
        -> network::UnicastAddressEntry override;
    [[nodiscard]] auto ipInterfaceEntry(ip::Family family, uint32_t interfaceIndex) -> IpInterfaceEntry override;
    void setIpInterfaceEntry(const IpInterfaceEntry& entry) override;
    [[nodiscard]] auto registerChangeNotification(std::optional<ip::Family> family,
                                                  ChangeCallback callback,
                                                  void* context) -> std::unique_ptr<ChangeRegistration> override;
};

}  // namespace linkwatch::os

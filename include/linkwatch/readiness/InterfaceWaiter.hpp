// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstdint>
#include <memory>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <os/IpHelper.hpp>

namespace linkwatch::readiness
{

/**
 * @brief Completes once interface @p interfaceIndex has a unicast address of every requested family.
 *
 * Subscribes to changes before looking at the current addresses, so an address showing up in between is not missed.
 * There is no timeout, callers wanting one race this against a timer.
 *
 * @throws std::system_error if subscribing or reading the address table fails
 */
auto waitForInterfaces(std::shared_ptr<os::IpHelper> helper, uint32_t interfaceIndex, bool wantV4, bool wantV6)
    -> boost::asio::awaitable<void>;

}  // namespace linkwatch::readiness

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <network/UnicastAddress.hpp>
#include <os/IpHelper.hpp>
#include <readiness/DeviceError.hpp>

namespace linkwatch::readiness
{

struct DadCheckTimings
{
    std::chrono::milliseconds timeout {std::chrono::seconds {5}};
    std::chrono::milliseconds interval {std::chrono::milliseconds {100}};
};

/**
 * @brief Polls until every candidate address has passed duplicate address detection.
 *
 * Blocks the calling thread. Tentative addresses are polled again after @p timings.interval until
 * @p timings.timeout has passed since the call. Returns early, without a verdict, once @p stop is requested.
 *
 * @throws DeviceError ObtainUnicastAddress if an address cannot be read back, DadState on the first address in a
 *         terminal state other than Preferred, DeviceReadyTimeout if addresses are still tentative at the deadline
 */
void pollDadStates(os::IpHelper& helper,
                   const network::UnicastAddressTable& candidates,
                   DadCheckTimings timings,
                   std::stop_token stop = {});

/**
 * @brief Completes once all unicast addresses of @p interfaceIndex are usable.
 *
 * The polling runs on a thread of its own, the awaiting coroutine is resumed on its executor with the result.
 * Abandoning the coroutine stops the polling and joins the thread before the coroutine's frame is gone.
 *
 * @throws DeviceError NoUnicastAddress if the interface has no unicast address at all, SenderDropped if the polling
 *         thread ended without a result, otherwise as pollDadStates
 */
auto waitForAddresses(std::shared_ptr<os::IpHelper> helper, uint32_t interfaceIndex, DadCheckTimings timings = {})
    -> boost::asio::awaitable<void>;

}  // namespace linkwatch::readiness

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include <boost/asio/this_coro.hpp>
#include <readiness/AddressReadinessChecker.hpp>
#include <spdlog/spdlog.h>
#include <util/OneShot.hpp>

namespace linkwatch::readiness
{
namespace
{

auto currentState(os::IpHelper& helper, const network::UnicastAddressEntry& candidate) -> network::DadState
{
    try {
        return helper.unicastEntry(candidate).dadState;
    } catch (const std::system_error& e) {
        spdlog::warn("failed to read back {}: {}", candidate.address, e.what());
        throw DeviceError {e.code()};
    }
}

auto candidatesOf(os::IpHelper& helper, const uint32_t interfaceIndex) -> network::UnicastAddressTable
{
    network::UnicastAddressTable table;
    try {
        table = helper.unicastTable(std::nullopt);
    } catch (const std::system_error& e) {
        throw DeviceError {e.code()};
    }
    std::erase_if(table, [interfaceIndex](const auto& entry) { return entry.interfaceIndex != interfaceIndex; });
    return table;
}

// false if stopped while sleeping
auto sleepFor(const std::chrono::milliseconds interval, const std::stop_token& stop) -> bool
{
    std::mutex mutex;
    std::condition_variable_any wakeup;
    std::unique_lock lock {mutex};
    return !wakeup.wait_for(lock, stop, interval, [] { return false; }) && !stop.stop_requested();
}

}  // namespace

void pollDadStates(os::IpHelper& helper,
                   const network::UnicastAddressTable& candidates,
                   const DadCheckTimings timings,
                   std::stop_token stop)
{
    const auto deadline = std::chrono::steady_clock::now() + timings.timeout;
    while (!stop.stop_requested()) {
        bool pending = false;
        for (const auto& candidate : candidates) {
            const auto state = currentState(helper, candidate);
            if (state.isFailure()) {
                spdlog::error("{} is in state {}", candidate.address, state);
                throw DeviceError {state};
            }
            pending = pending || state.isPending();
        }
        if (!pending) {
            spdlog::debug("all {} addresses passed DAD", candidates.size());
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw DeviceError {DeviceErrorKind::DeviceReadyTimeout};
        }
        if (!sleepFor(timings.interval, stop)) {
            break;
        }
    }
    spdlog::debug("DAD polling stopped before a verdict");
}

auto waitForAddresses(std::shared_ptr<os::IpHelper> helper,
                      const uint32_t interfaceIndex,
                      const DadCheckTimings timings) -> boost::asio::awaitable<void>
{
    auto candidates = candidatesOf(*helper, interfaceIndex);
    if (candidates.empty()) {
        throw DeviceError {DeviceErrorKind::NoUnicastAddress};
    }
    spdlog::debug("waiting for {} addresses of interface {} to pass DAD", candidates.size(), interfaceIndex);

    auto [sender, receiver] = util::makeOneShot<std::exception_ptr>(co_await boost::asio::this_coro::executor);
    const std::jthread worker {[helper, candidates = std::move(candidates), timings, sender = std::move(sender)](
                                   const std::stop_token& stop) mutable {
        try {
            pollDadStates(*helper, candidates, timings, stop);
            if (!stop.stop_requested()) {
                sender.send(nullptr);
            }
        } catch (const DeviceError&) {
            sender.send(std::current_exception());
        } catch (const std::exception& e) {
            // the sender goes away without a result
            spdlog::error("DAD polling failed unexpectedly: {}", e.what());
        }
    }};
    // declared after the worker: an abandoned wait drops the receiver first, so the joined worker never posts back
    auto pending = std::move(receiver);

    const auto result = co_await pending.receive();
    if (!result) {
        throw DeviceError {DeviceErrorKind::SenderDropped};
    }
    if (*result) {
        std::rethrow_exception(*result);
    }
}

}  // namespace linkwatch::readiness

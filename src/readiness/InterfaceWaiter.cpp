// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <mutex>
#include <optional>
#include <system_error>
#include <utility>

#include <boost/asio/this_coro.hpp>
#include <readiness/InterfaceChangeNotifier.hpp>
#include <readiness/InterfaceWaiter.hpp>
#include <spdlog/spdlog.h>
#include <util/OneShot.hpp>

namespace linkwatch::readiness
{
namespace
{

struct Progress
{
    std::mutex mutex;
    bool v4Missing;
    bool v6Missing;
    // an empty code once all families are present, the registration's error if notifications ended first
    std::optional<util::OneShotSender<std::error_code>> done;

    // returns true exactly once, when the last missing family shows up
    auto markPresent(const ip::Family family) -> bool
    {
        if (!done) {
            return false;
        }
        if (family == ip::Family::IPv4) {
            v4Missing = false;
        } else {
            v6Missing = false;
        }
        return !v4Missing && !v6Missing;
    }

    void complete(const std::error_code error = {})
    {
        if (done) {
            done->send(error);
            done.reset();
        }
    }
};

auto presentAfterSubscribing(os::IpHelper& helper, Progress& progress, const uint32_t interfaceIndex) -> bool
{
    const auto table = helper.unicastTable(std::nullopt);
    const std::lock_guard lock {progress.mutex};
    for (const auto& entry : table) {
        if (entry.interfaceIndex == interfaceIndex) {
            progress.markPresent(entry.family());
        }
    }
    return !progress.v4Missing && !progress.v6Missing;
}

}  // namespace

auto waitForInterfaces(std::shared_ptr<os::IpHelper> helper,
                       const uint32_t interfaceIndex,
                       const bool wantV4,
                       const bool wantV6) -> boost::asio::awaitable<void>
{
    auto executor = co_await boost::asio::this_coro::executor;
    auto [sender, receiver] = util::makeOneShot<std::error_code>(executor);
    auto progress = std::make_shared<Progress>();
    progress->v4Missing = wantV4;
    progress->v6Missing = wantV6;
    progress->done.emplace(std::move(sender));

    const auto notifier = InterfaceChangeNotifier::registerCallback(
        *helper, [progress, interfaceIndex](const os::InterfaceChange& change) {
            if (change.error) {
                const std::lock_guard lock {progress->mutex};
                progress->complete(change.error);
                return;
            }
            if (change.interfaceIndex != interfaceIndex || change.kind != os::ChangeKind::Added) {
                return;
            }
            const std::lock_guard lock {progress->mutex};
            if (progress->markPresent(change.family)) {
                spdlog::debug("interface {} has all requested address families", interfaceIndex);
                progress->complete();
            }
        });

    if (presentAfterSubscribing(*helper, *progress, interfaceIndex)) {
        spdlog::debug("interface {} already has all requested address families", interfaceIndex);
        co_return;
    }

    spdlog::info("waiting for interface {} to get its addresses (IPv4: {}, IPv6: {})", interfaceIndex, wantV4, wantV6);
    // progress holds the sender until it completes, so a value always arrives
    const auto error = (co_await receiver.receive()).value_or(std::error_code {});
    if (error) {
        spdlog::error("stopped waiting for interface {}: {}", interfaceIndex, error.message());
        throw std::system_error {error, "interface change notifications ended"};
    }
}

}  // namespace linkwatch::readiness

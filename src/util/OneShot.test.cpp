// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <optional>
#include <thread>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <doctest/doctest.h>
#include <testing/Awaitable.hpp>
#include <util/OneShot.hpp>

namespace
{
// NOLINTBEGIN(*)

using namespace linkwatch;
using linkwatch::testing::runAwaitable;

TEST_SUITE("[util::OneShot]")
{
    TEST_CASE("value sent before receiving")
    {
        boost::asio::io_context io;
        auto [sender, receiver] = util::makeOneShot<int>(io.get_executor());
        sender.send(42);
        CHECK(runAwaitable(io, receiver.receive()) == std::optional<int> {42});
    }

    TEST_CASE("value sent while receiving")
    {
        boost::asio::io_context io;
        auto [sender, receiver] = util::makeOneShot<int>(io.get_executor());
        const auto outcome = testing::start(io, receiver.receive());
        testing::settle(io);
        CHECK(!outcome->done);
        sender.send(7);
        testing::settle(io);
        REQUIRE(outcome->done);
        CHECK(outcome->value == std::optional<std::optional<int>> {7});
    }

    TEST_CASE("value sent from another thread")
    {
        boost::asio::io_context io;
        auto [sender, receiver] = util::makeOneShot<int>(io.get_executor());
        std::thread worker {[sender = std::move(sender)]() mutable { sender.send(3); }};
        CHECK(runAwaitable(io, receiver.receive()) == std::optional<int> {3});
        worker.join();
    }

    TEST_CASE("dropping the sender closes without a value")
    {
        boost::asio::io_context io;
        auto [sender, receiver] = util::makeOneShot<int>(io.get_executor());
        {
            const auto dropped = std::move(sender);
        }
        CHECK(runAwaitable(io, receiver.receive()) == std::nullopt);
    }

    TEST_CASE("only the first send counts")
    {
        boost::asio::io_context io;
        auto [sender, receiver] = util::makeOneShot<int>(io.get_executor());
        sender.send(1);
        sender.send(2);
        CHECK(runAwaitable(io, receiver.receive()) == std::optional<int> {1});
    }

    TEST_CASE("sending to a destroyed receiver leaves its executor alone")
    {
        boost::asio::io_context io;
        auto [sender, receiver] = util::makeOneShot<int>(io.get_executor());
        CHECK(!sender.receiverGone());
        {
            const auto gone = std::move(receiver);
        }
        CHECK(sender.receiverGone());
        sender.send(5);
        CHECK(io.poll() == 0);
    }

    TEST_CASE("a receiver destroyed with its io_context while a thread still holds the sender")
    {
        std::optional<util::OneShotSender<int>> late;
        {
            boost::asio::io_context io;
            auto [sender, receiver] = util::makeOneShot<int>(io.get_executor());
            late.emplace(std::move(sender));
            const auto outcome = testing::start(io, [](util::OneShotReceiver<int> r) -> boost::asio::awaitable<int> {
                co_return (co_await r.receive()).value_or(-1);
            }(std::move(receiver)));
            testing::settle(io);
            CHECK(!outcome->done);
        }
        CHECK(late->receiverGone());
        std::thread worker {[&late] { late->send(9); }};
        worker.join();
    }
}

// NOLINTEND(*)
}  // namespace

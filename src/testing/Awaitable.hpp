// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace linkwatch::testing
{

template<typename T>
struct Outcome
{
    using Value = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    bool done {false};
    std::exception_ptr error;
    std::optional<Value> value;
};

/** Starts @p awaitable on @p io without running it. */
template<typename T>
auto start(boost::asio::io_context& io, boost::asio::awaitable<T> awaitable) -> std::shared_ptr<Outcome<T>>
{
    auto outcome = std::make_shared<Outcome<T>>();
    if constexpr (std::is_void_v<T>) {
        boost::asio::co_spawn(io, std::move(awaitable), [outcome](std::exception_ptr error) {
            outcome->done = true;
            outcome->error = std::move(error);
            if (!outcome->error) {
                outcome->value.emplace();
            }
        });
    } else {
        boost::asio::co_spawn(io, std::move(awaitable), [outcome](std::exception_ptr error, T value) {
            outcome->done = true;
            outcome->error = std::move(error);
            if (!outcome->error) {
                outcome->value.emplace(std::move(value));
            }
        });
    }
    return outcome;
}

/** Runs every handler that is ready now, without waiting for timers or other threads. */
inline void settle(boost::asio::io_context& io)
{
    io.restart();
    io.poll();
}

/** Runs @p io until @p outcome is done or @p timeout has passed. */
template<typename T>
auto driveUntilDone(boost::asio::io_context& io,
                    const Outcome<T>& outcome,
                    const std::chrono::milliseconds timeout = std::chrono::seconds {5}) -> bool
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!outcome.done && std::chrono::steady_clock::now() < deadline) {
        io.restart();
        io.run_one_for(std::chrono::milliseconds {10});
    }
    return outcome.done;
}

/** Runs @p awaitable to completion, rethrowing what it throws. */
template<typename T>
auto runAwaitable(boost::asio::io_context& io, boost::asio::awaitable<T> awaitable) -> T
{
    const auto outcome = start(io, std::move(awaitable));
    if (!driveUntilDone(io, *outcome)) {
        throw std::runtime_error {"awaitable did not complete"};
    }
    if (outcome->error) {
        std::rethrow_exception(outcome->error);
    }
    if constexpr (!std::is_void_v<T>) {
        return std::move(*outcome->value);
    }
}

}  // namespace linkwatch::testing

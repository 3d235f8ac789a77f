// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace linkwatch::util
{

namespace detail
{
// owned by the receiver, only touched on its executor
template<typename T>
struct OneShotSignal
{
    explicit OneShotSignal(const boost::asio::any_io_executor& ex)
        : timer {ex, boost::asio::steady_timer::time_point::max()}
    {
    }

    boost::asio::steady_timer timer;
    std::optional<T> value;
    bool closed {false};
};

// shared by both halves; receiverGone is set under the mutex before the receiver's executor may go away
template<typename T>
struct OneShotLink
{
    std::mutex mutex;
    boost::asio::any_io_executor executor;
    std::weak_ptr<OneShotSignal<T>> signal;
    bool receiverGone {false};
};
}  // namespace detail

/**
 * @brief Sending half of a one-shot channel. May be used from any thread.
 *
 * Destroying a sender that has not sent closes the channel without a value. Once the receiver is gone, sending does
 * nothing and never touches the receiver's executor.
 */
template<typename T>
class OneShotSender
{
  public:
    explicit OneShotSender(std::shared_ptr<detail::OneShotLink<T>> link)
        : m_link {std::move(link)}
    {
    }

    ~OneShotSender() { close(std::nullopt); }

    OneShotSender(const OneShotSender&) = delete;
    auto operator=(const OneShotSender&) -> OneShotSender& = delete;

    OneShotSender(OneShotSender&& other) noexcept
        : m_link {std::exchange(other.m_link, nullptr)}
    {
    }

    auto operator=(OneShotSender&& other) noexcept -> OneShotSender&
    {
        if (this != &other) {
            close(std::nullopt);
            m_link = std::exchange(other.m_link, nullptr);
        }
        return *this;
    }

    void send(T value) { close(std::optional<T> {std::move(value)}); }

    /** @return true once the receiving half has been destroyed */
    [[nodiscard]] auto receiverGone() const -> bool
    {
        if (!m_link) {
            return true;
        }
        const std::lock_guard lock {m_link->mutex};
        return m_link->receiverGone;
    }

  private:
    void close(std::optional<T> value)
    {
        if (!m_link) {
            return;
        }
        const auto link = std::exchange(m_link, nullptr);
        // held while posting, so the receiver cannot finish destruction in between
        const std::lock_guard lock {link->mutex};
        if (link->receiverGone) {
            return;
        }
        boost::asio::post(link->executor, [signal = link->signal, value = std::move(value)]() mutable {
            const auto target = signal.lock();
            if (!target) {
                return;
            }
            target->value = std::move(value);
            target->closed = true;
            target->timer.cancel();
        });
    }

    std::shared_ptr<detail::OneShotLink<T>> m_link;
};

/** Receiving half of a one-shot channel, bound to the executor it was created for. */
template<typename T>
class OneShotReceiver
{
  public:
    OneShotReceiver(std::shared_ptr<detail::OneShotLink<T>> link, std::shared_ptr<detail::OneShotSignal<T>> signal)
        : m_link {std::move(link)}
        , m_signal {std::move(signal)}
    {
    }

    ~OneShotReceiver()
    {
        if (m_link) {
            const std::lock_guard lock {m_link->mutex};
            m_link->receiverGone = true;
        }
    }

    OneShotReceiver(const OneShotReceiver&) = delete;
    auto operator=(const OneShotReceiver&) -> OneShotReceiver& = delete;
    OneShotReceiver(OneShotReceiver&& other) noexcept = default;
    auto operator=(OneShotReceiver&& other) noexcept -> OneShotReceiver& = delete;

    /** @return the sent value, or nullopt if the sender was dropped without sending */
    auto receive() -> boost::asio::awaitable<std::optional<T>>
    {
        auto signal = m_signal;
        while (!signal->closed) {
            boost::system::error_code ec;
            co_await signal->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        co_return std::move(signal->value);
    }

  private:
    std::shared_ptr<detail::OneShotLink<T>> m_link;
    std::shared_ptr<detail::OneShotSignal<T>> m_signal;
};

template<typename T>
[[nodiscard]] auto makeOneShot(const boost::asio::any_io_executor& ex) -> std::pair<OneShotSender<T>, OneShotReceiver<T>>
{
    auto signal = std::make_shared<detail::OneShotSignal<T>>(ex);
    auto link = std::make_shared<detail::OneShotLink<T>>();
    link->executor = ex;
    link->signal = signal;
    return {OneShotSender<T> {link}, OneShotReceiver<T> {link, std::move(signal)}};
}

}  // namespace linkwatch::util

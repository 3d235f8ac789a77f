// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include <os/IpHelper.hpp>

namespace linkwatch::readiness
{

/**
 * @brief Bridges OS interface change notifications to a callback.
 *
 * The notifier is the registration's context, so it stays pinned on the heap until unregistered. Destroying it
 * unregisters synchronously, no invocation of the callback runs or starts afterwards. A callback that throws poisons
 * the bridge and is never invoked again.
 */
class InterfaceChangeNotifier
{
  public:
    using Callback = std::function<void(const os::InterfaceChange&)>;

    /**
     * @param family restricts notifications to one family, both if unset
     * @throws std::system_error if the OS refuses the registration
     */
    [[nodiscard]] static auto registerCallback(os::IpHelper& helper,
                                               Callback callback,
                                               std::optional<ip::Family> family = std::nullopt)
        -> std::unique_ptr<InterfaceChangeNotifier>;

    ~InterfaceChangeNotifier();
    InterfaceChangeNotifier(const InterfaceChangeNotifier&) = delete;
    InterfaceChangeNotifier(InterfaceChangeNotifier&&) = delete;
    auto operator=(const InterfaceChangeNotifier&) -> InterfaceChangeNotifier& = delete;
    auto operator=(InterfaceChangeNotifier&&) -> InterfaceChangeNotifier& = delete;

    /** Blocks until the OS has stopped delivering; must not be called from within the callback. */
    void unregister();

    [[nodiscard]] auto isPoisoned() const -> bool;

  private:
    explicit InterfaceChangeNotifier(Callback callback);

    void deliver(const os::InterfaceChange& change);
    static void dispatchToSelf(void* context, const os::InterfaceChange& change);

    mutable std::mutex m_mutex;
    Callback m_callback;
    bool m_cancelled {false};
    bool m_poisoned {false};
    std::unique_ptr<os::ChangeRegistration> m_registration;
};

}  // namespace linkwatch::readiness

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <exception>
#include <utility>

#include <readiness/InterfaceChangeNotifier.hpp>
#include <spdlog/spdlog.h>

namespace linkwatch::readiness
{

auto InterfaceChangeNotifier::registerCallback(os::IpHelper& helper,
                                               Callback callback,
                                               const std::optional<ip::Family> family)
    -> std::unique_ptr<InterfaceChangeNotifier>
{
    std::unique_ptr<InterfaceChangeNotifier> notifier {new InterfaceChangeNotifier {std::move(callback)}};
    auto registration = helper.registerChangeNotification(family, &InterfaceChangeNotifier::dispatchToSelf, notifier.get());
    {
        // the OS may already be delivering
        const std::lock_guard lock {notifier->m_mutex};
        notifier->m_registration = std::move(registration);
    }
    spdlog::debug("registered for interface changes");
    return notifier;
}

InterfaceChangeNotifier::InterfaceChangeNotifier(Callback callback)
    : m_callback {std::move(callback)}
{
}

InterfaceChangeNotifier::~InterfaceChangeNotifier()
{
    unregister();
}

void InterfaceChangeNotifier::unregister()
{
    std::unique_ptr<os::ChangeRegistration> registration;
    {
        const std::lock_guard lock {m_mutex};
        m_cancelled = true;
        registration = std::move(m_registration);
    }
    if (!registration) {
        return;
    }
    // an invocation blocked on the mutex returns early once it sees the cancellation
    registration->cancel();
    spdlog::debug("unregistered from interface changes");
}

auto InterfaceChangeNotifier::isPoisoned() const -> bool
{
    const std::lock_guard lock {m_mutex};
    return m_poisoned;
}

void InterfaceChangeNotifier::deliver(const os::InterfaceChange& change)
{
    const std::lock_guard lock {m_mutex};
    if (m_cancelled || m_poisoned) {
        return;
    }
    try {
        m_callback(change);
    } catch (const std::exception& e) {
        m_poisoned = true;
        spdlog::error("interface change callback failed, dropping further changes: {}", e.what());
    }
}

void InterfaceChangeNotifier::dispatchToSelf(void* context, const os::InterfaceChange& change)
{
    static_cast<InterfaceChangeNotifier*>(context)->deliver(change);
}

}  // namespace linkwatch::readiness

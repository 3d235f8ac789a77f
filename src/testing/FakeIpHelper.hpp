// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <algorithm>
#include <deque>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <network/UnicastAddress.hpp>
#include <os/IpHelper.hpp>

namespace linkwatch::testing
{

/**
 * @brief Scriptable IpHelper.
 *
 * Delivers changes synchronously from whichever thread calls fire(). Every call is recorded in a journal.
 */
class FakeIpHelper final : public os::IpHelper
{
  public:
    void addAddress(const uint32_t interfaceIndex,
                    const std::string& address,
                    const network::DadState state = network::DadState {network::DadState::Kind::Preferred})
    {
        const std::lock_guard lock {m_mutex};
        m_table.push_back(network::UnicastAddressEntry {
            .interfaceIndex = interfaceIndex,
            .address = network::Address {ip::Address::fromString(address), 64},
            .dadState = state,
        });
    }

    /** unicastEntry reports these states in turn, repeating the last one */
    void scriptStates(const std::string& address, std::vector<network::DadState> states)
    {
        const std::lock_guard lock {m_mutex};
        m_scripts[ip::Address::fromString(address)] = std::deque<network::DadState>(states.begin(), states.end());
    }

    void failTable(const std::errc error)
    {
        const std::lock_guard lock {m_mutex};
        m_tableError = std::make_error_code(error);
    }

    void failEntry(const std::errc error)
    {
        const std::lock_guard lock {m_mutex};
        m_entryError = std::make_error_code(error);
    }

    /** makes unicastEntry throw something that is not an OS error */
    void breakEntry()
    {
        const std::lock_guard lock {m_mutex};
        m_entryBroken = true;
    }

    void failRegistration(const std::errc error)
    {
        const std::lock_guard lock {m_mutex};
        m_registrationError = std::make_error_code(error);
    }

    void onCancel(std::function<void()> hook)
    {
        const std::lock_guard lock {m_mutex};
        m_onCancel = std::move(hook);
    }

    /** @return the number of callbacks the change was delivered to */
    auto fire(const os::InterfaceChange& change) -> std::size_t
    {
        const std::lock_guard delivery {m_deliveryMutex};
        std::vector<Registered> targets;
        {
            const std::lock_guard lock {m_mutex};
            for (const auto& [id, registered] : m_registrations) {
                if (!registered.family || *registered.family == change.family) {
                    targets.push_back(registered);
                }
            }
        }
        for (const auto& target : targets) {
            target.callback(target.context, change);
        }
        return targets.size();
    }

    [[nodiscard]] auto journal() const -> std::vector<std::string>
    {
        const std::lock_guard lock {m_mutex};
        return m_journal;
    }

    [[nodiscard]] auto entryQueries() const -> std::size_t
    {
        const std::lock_guard lock {m_mutex};
        return m_entryQueries;
    }

    [[nodiscard]] auto entryThreads() const -> std::set<std::thread::id>
    {
        const std::lock_guard lock {m_mutex};
        return m_entryThreads;
    }

    [[nodiscard]] auto activeRegistrations() const -> std::size_t
    {
        const std::lock_guard lock {m_mutex};
        return m_registrations.size();
    }

    [[nodiscard]] auto lastRegisteredFamily() const -> std::optional<ip::Family>
    {
        const std::lock_guard lock {m_mutex};
        return m_lastFamily;
    }

    auto unicastTable(const std::optional<ip::Family> family) -> network::UnicastAddressTable override
    {
        const std::lock_guard lock {m_mutex};
        m_journal.emplace_back("table");
        if (m_tableError) {
            throw std::system_error {*m_tableError, "unicast table"};
        }
        network::UnicastAddressTable result;
        std::copy_if(m_table.begin(), m_table.end(), std::back_inserter(result), [family](const auto& entry) {
            return !family || entry.family() == *family;
        });
        return result;
    }

    auto unicastEntry(const network::UnicastAddressEntry& entry) -> network::UnicastAddressEntry override
    {
        const std::lock_guard lock {m_mutex};
        ++m_entryQueries;
        m_entryThreads.insert(std::this_thread::get_id());
        if (m_entryError) {
            throw std::system_error {*m_entryError, "unicast entry"};
        }
        if (m_entryBroken) {
            throw std::logic_error {"broken fake"};
        }
        auto result = entry;
        if (const auto script = m_scripts.find(entry.address.ip()); script != m_scripts.end()) {
            auto& states = script->second;
            result.dadState = states.front();
            if (states.size() > 1) {
                states.pop_front();
            }
            return result;
        }
        const auto current = std::find_if(
            m_table.begin(), m_table.end(), [&entry](const auto& candidate) { return candidate.sameAddressAs(entry); });
        if (current == m_table.end()) {
            throw std::system_error {std::make_error_code(std::errc::no_such_file_or_directory), "unicast entry"};
        }
        return *current;
    }

    auto ipInterfaceEntry(const ip::Family family, const uint32_t interfaceIndex) -> os::IpInterfaceEntry override
    {
        const std::lock_guard lock {m_mutex};
        if (const auto it = m_interfaces.find({interfaceIndex, family}); it != m_interfaces.end()) {
            return it->second;
        }
        throw std::system_error {std::make_error_code(std::errc::no_such_device), "ip interface entry"};
    }

    void setIpInterfaceEntry(const os::IpInterfaceEntry& entry) override
    {
        const std::lock_guard lock {m_mutex};
        m_interfaces[{entry.interfaceIndex, entry.family}] = entry;
    }

    auto registerChangeNotification(const std::optional<ip::Family> family,
                                    const os::ChangeCallback callback,
                                    void* context) -> std::unique_ptr<os::ChangeRegistration> override
    {
        const std::lock_guard lock {m_mutex};
        m_journal.emplace_back("register");
        if (m_registrationError) {
            throw std::system_error {*m_registrationError, "register change notification"};
        }
        m_lastFamily = family;
        const auto id = ++m_nextRegistrationId;
        m_registrations.emplace(id, Registered {.family = family, .callback = callback, .context = context});
        return std::make_unique<Registration>(*this, id);
    }

  private:
    struct Registered
    {
        std::optional<ip::Family> family;
        os::ChangeCallback callback;
        void* context;
    };

    class Registration final : public os::ChangeRegistration
    {
      public:
        Registration(FakeIpHelper& helper, const int id)
            : m_helper {helper}
            , m_id {id}
        {
        }

        ~Registration() override { cancel(); }

        Registration(const Registration&) = delete;
        Registration(Registration&&) = delete;
        auto operator=(const Registration&) -> Registration& = delete;
        auto operator=(Registration&&) -> Registration& = delete;

        void cancel() override
        {
            if (!m_active) {
                return;
            }
            m_active = false;
            m_helper.unregister(m_id);
        }

      private:
        FakeIpHelper& m_helper;
        int m_id;
        bool m_active {true};
    };

    void unregister(const int id)
    {
        // waits for a delivery in progress
        const std::lock_guard delivery {m_deliveryMutex};
        std::function<void()> hook;
        {
            const std::lock_guard lock {m_mutex};
            m_registrations.erase(id);
            m_journal.emplace_back("cancel");
            hook = m_onCancel;
        }
        if (hook) {
            hook();
        }
    }

    mutable std::mutex m_mutex;
    std::mutex m_deliveryMutex;
    network::UnicastAddressTable m_table;
    std::map<ip::Address, std::deque<network::DadState>> m_scripts;
    std::map<std::pair<uint32_t, ip::Family>, os::IpInterfaceEntry> m_interfaces;
    std::optional<std::error_code> m_tableError;
    std::optional<std::error_code> m_entryError;
    std::optional<std::error_code> m_registrationError;
    bool m_entryBroken {false};
    std::function<void()> m_onCancel;
    std::map<int, Registered> m_registrations;
    int m_nextRegistrationId {};
    std::optional<ip::Family> m_lastFamily;
    std::size_t m_entryQueries {};
    std::set<std::thread::id> m_entryThreads;
    std::vector<std::string> m_journal;
};

}  // namespace linkwatch::testing

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <system_error>

#include <fmt/ostream.h>
#include <ip/Address.hpp>
#include <network/UnicastAddress.hpp>

namespace linkwatch::os
{

enum class ChangeKind : uint8_t
{
    Added,
    Removed,
    ParameterChanged,
    Other,
};
auto operator<<(std::ostream& o, ChangeKind k) -> std::ostream&;

/** A change with @c error set is the last one of its registration: notifications have stopped for good. */
struct InterfaceChange
{
    uint32_t interfaceIndex {};
    ip::Family family {ip::Family::IPv4};
    ChangeKind kind {ChangeKind::Other};
    std::error_code error {};

    [[nodiscard]] auto operator==(const InterfaceChange& other) const -> bool = default;
};
auto operator<<(std::ostream& o, const InterfaceChange& c) -> std::ostream&;

/** Per family IP parameters of an interface. */
struct IpInterfaceEntry
{
    uint32_t interfaceIndex {};
    ip::Family family {ip::Family::IPv4};
    uint32_t mtu {};
    bool forwarding {false};

    [[nodiscard]] auto operator==(const IpInterfaceEntry& other) const -> bool = default;
};
auto operator<<(std::ostream& o, const IpInterfaceEntry& e) -> std::ostream&;

/** Invoked by the OS from a thread of its choosing; @p context is the pointer given at registration. */
using ChangeCallback = void (*)(void* context, const InterfaceChange& change);

class ChangeRegistration
{
  public:
    ChangeRegistration() = default;
    virtual ~ChangeRegistration() = default;
    ChangeRegistration(const ChangeRegistration&) = delete;
    ChangeRegistration(ChangeRegistration&&) = delete;
    auto operator=(const ChangeRegistration&) -> ChangeRegistration& = delete;
    auto operator=(ChangeRegistration&&) -> ChangeRegistration& = delete;

    /**
     * @brief Cancels the registration.
     *
     * Blocks until no invocation of the callback is running and none will start afterwards. Calling it again has no
     * effect. Must not be called from within the callback.
     */
    virtual void cancel() = 0;
};

/**
 * @brief The OS primitives used for interface readiness checks.
 *
 * All operations may block and report OS failures with std::system_error.
 */
class IpHelper
{
  public:
    IpHelper() = default;
    virtual ~IpHelper() = default;
    IpHelper(const IpHelper&) = delete;
    IpHelper(IpHelper&&) = delete;
    auto operator=(const IpHelper&) -> IpHelper& = delete;
    auto operator=(IpHelper&&) -> IpHelper& = delete;

    /** all unicast addresses of all interfaces, optionally restricted to one family */
    [[nodiscard]] virtual auto unicastTable(std::optional<ip::Family> family) -> network::UnicastAddressTable = 0;

    /** live state of the address @p entry refers to */
    [[nodiscard]] virtual auto unicastEntry(const network::UnicastAddressEntry& entry)
        -> network::UnicastAddressEntry = 0;

    [[nodiscard]] virtual auto ipInterfaceEntry(ip::Family family, uint32_t interfaceIndex) -> IpInterfaceEntry = 0;
    virtual void setIpInterfaceEntry(const IpInterfaceEntry& entry) = 0;

    /** @p context must stay valid until the returned registration has been cancelled */
    [[nodiscard]] virtual auto registerChangeNotification(std::optional<ip::Family> family,
                                                          ChangeCallback callback,
                                                          void* context) -> std::unique_ptr<ChangeRegistration> = 0;
};

}  // namespace linkwatch::os

template<>
struct fmt::formatter<linkwatch::os::ChangeKind> : fmt::ostream_formatter
{
};

template<>
struct fmt::formatter<linkwatch::os::InterfaceChange> : fmt::ostream_formatter
{
};

template<>
struct fmt::formatter<linkwatch::os::IpInterfaceEntry> : fmt::ostream_formatter
{
};

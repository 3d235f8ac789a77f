// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <array>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <linux/if_addr.h>
#include <linux/rtnetlink.h>
#include <netlink/Attributes.hpp>
#include <netlink/Socket.hpp>
#include <network/Interface.hpp>
#include <os/KnownAddresses.hpp>
#include <os/NetlinkIpHelper.hpp>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

namespace linkwatch::os
{
namespace
{

[[noreturn]] void throwErrno(const std::string& what)
{
    const auto err = errno;
    throw std::system_error(err, std::system_category(), what);
}

auto toRtnlFamily(const std::optional<ip::Family> family) -> uint8_t
{
    return static_cast<uint8_t>(family.transform(ip::asLinuxAf).value_or(AF_UNSPEC));
}

auto parseAddressMessage(const nlmsghdr* n) -> std::optional<network::UnicastAddressEntry>
{
    const auto* ifa = static_cast<const ifaddrmsg*>(mnl_nlmsg_get_payload(n));
    const auto family = ip::fromLinuxAf(ifa->ifa_family);
    if (!family) {
        return std::nullopt;
    }
    const auto attributes = netlink::Attributes::parse(n, sizeof(*ifa), IFA_MAX);
    // IFA_FLAGS carries the full set, ifa_flags only the lower 8 bits
    const auto rawFlags = attributes.getU32(IFA_FLAGS).value_or(ifa->ifa_flags);
    // IFA_ADDRESS is the peer on point to point v4 links
    const auto local = *family == ip::Family::IPv4
        ? attributes.getIpV4Address(IFA_LOCAL).or_else([&] { return attributes.getIpV4Address(IFA_ADDRESS); })
        : attributes.getIpV6Address(IFA_ADDRESS);
    if (!local) {
        spdlog::trace("ignoring address message without address on {}", ifa->ifa_index);
        return std::nullopt;
    }
    return network::UnicastAddressEntry {
        .interfaceIndex = ifa->ifa_index,
        .address = network::Address {*local, ifa->ifa_prefixlen},
        .dadState = network::DadState::fromAddressFlags(rawFlags),
    };
}

auto mtuPath(const ip::Family family, const std::string& name) -> std::string
{
    if (family == ip::Family::IPv4) {
        return "/sys/class/net/" + name + "/mtu";
    }
    return "/proc/sys/net/ipv6/conf/" + name + "/mtu";
}

auto forwardingPath(const ip::Family family, const std::string& name) -> std::string
{
    return std::string {family == ip::Family::IPv4 ? "/proc/sys/net/ipv4/conf/" : "/proc/sys/net/ipv6/conf/"} + name
        + "/forwarding";
}

auto readSysctl(const std::string& path) -> uint32_t
{
    std::ifstream in {path};
    if (!in) {
        throwErrno("open " + path);
    }
    uint32_t value {};
    if (!(in >> value)) {
        throw std::system_error(std::make_error_code(std::errc::io_error), "read " + path);
    }
    return value;
}

void writeSysctl(const std::string& path, const uint32_t value)
{
    std::ofstream out {path};
    if (!out) {
        throwErrno("open " + path);
    }
    out << value << '\n';
    out.flush();
    if (!out) {
        throwErrno("write " + path);
    }
}

class FileDescriptor
{
  public:
    explicit FileDescriptor(const int fd)
        : m_fd {fd}
    {
    }

    ~FileDescriptor()
    {
        if (m_fd >= 0) {
            close(m_fd);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&&) = delete;
    auto operator=(const FileDescriptor&) -> FileDescriptor& = delete;
    auto operator=(FileDescriptor&&) -> FileDescriptor& = delete;

    [[nodiscard]] auto get() const -> int { return m_fd; }

  private:
    int m_fd;
};

auto openEventFd() -> int
{
    const auto fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (fd < 0) {
        throwErrno("eventfd");
    }
    return fd;
}

auto dumpUnicastTable(const std::optional<ip::Family> family) -> network::UnicastAddressTable
{
    network::UnicastAddressTable table;
    netlink::Socket socket;
    socket.dump(RTM_GETADDR, toRtnlFamily(family), [&table, family](const nlmsghdr* n) {
        if (n->nlmsg_type != RTM_NEWADDR) {
            return;
        }
        auto entry = parseAddressMessage(n);
        if (entry && (!family || entry->family() == *family)) {
            table.push_back(std::move(*entry));
        }
    });
    return table;
}

/**
 * Listens on the address multicast groups from a thread of its own.
 *
 * Lost notifications are made up for by comparing a fresh dump with the known addresses. If the socket fails, a last
 * change carrying the error is delivered and the thread ends.
 */
class NetlinkChangeRegistration final : public ChangeRegistration
{
  public:
    NetlinkChangeRegistration(const std::optional<ip::Family> family, const ChangeCallback callback, void* context)
        : m_family {family}
        , m_socket {netlink::familyGroups(family, RTNLGRP_IPV4_IFADDR, RTNLGRP_IPV6_IFADDR), true}
        , m_wakeup {openEventFd()}
        , m_callback {callback}
        , m_context {context}
    {
        // subscribed before the snapshot so that nothing in between is lost
        m_known.seed(dumpUnicastTable(family));
        m_worker = std::thread {[this] { run(); }};
    }

    ~NetlinkChangeRegistration() override
    {
        try {
            cancel();
        } catch (const std::system_error& e) {
            spdlog::error("failed to stop address notifications: {}", e.what());
        }
    }

    NetlinkChangeRegistration(const NetlinkChangeRegistration&) = delete;
    NetlinkChangeRegistration(NetlinkChangeRegistration&&) = delete;
    auto operator=(const NetlinkChangeRegistration&) -> NetlinkChangeRegistration& = delete;
    auto operator=(NetlinkChangeRegistration&&) -> NetlinkChangeRegistration& = delete;

    void cancel() override
    {
        const std::lock_guard lock {m_cancelMutex};
        if (!m_worker.joinable()) {
            return;
        }
        if (m_worker.get_id() == std::this_thread::get_id()) {
            spdlog::flush_on(spdlog::level::critical);
            spdlog::critical("change registration cancelled from its own callback");
            std::abort();
        }
        const uint64_t one = 1;
        if (write(m_wakeup.get(), &one, sizeof(one)) < 0) {
            throwErrno("write eventfd");
        }
        m_worker.join();
        spdlog::debug("change registration cancelled");
    }

  private:
    void run()
    {
        std::array<pollfd, 2> fds {{
            {.fd = m_socket.fd(), .events = POLLIN, .revents = 0},
            {.fd = m_wakeup.get(), .events = POLLIN, .revents = 0},
        }};
        for (;;) {
            if (poll(fds.data(), fds.size(), -1) < 0) {
                if (errno == EINTR) {
                    continue;
                }
                end(std::error_code {errno, std::system_category()});
                return;
            }
            if ((fds[1].revents & POLLIN) != 0) {
                return;
            }
            if ((fds[0].revents & (POLLERR | POLLHUP)) != 0 && (fds[0].revents & POLLIN) == 0) {
                end(std::make_error_code(std::errc::connection_aborted));
                return;
            }
            if ((fds[0].revents & POLLIN) != 0) {
                if (const auto error = receivePending()) {
                    end(error);
                    return;
                }
            }
        }
    }

    auto receivePending() -> std::error_code
    {
        try {
            while (const auto length = m_socket.receive()) {
                m_socket.process(*length, 0, [this](const nlmsghdr* n) { handleMessage(n); });
            }
        } catch (const std::system_error& e) {
            if (e.code().value() != ENOBUFS) {
                return e.code();
            }
            spdlog::warn("address notifications were lost, reading the table again");
            return resync();
        }
        return {};
    }

    auto resync() -> std::error_code
    {
        network::UnicastAddressTable table;
        try {
            table = dumpUnicastTable(m_family);
        } catch (const std::system_error& e) {
            spdlog::error("failed to read the address table after losing notifications: {}", e.what());
            return e.code();
        }
        for (const auto& change : m_known.resync(table)) {
            spdlog::debug("missed address change {}", change);
            m_callback(m_context, change);
        }
        return {};
    }

    void end(const std::error_code error)
    {
        spdlog::error("address notifications stopped: {}", error.message());
        const InterfaceChange last {
            .family = m_family.value_or(ip::Family::IPv4),
            .kind = ChangeKind::Other,
            .error = error,
        };
        m_callback(m_context, last);
    }

    void handleMessage(const nlmsghdr* n)
    {
        if (n->nlmsg_type != RTM_NEWADDR && n->nlmsg_type != RTM_DELADDR) {
            return;
        }
        const auto entry = parseAddressMessage(n);
        if (!entry) {
            return;
        }
        auto kind = ChangeKind::Removed;
        if (n->nlmsg_type == RTM_DELADDR) {
            m_known.withdrawn(*entry);
        } else {
            kind = m_known.announced(*entry);
        }
        const InterfaceChange change {.interfaceIndex = entry->interfaceIndex, .family = entry->family(), .kind = kind};
        spdlog::trace("address change {} for {}", change, entry->address);
        m_callback(m_context, change);
    }

    std::optional<ip::Family> m_family;
    netlink::Socket m_socket;
    FileDescriptor m_wakeup;
    ChangeCallback m_callback;
    void* m_context;
    KnownAddresses m_known;
    std::mutex m_cancelMutex;
    std::thread m_worker;
};

}  // namespace

auto NetlinkIpHelper::unicastTable(const std::optional<ip::Family> family) -> network::UnicastAddressTable
{
    auto table = dumpUnicastTable(family);
    spdlog::trace("unicast table has {} entries", table.size());
    return table;
}

auto NetlinkIpHelper::unicastEntry(const network::UnicastAddressEntry& entry) -> network::UnicastAddressEntry
{
    for (auto& current : unicastTable(entry.family())) {
        if (current.sameAddressAs(entry)) {
            return current;
        }
    }
    throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                            fmt::format("address {} on {} is gone", entry.address.ip(), entry.interfaceIndex));
}

auto NetlinkIpHelper::ipInterfaceEntry(const ip::Family family, const uint32_t interfaceIndex) -> IpInterfaceEntry
{
    const auto iface = network::Interface::fromIndex(interfaceIndex);
    return IpInterfaceEntry {
        .interfaceIndex = interfaceIndex,
        .family = family,
        .mtu = readSysctl(mtuPath(family, iface.name())),
        .forwarding = readSysctl(forwardingPath(family, iface.name())) != 0,
    };
}

void NetlinkIpHelper::setIpInterfaceEntry(const IpInterfaceEntry& entry)
{
    const auto iface = network::Interface::fromIndex(entry.interfaceIndex);
    spdlog::debug("applying {} to {}", entry, iface);
    writeSysctl(mtuPath(entry.family, iface.name()), entry.mtu);
    writeSysctl(forwardingPath(entry.family, iface.name()), entry.forwarding ? 1U : 0U);
}

auto NetlinkIpHelper::registerChangeNotification(const std::optional<ip::Family> family,
                                                 const ChangeCallback callback,
                                                 void* context) -> std::unique_ptr<ChangeRegistration>
{
    return std::make_unique<NetlinkChangeRegistration>(family, callback, context);
}

}  // namespace linkwatch::os

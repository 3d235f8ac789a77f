// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <exception>
#include <system_error>
#include <thread>

#include <netlink/Socket.hpp>
#include <spdlog/spdlog.h>
#include <sys/socket.h>

namespace linkwatch::netlink
{
namespace
{
[[noreturn]] void throwErrno(const char* what)
{
    const auto err = errno;
    throw std::system_error(err, std::system_category(), what);
}

auto shouldRetryDump(const int err) -> bool
{
    switch (err) {
        case EPROTO:
        case EINTR:
        case EAGAIN:
        case EBUSY:
            return true;
        default:
            break;
    }
    return false;
}

constexpr auto RECEIVE_SOCKET_BUFFER_SIZE = 32U * 1024U;
constexpr auto SEND_SOCKET_BUFFER_SIZE = 4U * 1024U;
constexpr auto MAX_DUMP_ATTEMPTS = 5;

using namespace std::chrono_literals;
constexpr auto DUMP_RETRY_DELAY = 10ms;

auto openMnlSocket(const bool nonBlocking) -> mnl_socket*
{
    auto* s = mnl_socket_open2(NETLINK_ROUTE, SOCK_CLOEXEC | (nonBlocking ? SOCK_NONBLOCK : 0));
    if (s == nullptr) {
        throwErrno("mnl_socket_open2");
    }
    return s;
}

struct DispatchContext
{
    const Socket::MessageHandler* handler;
    std::exception_ptr error;
};

auto dispatchToHandler(const nlmsghdr* n, void* data) -> int
{
    auto* ctx = static_cast<DispatchContext*>(data);
    try {
        (*ctx->handler)(n);
    } catch (...) {
        // rethrown by Socket::run once libmnl has returned
        ctx->error = std::current_exception();
        return MNL_CB_STOP;
    }
    return MNL_CB_OK;
}
}  // namespace

auto toRtnlGroupFlag(const rtnetlink_groups group) -> unsigned
{
    return 1U << (group - 1U);
}

auto familyGroups(const std::optional<ip::Family> family,
                  const rtnetlink_groups v4Group,
                  const rtnetlink_groups v6Group) -> unsigned
{
    unsigned groups = 0;
    if (family != ip::Family::IPv6) {
        groups |= toRtnlGroupFlag(v4Group);
    }
    if (family != ip::Family::IPv4) {
        groups |= toRtnlGroupFlag(v6Group);
    }
    return groups;
}

Socket::Socket(const unsigned groups, const bool nonBlocking)
    : m_mnlSocket {openMnlSocket(nonBlocking), mnl_socket_close}
    , m_receiveBuffer(RECEIVE_SOCKET_BUFFER_SIZE)
    , m_sendBuffer(SEND_SOCKET_BUFFER_SIZE)
{
    if (groups != 0) {
        spdlog::debug("Joining rtnetlink multicast groups {:#x}", groups);
    }
    if (mnl_socket_bind(m_mnlSocket.get(), groups, MNL_SOCKET_AUTOPID) < 0) {
        throwErrno("mnl_socket_bind");
    }
    m_portid = mnl_socket_get_portid(m_mnlSocket.get());
}

auto Socket::fd() const -> int
{
    return mnl_socket_get_fd(m_mnlSocket.get());
}

void Socket::dump(const uint16_t msgType, const uint8_t family, const MessageHandler& handler)
{
    for (auto attempt = 1;; ++attempt) {
        const auto seq = sendDumpRequest(msgType, family);
        int result = MNL_CB_OK;
        while (result == MNL_CB_OK) {
            const auto length = mnl_socket_recvfrom(m_mnlSocket.get(), m_receiveBuffer.data(), m_receiveBuffer.size());
            if (length < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throwErrno("mnl_socket_recvfrom");
            }
            result = run(static_cast<std::size_t>(length), seq, handler);
        }
        if (result == MNL_CB_STOP) {
            return;
        }
        const auto err = errno;
        if (!shouldRetryDump(err) || attempt >= MAX_DUMP_ATTEMPTS) {
            throw std::system_error(err, std::system_category(), "rtnetlink dump failed");
        }
        spdlog::info("Retrying dump request of type {} after attempt {}", msgType, attempt);
        drain();
        std::this_thread::sleep_for(DUMP_RETRY_DELAY);
    }
}

auto Socket::prepareRequest(const uint16_t msgType, const uint16_t flags) -> nlmsghdr*
{
    std::fill(m_sendBuffer.begin(), m_sendBuffer.end(), 0);
    nlmsghdr* nlh = mnl_nlmsg_put_header(m_sendBuffer.data());
    nlh->nlmsg_type = msgType;
    nlh->nlmsg_flags = flags;
    return nlh;
}

auto Socket::send(nlmsghdr* nlh) -> uint32_t
{
    nlh->nlmsg_seq = nextSequenceNumber();
    if (mnl_socket_sendto(m_mnlSocket.get(), nlh, nlh->nlmsg_len) < 0) {
        throwErrno("mnl_socket_sendto");
    }
    return nlh->nlmsg_seq;
}

auto Socket::receive() -> std::optional<std::size_t>
{
    for (;;) {
        const auto length = mnl_socket_recvfrom(m_mnlSocket.get(), m_receiveBuffer.data(), m_receiveBuffer.size());
        if (length >= 0) {
            return static_cast<std::size_t>(length);
        }
        switch (errno) {
            case EINTR:
                continue;
            case EAGAIN:
                return std::nullopt;
            default:
                throwErrno("mnl_socket_recvfrom");
        }
    }
}

auto Socket::process(const std::size_t length, const uint32_t seq, const MessageHandler& handler) -> bool
{
    const auto result = run(length, seq, handler);
    if (result == MNL_CB_ERROR) {
        throwErrno("rtnetlink request");
    }
    return result == MNL_CB_OK;
}

auto Socket::sendDumpRequest(const uint16_t msgType, const uint8_t family) -> uint32_t
{
    nlmsghdr* nlh = prepareRequest(msgType, NLM_F_REQUEST | NLM_F_DUMP);
    auto* gen = static_cast<rtgenmsg*>(mnl_nlmsg_put_extra_header(nlh, sizeof(rtgenmsg)));
    gen->rtgen_family = family;
    return send(nlh);
}

auto Socket::run(const std::size_t length, const uint32_t seq, const MessageHandler& handler) -> int
{
    DispatchContext ctx {.handler = &handler, .error = nullptr};
    // notifications carry the port id of whoever caused the change
    const auto portid = seq == 0 ? 0U : m_portid;
    const auto result = mnl_cb_run(m_receiveBuffer.data(), length, seq, portid, &dispatchToHandler, &ctx);
    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }
    return result;
}

void Socket::drain()
{
    while (recv(fd(), m_receiveBuffer.data(), m_receiveBuffer.size(), MSG_DONTWAIT) > 0) {
        spdlog::trace("Drained some old messages from socket");
    }
}

auto Socket::nextSequenceNumber() -> uint32_t
{
    ++m_sequenceNumber;
    if (m_sequenceNumber == 0) {
        m_sequenceNumber = 1;  // zero is reserved for notifications
    }
    return m_sequenceNumber;
}

}  // namespace linkwatch::netlink

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <ip/Address.hpp>
#include <libmnl/libmnl.h>
#include <linux/rtnetlink.h>

namespace linkwatch::netlink
{

auto toRtnlGroupFlag(rtnetlink_groups group) -> unsigned;

/** multicast groups for @p family, or for both families if unset */
auto familyGroups(std::optional<ip::Family> family, rtnetlink_groups v4Group, rtnetlink_groups v6Group) -> unsigned;

/**
 * @brief An rtnetlink socket with its receive and send buffers.
 *
 * Every failure to talk to the kernel is reported as std::system_error.
 */
class Socket
{
  public:
    using MessageHandler = std::function<void(const nlmsghdr*)>;

    explicit Socket(unsigned groups = 0, bool nonBlocking = false);

    [[nodiscard]] auto fd() const -> int;

    /**
     * @brief Dumps a kernel table and hands every reply message to @p handler.
     *
     * Interrupted or inconsistent dumps are retried a few times with a fresh sequence number.
     */
    void dump(uint16_t msgType, uint8_t family, const MessageHandler& handler);

    /** @return a zeroed request header of @p msgType in the send buffer */
    [[nodiscard]] auto prepareRequest(uint16_t msgType, uint16_t flags) -> nlmsghdr*;

    /** @return the sequence number assigned to the request */
    auto send(nlmsghdr* nlh) -> uint32_t;

    /** @return the received length, or nullopt if a non-blocking socket has nothing pending */
    [[nodiscard]] auto receive() -> std::optional<std::size_t>;

    /**
     * @brief Runs @p handler over the messages of the last received datagram.
     *
     * @param seq expected sequence number, 0 for unsolicited notifications
     * @return false once the reply is complete
     * @throws std::system_error carrying the kernel's error if the reply is an error message
     */
    auto process(std::size_t length, uint32_t seq, const MessageHandler& handler) -> bool;

  private:
    auto sendDumpRequest(uint16_t msgType, uint8_t family) -> uint32_t;
    auto run(std::size_t length, uint32_t seq, const MessageHandler& handler) -> int;
    void drain();
    auto nextSequenceNumber() -> uint32_t;

    std::unique_ptr<mnl_socket, int (*)(mnl_socket*)> m_mnlSocket;
    std::vector<uint8_t> m_receiveBuffer;
    std::vector<uint8_t> m_sendBuffer;
    uint32_t m_portid {};
    uint32_t m_sequenceNumber {};
};
}  // namespace linkwatch::netlink

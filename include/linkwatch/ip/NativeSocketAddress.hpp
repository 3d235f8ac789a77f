// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <stdexcept>

#include <ip/Address.hpp>
#include <ip/SocketAddress.hpp>
#include <netinet/in.h>
#include <sys/socket.h>

namespace linkwatch::ip
{

/**
 * @brief The kernel's family tagged socket address.
 *
 * All members share the leading family field, so @c generic.sa_family always names the active payload.
 */
union NativeSocketAddress
{
    sockaddr generic;
    sockaddr_in v4;
    sockaddr_in6 v6;
};

class UnknownAddressFamily : public std::runtime_error
{
  public:
    explicit UnknownAddressFamily(int family);

    [[nodiscard]] auto family() const noexcept -> int { return m_family; }

  private:
    int m_family;
};

[[nodiscard]] auto nativeFamily(const NativeSocketAddress& native) -> int;

[[nodiscard]] auto toNative(const SocketAddress& address) -> NativeSocketAddress;

/** @throws UnknownAddressFamily if the tag is neither AF_INET nor AF_INET6 */
[[nodiscard]] auto fromNative(const NativeSocketAddress& native) -> SocketAddress;

[[nodiscard]] auto toInAddr(const V4Bytes& bytes) -> in_addr;
[[nodiscard]] auto fromInAddr(const in_addr& addr) -> Address;
[[nodiscard]] auto toIn6Addr(const V6Bytes& bytes) -> in6_addr;
[[nodiscard]] auto fromIn6Addr(const in6_addr& addr) -> Address;

}  // namespace linkwatch::ip

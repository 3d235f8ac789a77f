// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <algorithm>
#include <cstring>
#include <iterator>
#include <string>

#include <arpa/inet.h>
#include <ip/NativeSocketAddress.hpp>
#include <overloaded/Overloaded.hpp>

namespace linkwatch::ip
{

UnknownAddressFamily::UnknownAddressFamily(const int family)
    : std::runtime_error("Unknown address family: " + std::to_string(family))
    , m_family {family}
{
}

auto nativeFamily(const NativeSocketAddress& native) -> int
{
    return native.generic.sa_family;
}

auto toInAddr(const V4Bytes& bytes) -> in_addr
{
    in_addr addr {};
    std::memcpy(&addr.s_addr, bytes.data(), bytes.size());
    return addr;
}

auto fromInAddr(const in_addr& addr) -> Address
{
    V4Bytes bytes {};
    std::memcpy(bytes.data(), &addr.s_addr, bytes.size());
    return Address {bytes};
}

auto toIn6Addr(const V6Bytes& bytes) -> in6_addr
{
    in6_addr addr {};
    std::copy(bytes.cbegin(), bytes.cend(), std::begin(addr.s6_addr));
    return addr;
}

auto fromIn6Addr(const in6_addr& addr) -> Address
{
    V6Bytes bytes {};
    std::copy(std::cbegin(addr.s6_addr), std::cend(addr.s6_addr), bytes.begin());
    return Address {bytes};
}

auto toNative(const SocketAddress& address) -> NativeSocketAddress
{
    NativeSocketAddress native;
    std::memset(&native, 0, sizeof(native));
    std::visit(Overloaded {[&](const V4Bytes& bytes)
                           {
                               native.v4.sin_family = AF_INET;
                               native.v4.sin_port = htons(address.port());
                               native.v4.sin_addr = toInAddr(bytes);
                           },
                           [&](const V6Bytes& bytes)
                           {
                               native.v6.sin6_family = AF_INET6;
                               native.v6.sin6_port = htons(address.port());
                               native.v6.sin6_addr = toIn6Addr(bytes);
                               native.v6.sin6_flowinfo = address.flowInfo();
                               native.v6.sin6_scope_id = address.scopeId();
                           }},
               address.ip().bytes());
    return native;
}

auto fromNative(const NativeSocketAddress& native) -> SocketAddress
{
    switch (const auto family = nativeFamily(native)) {
        case AF_INET:
            return SocketAddress {fromInAddr(native.v4.sin_addr), ntohs(native.v4.sin_port)};
        case AF_INET6:
            return SocketAddress {fromIn6Addr(native.v6.sin6_addr),
                                  ntohs(native.v6.sin6_port),
                                  native.v6.sin6_flowinfo,
                                  native.v6.sin6_scope_id};
        default:
            throw UnknownAddressFamily(family);
    }
}

}  // namespace linkwatch::ip

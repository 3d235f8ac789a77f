// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <stdexcept>
#include <tuple>

#include <doctest/doctest.h>
#include <fmt/format.h>
#include <ip/Address.hpp>
#include <sys/socket.h>

namespace
{
// NOLINTBEGIN(*)

using namespace linkwatch::ip;

TEST_SUITE("[ip::Address]")
{
    const auto loopback4 = Address::fromString("127.0.0.1");
    const auto loopback6 = Address::fromString("::1");
    const auto linkLocal6 = Address::fromString("fe80::1c2f:3bff:fe00:42");
    const auto reference = Address::fromString("193.138.218.78");
    const auto unspecified = Address {};

    TEST_CASE("round trips through its text form")
    {
        CHECK(reference.toString() == "193.138.218.78");
        CHECK(linkLocal6.toString() == "fe80::1c2f:3bff:fe00:42");
        CHECK(fmt::format("{}", loopback6) == "::1");
        CHECK_THROWS_AS(std::ignore = Address::fromString("193.138.218"), std::invalid_argument);
        CHECK_THROWS_AS(std::ignore = Address::fromString(""), std::invalid_argument);
    }

    TEST_CASE("default constructed is the unspecified IPv4 address")
    {
        CHECK(unspecified.isV4());
        CHECK(unspecified.toString() == "0.0.0.0");
        CHECK(unspecified == Address::fromString("0.0.0.0"));
    }

    TEST_CASE("family")
    {
        CHECK(reference.family() == Family::IPv4);
        CHECK(linkLocal6.family() == Family::IPv6);
        CHECK(reference.isV4());
        CHECK(!reference.isV6());
        CHECK(linkLocal6.isV6());
    }

    TEST_CASE("linux address family mapping")
    {
        CHECK(asLinuxAf(Family::IPv4) == AF_INET);
        CHECK(asLinuxAf(Family::IPv6) == AF_INET6);
        CHECK(fromLinuxAf(AF_INET) == Family::IPv4);
        CHECK(fromLinuxAf(AF_INET6) == Family::IPv6);
        CHECK(fromLinuxAf(AF_UNSPEC) == std::nullopt);
        CHECK(fromLinuxAf(AF_PACKET) == std::nullopt);
        CHECK(fmt::format("{}", Family::IPv6) == "inet6");
    }

    TEST_CASE("bytes are in network order")
    {
        const auto* v4 = std::get_if<V4Bytes>(&reference.bytes());
        REQUIRE(v4 != nullptr);
        CHECK(*v4 == V4Bytes {193, 138, 218, 78});
        const auto* v6 = std::get_if<V6Bytes>(&loopback6.bytes());
        REQUIRE(v6 != nullptr);
        CHECK((*v6)[15] == 1);
    }

    TEST_CASE("ordering puts IPv4 before IPv6")
    {
        CHECK(loopback4 < reference);
        CHECK(reference < loopback6);
        CHECK(loopback6 < linkLocal6);
        CHECK(unspecified < loopback4);
        CHECK(reference != Address::fromString("::ffff:193.138.218.78"));
    }
}

// NOLINTEND(*)
}  // namespace

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <exception>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <doctest/doctest.h>
#include <readiness/InterfaceWaiter.hpp>
#include <testing/Awaitable.hpp>
#include <testing/FakeIpHelper.hpp>

namespace
{
// NOLINTBEGIN(*)

using namespace linkwatch;
using namespace linkwatch::readiness;
using linkwatch::testing::FakeIpHelper;

constexpr uint32_t TUNNEL = 5;
constexpr uint32_t OTHER = 2;

auto change(const uint32_t index, const ip::Family family, const os::ChangeKind kind) -> os::InterfaceChange
{
    return os::InterfaceChange {.interfaceIndex = index, .family = family, .kind = kind};
}

TEST_SUITE("[readiness::InterfaceWaiter]")
{
    TEST_CASE("subscribes before looking at the addresses")
    {
        boost::asio::io_context io;
        auto helper = std::make_shared<FakeIpHelper>();
        helper->addAddress(TUNNEL, "10.64.0.2");
        testing::runAwaitable(io, waitForInterfaces(helper, TUNNEL, true, false));
        CHECK(helper->journal() == std::vector<std::string> {"register", "table", "cancel"});
    }

    TEST_CASE("returns right away if all families are present")
    {
        boost::asio::io_context io;
        auto helper = std::make_shared<FakeIpHelper>();
        helper->addAddress(TUNNEL, "10.64.0.2");
        helper->addAddress(TUNNEL, "fc00:bbbb:bbbb:bb01::2");
        const auto outcome = testing::start(io, waitForInterfaces(helper, TUNNEL, true, true));
        testing::settle(io);
        CHECK(outcome->done);
        CHECK(!outcome->error);
        CHECK(helper->activeRegistrations() == 0);
    }

    TEST_CASE("addresses of other interfaces do not count")
    {
        boost::asio::io_context io;
        auto helper = std::make_shared<FakeIpHelper>();
        helper->addAddress(OTHER, "10.64.0.2");
        const auto outcome = testing::start(io, waitForInterfaces(helper, TUNNEL, true, false));
        testing::settle(io);
        CHECK(!outcome->done);
        helper->fire(change(TUNNEL, ip::Family::IPv4, os::ChangeKind::Added));
        testing::settle(io);
        CHECK(outcome->done);
    }

    TEST_CASE("resolves once every requested family was added")
    {
        boost::asio::io_context io;
        auto helper = std::make_shared<FakeIpHelper>();
        const auto outcome = testing::start(io, waitForInterfaces(helper, TUNNEL, true, true));
        testing::settle(io);
        REQUIRE(!outcome->done);
        CHECK(helper->activeRegistrations() == 1);

        helper->fire(change(TUNNEL, ip::Family::IPv4, os::ChangeKind::Added));
        testing::settle(io);
        CHECK(!outcome->done);

        helper->fire(change(OTHER, ip::Family::IPv6, os::ChangeKind::Added));
        helper->fire(change(TUNNEL, ip::Family::IPv6, os::ChangeKind::ParameterChanged));
        helper->fire(change(TUNNEL, ip::Family::IPv6, os::ChangeKind::Removed));
        testing::settle(io);
        CHECK(!outcome->done);

        helper->fire(change(TUNNEL, ip::Family::IPv6, os::ChangeKind::Added));
        testing::settle(io);
        CHECK(outcome->done);
        CHECK(!outcome->error);
        CHECK(helper->activeRegistrations() == 0);
        CHECK(helper->fire(change(TUNNEL, ip::Family::IPv6, os::ChangeKind::Added)) == 0);
    }

    TEST_CASE("a present family only leaves the missing one to wait for")
    {
        boost::asio::io_context io;
        auto helper = std::make_shared<FakeIpHelper>();
        helper->addAddress(TUNNEL, "fc00:bbbb:bbbb:bb01::2");
        const auto outcome = testing::start(io, waitForInterfaces(helper, TUNNEL, true, true));
        testing::settle(io);
        REQUIRE(!outcome->done);
        helper->fire(change(TUNNEL, ip::Family::IPv4, os::ChangeKind::Added));
        testing::settle(io);
        CHECK(outcome->done);
    }

    TEST_CASE("another address of an already present family does not resolve")
    {
        boost::asio::io_context io;
        auto helper = std::make_shared<FakeIpHelper>();
        helper->addAddress(TUNNEL, "10.64.0.2");
        const auto outcome = testing::start(io, waitForInterfaces(helper, TUNNEL, true, true));
        testing::settle(io);
        REQUIRE(!outcome->done);

        helper->fire(change(TUNNEL, ip::Family::IPv4, os::ChangeKind::Added));
        testing::settle(io);
        CHECK(!outcome->done);

        helper->fire(change(TUNNEL, ip::Family::IPv6, os::ChangeKind::Added));
        testing::settle(io);
        CHECK(outcome->done);
        CHECK(!outcome->error);
    }

    TEST_CASE("notifications ending while waiting is an error")
    {
        boost::asio::io_context io;
        auto helper = std::make_shared<FakeIpHelper>();
        helper->addAddress(TUNNEL, "10.64.0.2");
        const auto outcome = testing::start(io, waitForInterfaces(helper, TUNNEL, true, true));
        testing::settle(io);
        REQUIRE(!outcome->done);

        auto ended = change(0, ip::Family::IPv4, os::ChangeKind::Other);
        ended.error = std::make_error_code(std::errc::connection_aborted);
        helper->fire(ended);
        testing::settle(io);
        REQUIRE(outcome->done);
        REQUIRE(outcome->error);
        try {
            std::rethrow_exception(outcome->error);
        } catch (const std::system_error& e) {
            CHECK(e.code() == std::make_error_code(std::errc::connection_aborted));
        }
        CHECK(helper->activeRegistrations() == 0);
    }

    TEST_CASE("unrequested families are ignored")
    {
        boost::asio::io_context io;
        auto helper = std::make_shared<FakeIpHelper>();
        const auto outcome = testing::start(io, waitForInterfaces(helper, TUNNEL, false, true));
        testing::settle(io);
        helper->fire(change(TUNNEL, ip::Family::IPv4, os::ChangeKind::Added));
        testing::settle(io);
        CHECK(!outcome->done);
        helper->fire(change(TUNNEL, ip::Family::IPv6, os::ChangeKind::Added));
        testing::settle(io);
        CHECK(outcome->done);
    }

    TEST_CASE("OS errors are reported")
    {
        boost::asio::io_context io;
        auto helper = std::make_shared<FakeIpHelper>();

        SUBCASE("registration")
        {
            helper->failRegistration(std::errc::resource_unavailable_try_again);
            CHECK_THROWS_AS(testing::runAwaitable(io, waitForInterfaces(helper, TUNNEL, true, true)),
                            std::system_error);
        }

        SUBCASE("address table")
        {
            helper->failTable(std::errc::no_buffer_space);
            CHECK_THROWS_AS(testing::runAwaitable(io, waitForInterfaces(helper, TUNNEL, true, true)),
                            std::system_error);
            CHECK(helper->activeRegistrations() == 0);
        }
    }
}

// NOLINTEND(*)
}  // namespace

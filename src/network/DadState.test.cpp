// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <doctest/doctest.h>
#include <fmt/format.h>
#include <linux/if_addr.h>
#include <network/DadState.hpp>
#include <network/UnicastAddress.hpp>

namespace
{
// NOLINTBEGIN(*)

using namespace linkwatch;
using namespace linkwatch::network;
using Kind = DadState::Kind;

TEST_SUITE("[network::DadState]")
{
    TEST_CASE("raw codes")
    {
        CHECK(DadState::fromRaw(0).kind() == Kind::Invalid);
        CHECK(DadState::fromRaw(1).kind() == Kind::Tentative);
        CHECK(DadState::fromRaw(2).kind() == Kind::Duplicate);
        CHECK(DadState::fromRaw(3).kind() == Kind::Deprecated);
        CHECK(DadState::fromRaw(4).kind() == Kind::Preferred);
        const auto unknown = DadState::fromRaw(17);
        CHECK(unknown.kind() == Kind::Unknown);
        CHECK(unknown.raw() == 17);
        CHECK(unknown != DadState::fromRaw(18));
        CHECK(fmt::format("{}", unknown) == "Unknown(17)");
    }

    TEST_CASE("only preferred is usable, only tentative is pending")
    {
        CHECK(DadState {Kind::Preferred}.isUsable());
        CHECK(!DadState {Kind::Preferred}.isFailure());
        CHECK(DadState {Kind::Tentative}.isPending());
        CHECK(!DadState {Kind::Tentative}.isFailure());
        for (const auto kind : {Kind::Invalid, Kind::Duplicate, Kind::Deprecated, Kind::Unknown}) {
            CAPTURE(kind);
            CHECK(DadState {kind}.isFailure());
            CHECK(!DadState {kind}.isUsable());
            CHECK(!DadState {kind}.isPending());
        }
    }

    TEST_CASE("derived from address flags")
    {
        CHECK(DadState::fromAddressFlags(IFA_F_PERMANENT).kind() == Kind::Preferred);
        CHECK(DadState::fromAddressFlags(IFA_F_NODAD).kind() == Kind::Preferred);
        CHECK(DadState::fromAddressFlags(IFA_F_TENTATIVE | IFA_F_PERMANENT).kind() == Kind::Tentative);
        CHECK(DadState::fromAddressFlags(IFA_F_TENTATIVE | IFA_F_DADFAILED).kind() == Kind::Duplicate);
        CHECK(DadState::fromAddressFlags(IFA_F_DEPRECATED).kind() == Kind::Deprecated);
    }

    TEST_CASE("unicast entries match on interface and address only")
    {
        const auto ip = ip::Address::fromString("fd00::2");
        const UnicastAddressEntry tentative {4, Address {ip, 64}, DadState {Kind::Tentative}};
        const UnicastAddressEntry preferred {4, Address {ip, 64}, DadState {Kind::Preferred}};
        const UnicastAddressEntry elsewhere {5, Address {ip, 64}, DadState {Kind::Preferred}};
        CHECK(tentative.sameAddressAs(preferred));
        CHECK(!preferred.sameAddressAs(elsewhere));
        CHECK(tentative != preferred);
        CHECK(tentative.family() == Family::IPv6);
    }
}

// NOLINTEND(*)
}  // namespace

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <ostream>

#include <linux/if_addr.h>
#include <network/DadState.hpp>

namespace linkwatch::network
{

auto DadState::fromRaw(const uint32_t raw) -> DadState
{
    if (raw < static_cast<uint32_t>(Kind::Unknown)) {
        return DadState {static_cast<Kind>(raw)};
    }
    return DadState {Kind::Unknown, raw};
}

auto DadState::fromAddressFlags(const uint32_t ifaFlags) -> DadState
{
    // a failed detection keeps the tentative flag set, so check it first
    if ((ifaFlags & IFA_F_DADFAILED) != 0) {
        return DadState {Kind::Duplicate};
    }
    if ((ifaFlags & IFA_F_TENTATIVE) != 0) {
        return DadState {Kind::Tentative};
    }
    if ((ifaFlags & IFA_F_DEPRECATED) != 0) {
        return DadState {Kind::Deprecated};
    }
    return DadState {Kind::Preferred};
}

auto operator<<(std::ostream& o, const DadState::Kind k) -> std::ostream&
{
    using enum DadState::Kind;
    switch (k) {
        case Invalid:
            return o << "Invalid";
        case Tentative:
            return o << "Tentative";
        case Duplicate:
            return o << "Duplicate";
        case Deprecated:
            return o << "Deprecated";
        case Preferred:
            return o << "Preferred";
        case Unknown:
        default:
            return o << "Unknown";
    }
}

auto operator<<(std::ostream& o, const DadState& s) -> std::ostream&
{
    if (s.kind() == DadState::Kind::Unknown) {
        return o << "Unknown(" << s.raw() << ")";
    }
    return o << s.kind();
}

}  // namespace linkwatch::network

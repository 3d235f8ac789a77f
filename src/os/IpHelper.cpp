// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <ostream>

#include <os/IpHelper.hpp>

namespace linkwatch::os
{

auto operator<<(std::ostream& o, const ChangeKind k) -> std::ostream&
{
    using enum ChangeKind;
    switch (k) {
        case Added:
            return o << "added";
        case Removed:
            return o << "removed";
        case ParameterChanged:
            return o << "parameter changed";
        case Other:
        default:
            return o << "other";
    }
}

auto operator<<(std::ostream& o, const InterfaceChange& c) -> std::ostream&
{
    if (c.error) {
        return o << "notifications ended: " << c.error.message();
    }
    return o << c.interfaceIndex << ": " << c.family << " " << c.kind;
}

auto operator<<(std::ostream& o, const IpInterfaceEntry& e) -> std::ostream&
{
    return o << e.interfaceIndex << ": " << e.family << " mtu " << e.mtu << " forwarding "
             << (e.forwarding ? "on" : "off");
}

}  // namespace linkwatch::os

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <ostream>

#include <monitor/RouteManager.hpp>

namespace linkwatch::monitor
{

RouteManagerError::RouteManagerError(const std::string& what)
    : std::runtime_error {what}
{
}

RouteManagerError::RouteManagerError(const std::string& what, const std::error_code osError)
    : std::runtime_error {what + ": " + osError.message()}
    , m_osError {osError}
{
}

auto operator<<(std::ostream& o, const Route& r) -> std::ostream&
{
    o << "dev " << r.interfaceIndex;
    if (r.gateway) {
        o << " via " << *r.gateway;
    }
    return o;
}

auto operator<<(std::ostream& o, const RouteChangeKind k) -> std::ostream&
{
    switch (k) {
        case RouteChangeKind::Added:
            return o << "added";
        case RouteChangeKind::Removed:
        default:
            return o << "removed";
    }
}

auto operator<<(std::ostream& o, const RouteChange& c) -> std::ostream&
{
    o << c.kind << " " << c.family << " route to ";
    if (c.destination) {
        return o << *c.destination << "/" << static_cast<int>(c.prefixLength);
    }
    return o << "default";
}

}  // namespace linkwatch::monitor

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <ostream>

#include <fmt/format.h>
#include <readiness/DeviceError.hpp>

namespace linkwatch::readiness
{

auto operator<<(std::ostream& o, const DeviceErrorKind k) -> std::ostream&
{
    using enum DeviceErrorKind;
    switch (k) {
        case NoUnicastAddress:
            return o << "no unicast address";
        case ObtainUnicastAddress:
            return o << "failed to obtain unicast address";
        case DadState:
            return o << "unexpected DAD state";
        case DeviceReadyTimeout:
            return o << "timed out waiting for device to become ready";
        case SenderDropped:
            return o << "result sender dropped";
        default:
            return o << "unknown device error";
    }
}

DeviceError::DeviceError(const DeviceErrorKind kind)
    : std::runtime_error {fmt::format("{}", kind)}
    , m_kind {kind}
{
}

DeviceError::DeviceError(const std::error_code osError)
    : std::runtime_error {fmt::format("{}: {}", DeviceErrorKind::ObtainUnicastAddress, osError.message())}
    , m_kind {DeviceErrorKind::ObtainUnicastAddress}
    , m_osError {osError}
{
}

DeviceError::DeviceError(const network::DadState state)
    : std::runtime_error {fmt::format("{}: {}", DeviceErrorKind::DadState, state)}
    , m_kind {DeviceErrorKind::DadState}
    , m_dadState {state}
{
}

auto DeviceError::isRetryable() const -> bool
{
    using enum DeviceErrorKind;
    return m_kind == DeviceReadyTimeout || m_kind == ObtainUnicastAddress || m_kind == SenderDropped;
}

}  // namespace linkwatch::readiness

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <system_error>

#include <fmt/ostream.h>
#include <network/DadState.hpp>

namespace linkwatch::readiness
{

enum class DeviceErrorKind : uint8_t
{
    NoUnicastAddress,
    ObtainUnicastAddress,
    DadState,
    DeviceReadyTimeout,
    SenderDropped,
};
auto operator<<(std::ostream& o, DeviceErrorKind k) -> std::ostream&;

/** Why an interface's addresses could not be confirmed usable. */
class DeviceError : public std::runtime_error
{
  public:
    explicit DeviceError(DeviceErrorKind kind);
    /** the OS failed to report an address */
    explicit DeviceError(std::error_code osError);
    /** an address reached a terminal state other than Preferred */
    explicit DeviceError(network::DadState state);

    [[nodiscard]] auto kind() const -> DeviceErrorKind { return m_kind; }

    [[nodiscard]] auto osError() const -> std::optional<std::error_code> { return m_osError; }

    [[nodiscard]] auto dadState() const -> std::optional<network::DadState> { return m_dadState; }

    /** true if checking again later may succeed */
    [[nodiscard]] auto isRetryable() const -> bool;

  private:
    DeviceErrorKind m_kind;
    std::optional<std::error_code> m_osError;
    std::optional<network::DadState> m_dadState;
};

}  // namespace linkwatch::readiness

template<>
struct fmt::formatter<linkwatch::readiness::DeviceErrorKind> : ostream_formatter
{
};

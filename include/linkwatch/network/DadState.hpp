// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstdint>
#include <iosfwd>

#include <fmt/ostream.h>

namespace linkwatch::network
{

/**
 * @brief Duplicate address detection state of a unicast address.
 *
 * Only Preferred means the address is usable. Tentative means detection is still running. Every other state is
 * terminal. Unknown keeps the raw code it was created from.
 */
class DadState
{
  public:
    enum class Kind : uint8_t
    {
        Invalid,
        Tentative,
        Duplicate,
        Deprecated,
        Preferred,
        Unknown,
    };

    constexpr DadState() = default;

    constexpr explicit DadState(const Kind kind)
        : m_kind {kind}
        , m_raw {kind == Kind::Unknown ? UNKNOWN_RAW : static_cast<uint32_t>(kind)}
    {
    }

    /** Raw codes: Invalid=0, Tentative=1, Duplicate=2, Deprecated=3, Preferred=4. Anything else is Unknown. */
    [[nodiscard]] static auto fromRaw(uint32_t raw) -> DadState;

    /** @param ifaFlags the kernel's IFA_F_* bits of an address */
    [[nodiscard]] static auto fromAddressFlags(uint32_t ifaFlags) -> DadState;

    [[nodiscard]] constexpr auto kind() const -> Kind { return m_kind; }

    [[nodiscard]] constexpr auto raw() const -> uint32_t { return m_raw; }

    [[nodiscard]] constexpr auto isUsable() const -> bool { return m_kind == Kind::Preferred; }

    [[nodiscard]] constexpr auto isPending() const -> bool { return m_kind == Kind::Tentative; }

    [[nodiscard]] constexpr auto isFailure() const -> bool { return !isUsable() && !isPending(); }

    [[nodiscard]] constexpr auto operator==(const DadState& other) const -> bool = default;

  private:
    static constexpr uint32_t UNKNOWN_RAW = 0xffffffffU;

    constexpr DadState(const Kind kind, const uint32_t raw)
        : m_kind {kind}
        , m_raw {raw}
    {
    }

    Kind m_kind {Kind::Invalid};
    uint32_t m_raw {};
};

auto operator<<(std::ostream& o, DadState::Kind k) -> std::ostream&;
auto operator<<(std::ostream& o, const DadState& s) -> std::ostream&;

}  // namespace linkwatch::network

template<>
struct fmt::formatter<linkwatch::network::DadState> : ostream_formatter
{
};

template<>
struct fmt::formatter<linkwatch::network::DadState::Kind> : ostream_formatter
{
};

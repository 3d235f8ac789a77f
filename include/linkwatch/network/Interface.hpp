// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <compare>
#include <cstdint>
#include <iosfwd>
#include <string>

#include <fmt/ostream.h>

namespace linkwatch::network
{
/** A network interface, identified by its kernel index; the name is informational. */
class Interface
{
  public:
    Interface() = default;
    Interface(std::uint32_t index, std::string name);

    /** @throws std::system_error if no interface with that name exists */
    [[nodiscard]] static auto fromName(std::string name) -> Interface;
    /** @throws std::system_error if no interface with that index exists */
    [[nodiscard]] static auto fromIndex(std::uint32_t index) -> Interface;

    [[nodiscard]] constexpr auto index() const -> uint32_t { return m_index; }

    [[nodiscard]] constexpr auto name() const -> const std::string& { return m_name; }

    [[nodiscard]] constexpr auto operator<=>(const Interface& other) const noexcept -> std::strong_ordering
    {
        return m_index <=> other.m_index;
    }

    [[nodiscard]] constexpr auto operator==(const Interface& other) const -> bool { return m_index == other.m_index; };

  private:
    uint32_t m_index {};
    std::string m_name;
};

auto operator<<(std::ostream& os, const Interface& iface) -> std::ostream&;

}  // namespace linkwatch::network

template<>
struct fmt::formatter<linkwatch::network::Interface> : ostream_formatter
{
};

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <ip/Address.hpp>
#include <libmnl/libmnl.h>

namespace linkwatch::netlink
{

/** Attribute table of one rtnetlink message, indexed by attribute type. */
class Attributes
{
  public:
    static auto parse(const nlmsghdr* n, uint32_t offset, uint16_t maxType) -> Attributes;

    ~Attributes() = default;
    Attributes(const Attributes&) = default;
    Attributes(Attributes&&) = default;
    auto operator=(const Attributes&) -> Attributes& = default;
    auto operator=(Attributes&&) -> Attributes& = default;

    [[nodiscard]] auto getU32(uint16_t type) const -> std::optional<uint32_t>;
    [[nodiscard]] auto getIpV4Address(uint16_t type) const -> std::optional<ip::Address>;
    [[nodiscard]] auto getIpV6Address(uint16_t type) const -> std::optional<ip::Address>;
    [[nodiscard]] auto getIpAddress(uint16_t type, ip::Family family) const -> std::optional<ip::Address>;

  private:
    explicit Attributes(std::size_t toAlloc);

    void parseAttribute(const nlattr* a);
    static auto dispatchMnlAttributeCallback(const nlattr* attr, void* self) -> int;

    std::vector<const nlattr*> m_attributes;
};
}  // namespace linkwatch::netlink

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <cerrno>
#include <cstring>

#include <ip/NativeSocketAddress.hpp>
#include <libmnl/libmnl.h>
#include <linux/netlink.h>
#include <netlink/Attributes.hpp>
#include <spdlog/spdlog.h>

namespace linkwatch::netlink
{
namespace
{

using Attrs = std::vector<const nlattr*>;

template<typename T>
[[nodiscard]] auto getTypedAttribute(const Attrs& attrs,
                                     const uint16_t type,
                                     const mnl_attr_data_type mnlType,
                                     T (*getter)(const nlattr*)) -> std::optional<T>
{
    if (type >= attrs.size() || attrs[type] == nullptr) {
        return std::nullopt;
    }
    const auto* attr = attrs[type];
    if (mnl_attr_validate(attr, mnlType) < 0) {
        spdlog::warn("attribute of type {} is invalid", type);
        return std::nullopt;
    }
    return getter(attr);
}

// copies the payload into a kernel address struct if the length matches exactly
template<typename Native>
[[nodiscard]] auto getNative(const Attrs& attrs, const uint16_t type) -> std::optional<Native>
{
    if (type >= attrs.size() || attrs[type] == nullptr) {
        return std::nullopt;
    }
    const auto* attr = attrs[type];
    if (mnl_attr_validate2(attr, MNL_TYPE_UNSPEC, sizeof(Native)) < 0) {
        spdlog::trace(
            "payload of type {} has len {} != {}", type, mnl_attr_get_payload_len(attr), sizeof(Native));
        return std::nullopt;
    }
    Native native {};
    std::memcpy(&native, mnl_attr_get_payload(attr), sizeof(Native));
    return native;
}

}  // namespace

auto Attributes::parse(const nlmsghdr* n, const uint32_t offset, const uint16_t maxType) -> Attributes
{
    Attributes attributes {maxType + 1U};
    mnl_attr_parse(n, offset, &Attributes::dispatchMnlAttributeCallback, &attributes);
    return attributes;
}

Attributes::Attributes(const std::size_t toAlloc)
    : m_attributes(toAlloc, nullptr)
{
}

void Attributes::parseAttribute(const nlattr* a)
{
    const auto type = mnl_attr_get_type(a);
    const auto maxType = static_cast<uint16_t>(m_attributes.size() - 1U);
    const auto typeValid = mnl_attr_type_valid(a, maxType);
    if (typeValid > 0) {
        m_attributes[type] = a;
        return;
    }
    if (typeValid < 0) {
        const auto err = errno;
        spdlog::trace("skipping nlattr type 0x{:04x}: {}", type, std::strerror(err));
    }
}

auto Attributes::dispatchMnlAttributeCallback(const nlattr* attr, void* self) -> int
{
    static_cast<Attributes*>(self)->parseAttribute(attr);
    return MNL_CB_OK;
}

auto Attributes::getU32(const uint16_t type) const -> std::optional<uint32_t>
{
    return getTypedAttribute<uint32_t>(m_attributes, type, MNL_TYPE_U32, mnl_attr_get_u32);
}

auto Attributes::getIpV4Address(const uint16_t type) const -> std::optional<ip::Address>
{
    return getNative<in_addr>(m_attributes, type).transform([](const in_addr& addr) { return ip::fromInAddr(addr); });
}

auto Attributes::getIpV6Address(const uint16_t type) const -> std::optional<ip::Address>
{
    return getNative<in6_addr>(m_attributes, type).transform([](const in6_addr& addr) { return ip::fromIn6Addr(addr); });
}

auto Attributes::getIpAddress(const uint16_t type, const ip::Family family) const -> std::optional<ip::Address>
{
    return family == ip::Family::IPv4 ? getIpV4Address(type) : getIpV6Address(type);
}
}  // namespace linkwatch::netlink

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <cerrno>
#include <deque>
#include <system_error>
#include <utility>
#include <variant>

#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <linux/rtnetlink.h>
#include <monitor/NetlinkRouteManager.hpp>
#include <netlink/Attributes.hpp>
#include <netlink/Socket.hpp>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace linkwatch::monitor
{
namespace
{

auto isNoRoute(const std::error_code& ec) -> bool
{
    switch (ec.value()) {
        case ENETUNREACH:
        case EHOSTUNREACH:
        case ENETDOWN:
            return true;
        default:
            break;
    }
    return false;
}

// the descriptor owns a duplicate, the socket keeps its own
auto watchSocket(const boost::asio::any_io_executor& executor, const netlink::Socket& socket)
    -> boost::asio::posix::stream_descriptor
{
    const auto fd = dup(socket.fd());
    if (fd < 0) {
        const auto err = errno;
        throw RouteManagerError {"dup", std::error_code {err, std::system_category()}};
    }
    return boost::asio::posix::stream_descriptor {executor, fd};
}

auto waitReadable(boost::asio::posix::stream_descriptor& stream) -> boost::asio::awaitable<boost::system::error_code>
{
    boost::system::error_code ec;
    co_await stream.async_wait(boost::asio::posix::stream_descriptor::wait_read,
                               boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return ec;
}

void putRouteQuery(nlmsghdr* nlh, const ip::Address& destination, const std::optional<uint32_t> mark)
{
    auto* rtm = static_cast<rtmsg*>(mnl_nlmsg_put_extra_header(nlh, sizeof(rtmsg)));
    rtm->rtm_family = static_cast<uint8_t>(ip::asLinuxAf(destination.family()));
    std::visit(
        [nlh, rtm](const auto& bytes) {
            rtm->rtm_dst_len = static_cast<uint8_t>(bytes.size() * 8U);
            mnl_attr_put(nlh, RTA_DST, bytes.size(), bytes.data());
        },
        destination.bytes());
    if (mark) {
        mnl_attr_put_u32(nlh, RTA_MARK, *mark);
    }
}

auto parseRoute(const nlmsghdr* n) -> std::optional<Route>
{
    const auto* rtm = static_cast<const rtmsg*>(mnl_nlmsg_get_payload(n));
    if (rtm->rtm_type != RTN_UNICAST && rtm->rtm_type != RTN_LOCAL) {
        spdlog::trace("route of type {} does not lead anywhere", rtm->rtm_type);
        return std::nullopt;
    }
    const auto family = ip::fromLinuxAf(rtm->rtm_family);
    if (!family) {
        return std::nullopt;
    }
    const auto attributes = netlink::Attributes::parse(n, sizeof(*rtm), RTA_MAX);
    return Route {
        .gateway = attributes.getIpAddress(RTA_GATEWAY, *family),
        .interfaceIndex = attributes.getU32(RTA_OIF).value_or(0),
    };
}

auto parseRouteChange(const nlmsghdr* n) -> std::optional<RouteChange>
{
    if (n->nlmsg_type != RTM_NEWROUTE && n->nlmsg_type != RTM_DELROUTE) {
        return std::nullopt;
    }
    const auto* rtm = static_cast<const rtmsg*>(mnl_nlmsg_get_payload(n));
    const auto family = ip::fromLinuxAf(rtm->rtm_family);
    if (!family) {
        return std::nullopt;
    }
    const auto attributes = netlink::Attributes::parse(n, sizeof(*rtm), RTA_MAX);
    return RouteChange {
        .kind = n->nlmsg_type == RTM_NEWROUTE ? RouteChangeKind::Added : RouteChangeKind::Removed,
        .family = *family,
        .destination = attributes.getIpAddress(RTA_DST, *family),
        .prefixLength = rtm->rtm_dst_len,
    };
}

class NetlinkRouteChangeListener final : public RouteChangeListener
{
  public:
    explicit NetlinkRouteChangeListener(const boost::asio::any_io_executor& executor)
        : m_socket {netlink::familyGroups(std::nullopt, RTNLGRP_IPV4_ROUTE, RTNLGRP_IPV6_ROUTE), true}
        , m_stream {watchSocket(executor, m_socket)}
    {
    }

    auto next() -> boost::asio::awaitable<std::optional<RouteChange>> override
    {
        while (m_pending.empty()) {
            if (const auto ec = co_await waitReadable(m_stream)) {
                if (ec == boost::asio::error::operation_aborted) {
                    co_return std::nullopt;
                }
                throw RouteManagerError {"waiting for route changes", std::error_code {ec.value(), std::system_category()}};
            }
            receivePending();
        }
        auto change = std::move(m_pending.front());
        m_pending.pop_front();
        co_return change;
    }

  private:
    void receivePending()
    {
        try {
            while (const auto length = m_socket.receive()) {
                m_socket.process(*length, 0, [this](const nlmsghdr* n) {
                    if (auto change = parseRouteChange(n)) {
                        m_pending.push_back(std::move(*change));
                    }
                });
            }
        } catch (const std::system_error& e) {
            if (e.code().value() != ENOBUFS) {
                throw RouteManagerError {"receiving route changes", e.code()};
            }
            // changes were lost, have the caller look again
            spdlog::warn("route notifications were lost: {}", e.what());
            m_pending.push_back(RouteChange {});
        }
    }

    netlink::Socket m_socket;
    boost::asio::posix::stream_descriptor m_stream;
    std::deque<RouteChange> m_pending;
};

}  // namespace

NetlinkRouteManager::NetlinkRouteManager(boost::asio::any_io_executor executor, const std::optional<uint32_t> fwmark)
    : m_executor {std::move(executor)}
    , m_fwmark {fwmark}
{
}

auto NetlinkRouteManager::getDestinationRoute(const ip::Address& destination, const bool bypassTunnel)
    -> boost::asio::awaitable<std::optional<Route>>
{
    try {
        netlink::Socket socket {0, true};
        auto stream = watchSocket(m_executor, socket);
        auto* nlh = socket.prepareRequest(RTM_GETROUTE, NLM_F_REQUEST | NLM_F_ACK);
        putRouteQuery(nlh, destination, bypassTunnel ? m_fwmark : std::nullopt);
        const auto seq = socket.send(nlh);

        std::optional<Route> route;
        const auto collect = [&route](const nlmsghdr* n) {
            if (n->nlmsg_type == RTM_NEWROUTE) {
                route = parseRoute(n);
            }
        };
        for (bool more = true; more;) {
            if (const auto ec = co_await waitReadable(stream)) {
                throw RouteManagerError {"waiting for route reply", std::error_code {ec.value(), std::system_category()}};
            }
            if (const auto length = socket.receive()) {
                more = socket.process(*length, seq, collect);
            }
        }
        spdlog::trace("route lookup for {}: {}", destination, route ? fmt::format("{}", *route) : "none");
        co_return route;
    } catch (const std::system_error& e) {
        if (isNoRoute(e.code())) {
            spdlog::debug("no route to {}: {}", destination, e.what());
            co_return std::nullopt;
        }
        throw RouteManagerError {fmt::format("route lookup for {}", destination), e.code()};
    }
}

auto NetlinkRouteManager::changeListener() -> boost::asio::awaitable<std::unique_ptr<RouteChangeListener>>
{
    try {
        co_return std::make_unique<NetlinkRouteChangeListener>(m_executor);
    } catch (const std::system_error& e) {
        throw RouteManagerError {"subscribing to route changes", e.code()};
    }
}

}  // namespace linkwatch::monitor

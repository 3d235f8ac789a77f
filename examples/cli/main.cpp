#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <system_error>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/this_coro.hpp>
#include <gflags/gflags.h>
#include <monitor/ConnectivityMonitor.hpp>
#include <monitor/NetlinkRouteManager.hpp>
#include <monitor/TunnelCommand.hpp>
#include <network/Interface.hpp>
#include <os/NetlinkIpHelper.hpp>
#include <readiness/AddressReadinessChecker.hpp>
#include <readiness/InterfaceWaiter.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

DEFINE_bool(log_to_file, false, "Enable logging to file");
DEFINE_string(log_level, "info", "Set log level: trace, debug, info, warn, err, critical, off");

DEFINE_string(interface, "", "Wait for this interface to become ready before monitoring connectivity");
DEFINE_bool(ipv4, true, "Wait for an IPv4 address on --interface");
DEFINE_bool(ipv6, false, "Wait for an IPv6 address on --interface");

DEFINE_uint32(dad_timeout_ms, 5000, "How long addresses may stay tentative, in ms");
DEFINE_uint32(dad_interval_ms, 100, "Delay between DAD state polls, in ms, at least 10");
DEFINE_validator(dad_interval_ms, [](const char* /*flagname*/, const uint32_t value) -> bool { return value >= 10; });

DEFINE_uint32(fwmark, 0, "Firewall mark of traffic bypassing the tunnel, 0 for none");

DEFINE_uint32(mtu, 0, "Set this MTU on --interface once it is ready, 0 to leave it alone");
DEFINE_validator(mtu, [](const char* /*flagname*/, const uint32_t value) -> bool { return value == 0 || value >= 576; });

DEFINE_bool(exit_after_setup, false, "Exit once the interface is ready and connectivity was checked");

// NOLINTNEXTLINE(google-build-*)
using namespace linkwatch;

namespace
{

void setupLogging()
{
    std::ranges::transform(FLAGS_log_level, FLAGS_log_level.begin(), ::tolower);
    if (const auto level = spdlog::level::from_str(FLAGS_log_level);
        level == spdlog::level::off && FLAGS_log_level != "off")
    {
        SPDLOG_ERROR("invalid log level '{}', using 'info' instead", FLAGS_log_level);
        spdlog::set_level(spdlog::level::info);
    } else {
        spdlog::set_level(level);
    }

    if (FLAGS_log_to_file) {
        const auto logFileName = fmt::format("/tmp/linkwatch-{}.log", getpid());
        // Let the user know where to find the log file before switching to file logging
        spdlog::info("Logging to {}", logFileName);
        auto logger = spdlog::basic_logger_mt("linkwatch", logFileName, true);
        logger->flush_on(spdlog::level::critical);
        logger->set_level(spdlog::get_level());
        spdlog::set_default_logger(logger);
    }

    constexpr auto FLUSH_EVERY = std::chrono::seconds(10);
    spdlog::flush_every(FLUSH_EVERY);
}

void logIpInterface(os::IpHelper& helper, const ip::Family family, const network::Interface& iface)
{
    try {
        spdlog::info("{}", helper.ipInterfaceEntry(family, iface.index()));
    } catch (const std::system_error& e) {
        spdlog::warn("no {} parameters for {}: {}", family, iface, e.what());
    }
}

auto prepareInterface(std::shared_ptr<os::IpHelper> helper, network::Interface iface) -> boost::asio::awaitable<void>
{
    co_await readiness::waitForInterfaces(helper, iface.index(), FLAGS_ipv4, FLAGS_ipv6);
    spdlog::info("{} has its addresses", iface);

    const readiness::DadCheckTimings timings {.timeout = std::chrono::milliseconds {FLAGS_dad_timeout_ms},
                                              .interval = std::chrono::milliseconds {FLAGS_dad_interval_ms}};
    co_await readiness::waitForAddresses(helper, iface.index(), timings);
    spdlog::info("{} passed duplicate address detection", iface);

    if (FLAGS_mtu != 0) {
        auto entry = helper->ipInterfaceEntry(ip::Family::IPv4, iface.index());
        entry.mtu = FLAGS_mtu;
        helper->setIpInterfaceEntry(entry);
    }
    if (FLAGS_ipv4) {
        logIpInterface(*helper, ip::Family::IPv4, iface);
    }
    if (FLAGS_ipv6) {
        logIpInterface(*helper, ip::Family::IPv6, iface);
    }
}

auto run(std::shared_ptr<monitor::TunnelCommandSender> sender, boost::asio::signal_set& signals)
    -> boost::asio::awaitable<void>
{
    auto executor = co_await boost::asio::this_coro::executor;
    auto helper = std::make_shared<os::NetlinkIpHelper>();

    if (!FLAGS_interface.empty()) {
        const auto iface = network::Interface::fromName(FLAGS_interface);
        try {
            co_await prepareInterface(helper, iface);
        } catch (const readiness::DeviceError& e) {
            spdlog::error("{} is not ready: {}{}", iface, e.what(), e.isRetryable() ? ", try again later" : "");
            signals.cancel();
            co_return;
        }
    }

    const auto fwmark = FLAGS_fwmark != 0 ? std::optional<uint32_t> {FLAGS_fwmark} : std::nullopt;
    auto routes = std::make_shared<monitor::NetlinkRouteManager>(executor, fwmark);
    const auto connectivity = co_await monitor::ConnectivityMonitor::spawn(sender, routes);
    spdlog::info("currently {}", co_await connectivity->isOffline() ? "offline" : "online");
    if (FLAGS_exit_after_setup) {
        signals.cancel();
        co_return;
    }
}

}  // namespace

/**
 * @brief Runs the connectivity monitor CLI application.
 *
 * Optionally waits for an interface to get its addresses and pass duplicate address detection, then reports every
 * change of the host's connectivity until interrupted.
 */
auto main(int argc, char* argv[]) -> int
{
    gflags::SetUsageMessage("<flags>\n");
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    setupLogging();

    boost::asio::io_context io;
    auto sender = std::make_shared<monitor::PostingCommandSender>(
        io.get_executor(), [](const monitor::TunnelCommand& command) { spdlog::info("tunnel command: {}", command); });

    boost::asio::signal_set signals {io, SIGINT, SIGTERM};
    signals.async_wait([&io, &sender](const boost::system::error_code& ec, const int signalNumber) {
        if (!ec) {
            spdlog::info("received signal {}, exiting", signalNumber);
        }
        // the monitor stops with the sender
        sender.reset();
        io.stop();
    });

    int exitCode = EXIT_SUCCESS;
    boost::asio::co_spawn(io, run(sender, signals), [&exitCode, &signals](const std::exception_ptr& error) {
        if (!error) {
            return;
        }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            spdlog::critical("{}", e.what());
            exitCode = EXIT_FAILURE;
            signals.cancel();
        }
    });
    io.run();
    spdlog::shutdown();
    gflags::ShutDownCommandLineFlags();
    return exitCode;
}

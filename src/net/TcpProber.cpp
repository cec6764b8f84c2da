#include "net/Prober.hpp"
#include "log/Registry.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <filesystem>
#include <string>

using boost::asio::ip::tcp;

namespace gitsync::net {

TcpProber::TcpProber(const std::chrono::milliseconds timeout) : timeout_(timeout) {}

bool TcpProber::reachable(const Endpoint& ep) noexcept {
    if (ep.local) {
        std::error_code ec;
        const bool ok = std::filesystem::exists(ep.path, ec);
        if (!ok && log::Registry::isInitialized())
            log::Registry::net()->debug("[Prober] Local remote {} does not exist", ep.path.string());
        return ok;
    }

    const bool ok = probe(ep.host, ep.port, timeout_);
    if (log::Registry::isInitialized())
        log::Registry::net()->debug("[Prober] {} is {}", ep.str(), ok ? "reachable" : "unreachable");
    return ok;
}

bool TcpProber::probe(const std::string& host, const uint16_t port, const std::chrono::milliseconds timeout) noexcept {
    if (host.empty() || port == 0) return false;

    try {
        boost::asio::io_context io;
        tcp::resolver resolver(io);
        tcp::socket socket(io);
        bool connected = false;

        resolver.async_resolve(host, std::to_string(port),
            [&](const boost::system::error_code& ec, const tcp::resolver::results_type& results) {
                if (ec) return;
                boost::asio::async_connect(socket, results,
                    [&](const boost::system::error_code& cec, const tcp::endpoint&) {
                        if (!cec) connected = true;
                    });
            });

        // Deadline covers resolution and connection together
        io.run_for(timeout);

        if (!connected) {
            resolver.cancel();
            boost::system::error_code ignored;
            socket.close(ignored);
        }
        return connected;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized())
            log::Registry::net()->debug("[Prober] Probe of {}:{} failed: {}", host, port, e.what());
        return false;
    }
}

}

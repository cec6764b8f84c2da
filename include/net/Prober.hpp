#pragma once

#include "net/Endpoint.hpp"

#include <chrono>
#include <string>

namespace gitsync::net {

class Prober {
public:
    virtual ~Prober() = default;

    // true only when the endpoint accepted a connection in time; never throws
    [[nodiscard]] virtual bool reachable(const Endpoint& ep) noexcept = 0;
};

class TcpProber final : public Prober {
public:
    explicit TcpProber(std::chrono::milliseconds timeout);

    [[nodiscard]] bool reachable(const Endpoint& ep) noexcept override;

    static bool probe(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) noexcept;

private:
    std::chrono::milliseconds timeout_;
};

}

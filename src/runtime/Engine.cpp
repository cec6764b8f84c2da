#include "runtime/Engine.hpp"
#include "config/Config.hpp"
#include "git/Cli.hpp"

namespace gitsync::runtime {

Engine::Engine(std::unique_ptr<git::VersionControl> vcs, std::unique_ptr<net::Prober> prober,
               const config::Config& cfg)
    : vcs(std::move(vcs)), prober(std::move(prober)) {
    op = std::make_unique<sync::Operator>(*this->vcs, *this->prober, cfg.network_host, cfg.network_port);
}

std::unique_ptr<Engine> makeEngine(const config::Config& cfg) {
    return std::make_unique<Engine>(std::make_unique<git::Cli>(cfg.git),
                                    std::make_unique<net::TcpProber>(std::chrono::milliseconds(cfg.probe_timeout_ms)),
                                    cfg);
}

}

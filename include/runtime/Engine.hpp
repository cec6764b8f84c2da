#pragma once

#include "git/VersionControl.hpp"
#include "net/Prober.hpp"
#include "sync/Operator.hpp"

#include <memory>

namespace gitsync::config { struct Config; }

namespace gitsync::runtime {

// Owns the collaborators an Operator borrows; destroyed together.
struct Engine {
    std::unique_ptr<git::VersionControl> vcs;
    std::unique_ptr<net::Prober> prober;
    std::unique_ptr<sync::Operator> op;

    Engine(std::unique_ptr<git::VersionControl> vcs, std::unique_ptr<net::Prober> prober,
           const config::Config& cfg);
};

// git command line + TCP prober, configured from cfg
std::unique_ptr<Engine> makeEngine(const config::Config& cfg);

}

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace gitsync::net {

struct Endpoint {
    std::string host;
    uint16_t port = 0;
    bool local = false;             // file:// or plain path remote
    std::filesystem::path path;     // only set when local

    [[nodiscard]] std::string str() const;
};

// Host/port a remote URL talks to; falls back to the configured host when there is no remote.
Endpoint endpointFor(const std::optional<std::string>& remote,
                     const std::string& fallbackHost, uint16_t fallbackPort);

}

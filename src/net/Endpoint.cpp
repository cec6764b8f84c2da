#include "net/Endpoint.hpp"

#include <charconv>
#include <string_view>
#include <fmt/core.h>

namespace gitsync::net {

namespace {

std::optional<uint16_t> parsePort(const std::string_view s) {
    if (s.empty()) return std::nullopt;
    unsigned int v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || v == 0 || v > 65535) return std::nullopt;
    return static_cast<uint16_t>(v);
}

uint16_t defaultPortFor(const std::string_view scheme) {
    if (scheme == "https") return 443;
    if (scheme == "http") return 80;
    if (scheme == "ssh" || scheme == "git+ssh" || scheme == "ssh+git") return 22;
    if (scheme == "git") return 9418;
    return 0;
}

// authority = [user@]host[:port], host may be a bracketed IPv6 literal
void splitAuthority(std::string_view authority, Endpoint& ep) {
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) authority.remove_prefix(at + 1);

    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) { ep.host = std::string(authority); return; }
        ep.host = std::string(authority.substr(1, close - 1));
        const auto rest = authority.substr(close + 1);
        if (!rest.empty() && rest.front() == ':')
            if (const auto p = parsePort(rest.substr(1))) ep.port = *p;
        return;
    }

    if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        if (const auto p = parsePort(authority.substr(colon + 1))) {
            ep.port = *p;
            ep.host = std::string(authority.substr(0, colon));
            return;
        }
    }
    ep.host = std::string(authority);
}

}

std::string Endpoint::str() const {
    if (local) return "local:" + path.string();
    if (host.find(':') != std::string::npos) return fmt::format("[{}]:{}", host, port);
    return fmt::format("{}:{}", host, port);
}

Endpoint endpointFor(const std::optional<std::string>& remote,
                     const std::string& fallbackHost, const uint16_t fallbackPort) {
    Endpoint ep;

    if (!remote || remote->empty()) {
        ep.host = fallbackHost;
        ep.port = fallbackPort;
        return ep;
    }

    const std::string_view url = *remote;

    if (const auto sep = url.find("://"); sep != std::string_view::npos) {
        const auto scheme = url.substr(0, sep);
        const auto rest = url.substr(sep + 3);

        if (scheme == "file") {
            ep.local = true;
            ep.path = std::string(rest);
            return ep;
        }

        splitAuthority(rest.substr(0, rest.find('/')), ep);
        if (ep.port == 0) ep.port = defaultPortFor(scheme);
        if (ep.port == 0 || ep.host.empty()) {
            ep.host = fallbackHost;
            ep.port = fallbackPort;
        }
        return ep;
    }

    // scp-like syntax: [user@]host:path; a slash before the first colon means a local path
    const auto colon = url.find(':');
    const auto slash = url.find('/');
    if (colon != std::string_view::npos && (slash == std::string_view::npos || colon < slash) && colon > 0) {
        auto host = url.substr(0, colon);
        if (const auto at = host.rfind('@'); at != std::string_view::npos) host.remove_prefix(at + 1);
        ep.host = std::string(host);
        ep.port = 22;
        return ep;
    }

    ep.local = true;
    ep.path = std::string(url);
    return ep;
}

}

#pragma once

#include <cstdint>
#include <string>

namespace mwscl
{

/**
 * Scheme, host, port and path of an MWS endpoint.
 */
struct URIComponents
{
    std::string scheme = "https";
    std::string host;
    std::uint16_t port = 0u;
    std::string path = "/";

    URIComponents() = default;
    URIComponents(std::string host, std::uint16_t port, std::string path);

    /**
     * Split a `host[:port]` string. Accepts DNS names and IPv4
     * literals.
     *
     * Throws MissingRequired or InvalidParameter, both naming `host`.
     */
    static URIComponents fromHost(std::string const& hostAndPort, std::string path = "/");

    /**
     * Host as it appears in the canonical string: lower-case, no port.
     */
    std::string canonicalHost() const;

    std::string buildHost() const; /* Scheme + host + port */
    std::string build() const; /* Scheme + host + port + path */

    /**
     * Full URI with the given, already encoded, query appended after '?'.
     */
    std::string build(std::string const& encodedQuery) const;
};

}

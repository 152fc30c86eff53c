#include "mwscl/uri.hpp"
#include "mwscl/errors.hpp"
#include "mwscl/log.hpp"

#include <cctype>
#include <utility>

#include "stx/format.h"

namespace mwscl
{

/**
 * Reg-name characters, see https://tools.ietf.org/html/rfc3986#section-3.2.2
 */
static auto isHostChar(int c)
{
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

URIComponents::URIComponents(std::string host, std::uint16_t port, std::string path)
    : host(std::move(host)), port(port), path(std::move(path))
{}

URIComponents URIComponents::fromHost(std::string const& hostAndPort, std::string path)
{
    if (hostAndPort.empty())
        throw logRuntimeError<MissingRequired>("[URIComponents::fromHost] Missing host", "host");

    URIComponents result;
    result.path = std::move(path);

    const auto* c = hostAndPort.c_str();
    while (isHostChar(static_cast<unsigned char>(*c)))
        result.host.push_back(*c++);

    if (result.host.empty())
        throw logRuntimeError<InvalidParameter>(
            stx::format("[URIComponents::fromHost] Error parsing host '{}'", hostAndPort), "host");

    if (*c == ':') {
        ++c;
        if (!std::isdigit(static_cast<unsigned char>(*c)))
            throw logRuntimeError<InvalidParameter>(
                stx::format("[URIComponents::fromHost] Error parsing port of '{}'", hostAndPort), "host");

        unsigned long port = 0;
        while (std::isdigit(static_cast<unsigned char>(*c))) {
            port = port * 10u + static_cast<unsigned long>(*c - '0');
            if (port > 65535u)
                throw logRuntimeError<InvalidParameter>(
                    stx::format("[URIComponents::fromHost] Port out of range in '{}'", hostAndPort), "host");
            ++c;
        }
        result.port = static_cast<std::uint16_t>(port);
    }

    if (*c != '\0')
        throw logRuntimeError<InvalidParameter>(
            stx::format("[URIComponents::fromHost] Unexpected character in host '{}'", hostAndPort), "host");

    return result;
}

std::string URIComponents::canonicalHost() const
{
    std::string result = host;
    for (auto& ch : result)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return result;
}

std::string URIComponents::buildHost() const
{
    if (host.empty())
        throw logRuntimeError<MissingRequired>("[URIComponents::buildHost] Missing host", "host");

    return scheme + "://" +
           host +
           (port > 0 ? std::string(":") + std::to_string(port) : "");
}

std::string URIComponents::build() const
{
    return buildHost() + path;
}

std::string URIComponents::build(std::string const& encodedQuery) const
{
    if (encodedQuery.empty())
        return build();
    return build() + "?" + encodedQuery;
}

}

#pragma once

#include <optional>
#include <string>

#include "mwscl/query.hpp"
#include "mwscl/secret.hpp"

namespace mwscl
{

/**
 * Endpoint and merchant profile of an MWS account, e.g.:
 *
 *   host: mws-eu.amazonservices.com
 *   uri: /Orders/2013-09-01
 *   version: 2013-09-01
 *   verb: POST
 *   seller-id: A1B2C3
 *   mws-auth-token: amzn.mws.xxxx
 *   access-key-id: AKIA...
 *   secret-access-key: ...
 *
 * Every key is optional.
 */
struct Config
{
    Config() = default;

    /**
     * Parse a YAML profile.
     *
     * Throws ConfigError.
     */
    Config(std::string const& yamlConf);

    /**
     * Read a YAML profile from the given file.
     *
     * Throws ConfigError.
     */
    static Config fromFile(std::string const& path);

    std::optional<Verb> verb;
    std::optional<std::string> host;
    std::optional<std::string> uri;
    std::optional<std::string> version;
    std::optional<std::string> sellerId;
    std::optional<std::string> mwsAuthToken;
    std::optional<std::string> accessKeyId;
    std::optional<Secret> secretAccessKey;

    /**
     * Merge this configuration with another. Values set in
     * other take precedence.
     */
    Config& operator |= (Config const& other);

    /**
     * Copy all values which are set onto the request options.
     */
    void apply(RequestOptions& options) const;

    /**
     * Convert this configuration to a YAML string, which may
     * be passed to the respective `Config(yamlConf)` constructor.
     */
    std::string toYaml() const;

    /**
     * Human-readable summary for logging, with the secret access key
     * and the auth token masked.
     */
    std::string toSafeString() const;
};

}

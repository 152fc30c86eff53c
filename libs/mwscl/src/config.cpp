#include "mwscl/config.hpp"
#include "mwscl/errors.hpp"
#include "mwscl/log.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <filesystem>

#include "stx/format.h"

using namespace mwscl;

namespace
{

std::optional<std::string> readString(YAML::Node const& node, char const* key)
{
    auto entry = node[key];
    if (!entry)
        return {};
    if (!entry.IsScalar())
        throw logRuntimeError<ConfigError>(
            stx::format("[Config] Value of '{}' must be a scalar", key), key);
    return entry.as<std::string>();
}

Verb parseVerb(std::string value)
{
    for (auto& ch : value)
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));

    if (value == "GET")
        return Verb::GET;
    if (value == "POST")
        return Verb::POST;

    throw logRuntimeError<ConfigError>(
        stx::format("[Config] Unsupported verb '{}', expected GET or POST", value), "verb");
}

Config configFromNode(YAML::Node const& node)
{
    Config conf;

    if (!node || node.IsNull())
        return conf;

    if (!node.IsMap())
        throw logRuntimeError<ConfigError>("[Config] Expected a YAML map", "document");

    if (auto verb = readString(node, "verb"))
        conf.verb = parseVerb(*verb);

    conf.host = readString(node, "host");
    conf.uri = readString(node, "uri");
    conf.version = readString(node, "version");
    conf.sellerId = readString(node, "seller-id");
    conf.mwsAuthToken = readString(node, "mws-auth-token");
    conf.accessKeyId = readString(node, "access-key-id");

    if (auto secret = readString(node, "secret-access-key"))
        conf.secretAccessKey = Secret(*secret);

    return conf;
}

YAML::Node configToNode(Config const& config, bool maskSecrets)
{
    YAML::Node result(YAML::NodeType::Map);

    if (config.verb)
        result["verb"] = verbName(*config.verb);
    if (config.host)
        result["host"] = *config.host;
    if (config.uri)
        result["uri"] = *config.uri;
    if (config.version)
        result["version"] = *config.version;
    if (config.sellerId)
        result["seller-id"] = *config.sellerId;
    if (config.mwsAuthToken)
        result["mws-auth-token"] = maskSecrets ? Secret(*config.mwsAuthToken).masked() : *config.mwsAuthToken;
    if (config.accessKeyId)
        result["access-key-id"] = *config.accessKeyId;
    if (config.secretAccessKey)
        result["secret-access-key"] = maskSecrets
            ? config.secretAccessKey->masked()
            : config.secretAccessKey->reveal();

    return result;
}

}

Config::Config(const std::string& yamlConf)
{
    YAML::Node parsedYaml;
    try {
        parsedYaml = YAML::Load(yamlConf);
    }
    catch (const YAML::Exception& e) {
        throw logRuntimeError<ConfigError>(
            stx::format("[Config] Failed to parse YAML: {}", e.what()), "document");
    }
    *this = configFromNode(parsedYaml);
}

Config Config::fromFile(std::string const& path)
{
    if (!std::filesystem::is_regular_file(path))
        throw logRuntimeError<ConfigError>(
            stx::format("[Config] The path '{}' is not a file", path), "path");

    log().debug("Loading MWS profile from '{}'...", path);
    YAML::Node document;
    try {
        document = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e) {
        throw logRuntimeError<ConfigError>(
            stx::format("[Config] Failed to parse '{}': {}", path, e.what()), "path");
    }

    auto result = configFromNode(document);
    log().debug("  ...Done: {}", result.toSafeString());
    return result;
}

Config& Config::operator |= (Config const& other)
{
    if (other.verb)
        verb = other.verb;
    if (other.host)
        host = other.host;
    if (other.uri)
        uri = other.uri;
    if (other.version)
        version = other.version;
    if (other.sellerId)
        sellerId = other.sellerId;
    if (other.mwsAuthToken)
        mwsAuthToken = other.mwsAuthToken;
    if (other.accessKeyId)
        accessKeyId = other.accessKeyId;
    if (other.secretAccessKey)
        secretAccessKey = other.secretAccessKey;
    return *this;
}

void Config::apply(RequestOptions& options) const
{
    if (verb)
        options.verb = *verb;
    if (host)
        options.host = *host;
    if (uri)
        options.uri = *uri;
    if (version)
        options.version = *version;
    if (sellerId)
        options.sellerId = *sellerId;
    if (mwsAuthToken)
        options.mwsAuthToken = *mwsAuthToken;
    if (accessKeyId)
        options.accessKeyId = *accessKeyId;
    if (secretAccessKey)
        options.secretAccessKey = *secretAccessKey;
}

std::string Config::toYaml() const
{
    return YAML::Dump(configToNode(*this, false));
}

std::string Config::toSafeString() const
{
    YAML::Emitter out;
    out << YAML::Flow << configToNode(*this, true);
    return out.c_str();
}

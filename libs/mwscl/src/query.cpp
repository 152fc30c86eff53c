#include "mwscl/query.hpp"
#include "mwscl/encoding.hpp"
#include "mwscl/errors.hpp"
#include "mwscl/log.hpp"

#include <array>
#include <utility>
#include <vector>

#include "stx/format.h"
#include "stx/string.h"

namespace mwscl
{

namespace
{

/**
 * Keys set by Query itself, which extra parameters must not override.
 */
const std::array<char const*, 9> RESERVED_KEYS = {
    "AWSAccessKeyId",
    "Action",
    "MWSAuthToken",
    "SellerId",
    "Signature",
    "SignatureMethod",
    "SignatureVersion",
    "Timestamp",
    "Version"
};

void requireValue(std::string const& value, char const* field)
{
    if (value.empty())
        throw logRuntimeError<MissingRequired>(
            stx::format("[Query] Missing required value '{}'", field), field);
}

std::string joinQuery(NormalizedParams const& params)
{
    std::vector<std::string> pairs;
    pairs.reserve(params.size());

    for (auto const& [key, value] : params)
        pairs.push_back(percentEncode(key) + "=" + percentEncode(value));

    return stx::join(pairs.begin(), pairs.end(), "&");
}

}

std::string verbName(Verb verb)
{
    switch (verb) {
    case Verb::GET:
        return "GET";
    case Verb::POST:
        return "POST";
    }
    return {};
}

Query::Query(RequestOptions options)
    : verb_(options.verb),
      accessKeyId_(std::move(options.accessKeyId)),
      secretAccessKey_(std::move(options.secretAccessKey)),
      action_(std::move(options.action)),
      sellerId_(std::move(options.sellerId)),
      version_(std::move(options.version)),
      timestamp_(options.timestamp ? *options.timestamp : Timestamp::now())
{
    if (accessKeyId_.empty())
        throw logRuntimeError<MissingCredential>(
            "[Query] Missing credential 'access_key_id'", "access_key_id");
    if (secretAccessKey_.empty())
        throw logRuntimeError<MissingCredential>(
            "[Query] Missing credential 'secret_access_key'", "secret_access_key");

    requireValue(action_, "action");
    requireValue(sellerId_, "seller_id");
    requireValue(version_, "version");
    requireValue(options.host, "host");
    requireValue(options.uri, "uri");

    if (options.uri.front() != '/')
        throw logRuntimeError<InvalidUriPath>(
            stx::format("[Query] The uri '{}' must start with '/'", options.uri), "uri");
    if (options.uri.find_first_of("?#") != std::string::npos)
        throw logRuntimeError<InvalidUriPath>(
            stx::format("[Query] The uri '{}' must not contain a query or fragment", options.uri), "uri");

    endpoint_ = URIComponents::fromHost(options.host, std::move(options.uri));

    if (options.mwsAuthToken && !options.mwsAuthToken->empty())
        mwsAuthToken_ = std::move(options.mwsAuthToken);

    params_ = normalizeParams(options.params, options.lists);
    for (auto const& reserved : RESERVED_KEYS) {
        if (params_.count(reserved))
            throw logRuntimeError<InvalidParameter>(
                stx::format("[Query] Parameter '{}' is set by the request itself", reserved), reserved);
    }

    params_.emplace("AWSAccessKeyId", accessKeyId_);
    params_.emplace("Action", action_);
    params_.emplace("SellerId", sellerId_);
    params_.emplace("SignatureMethod", SIGNATURE_METHOD);
    params_.emplace("SignatureVersion", stx::to_string(SIGNATURE_VERSION));
    params_.emplace("Timestamp", timestamp_.iso8601());
    params_.emplace("Version", version_);
    if (mwsAuthToken_)
        params_.emplace("MWSAuthToken", *mwsAuthToken_);

    log().debug("[Query] {} {}{} action={} ({} parameters)",
                verbName(verb_), endpoint_.host, endpoint_.path, action_, params_.size());
}

std::string Query::canonical() const
{
    auto result = verbName(verb_) + "\n" +
        endpoint_.canonicalHost() + "\n" +
        endpoint_.path + "\n" +
        buildQuery();

    log().trace("[Query] Canonical string:\n{}", result);
    return result;
}

std::string Query::buildQuery() const
{
    return joinQuery(params_);
}

std::string Query::buildQuery(std::string const& signature) const
{
    auto signedParams = params_;
    signedParams.emplace("Signature", signature);
    return joinQuery(signedParams);
}

std::string Query::signature() const
{
    return base64Encode(hmacSha256(secretAccessKey_.reveal(), canonical()));
}

std::string Query::requestUri() const
{
    return endpoint_.build(buildQuery(signature()));
}

std::string Query::endpointUri() const
{
    return endpoint_.build();
}

std::string Query::requestBody() const
{
    return buildQuery(signature());
}

}
